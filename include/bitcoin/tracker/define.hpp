/**
 * Copyright (c) 2011-2025 libbitcoin developers (see AUTHORS)
 *
 * This file is part of libbitcoin.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#ifndef LIBBITCOIN_TRACKER_DEFINE_HPP
#define LIBBITCOIN_TRACKER_DEFINE_HPP

/// Standard includes (do not include directly).
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>

/// Pulls in common /tracker headers (excluding settings/config/parser).
#include <bitcoin/tracker/events.hpp>

/// Now we use the generic helper definitions above to define BCT_API
/// and BCT_INTERNAL. BCT_API is used for the public API symbols. It either DLL
/// imports or DLL exports (or does nothing for static build) BCT_INTERNAL is
/// used for non-api symbols.
#if defined BCT_STATIC
    #define BCT_API
    #define BCT_INTERNAL
#elif defined BCT_DLL
    #define BCT_API      BC_HELPER_DLL_EXPORT
    #define BCT_INTERNAL BC_HELPER_DLL_LOCAL
#else
    #define BCT_API      BC_HELPER_DLL_IMPORT
    #define BCT_INTERNAL BC_HELPER_DLL_LOCAL
#endif

/// For common types below.
#include <bitcoin/network.hpp>

namespace libbitcoin {
namespace tracker {

/// Alias system code.
typedef std::error_code code;

/// Identifiers are opaque to the tracker.
using block_id = std::string;
using tx_id = std::string;

/// Ordered identifier lists (block body, ancestry, arrival order).
using tx_ids = system::string_list;
using block_ids = system::string_list;

/// Unpin batches are sets, ordered for deterministic reporting.
using block_set = std::set<block_id>;

} // namespace tracker
} // namespace libbitcoin

#endif

// define.hpp is the common include for /tracker.
// All non-tracker headers include define.hpp.
// Tracker inclusions are chained as follows.

// version        : <generated>
// error          : version
// events         : error
// define         : events

// Other directory common includes are not internally chained.
// Each header includes only its required common headers.

// outcome        : define
// chain_event    : define
// settings       : define
// configuration  : define settings
// parser         : define configuration
// logging        : define settings
// /interfaces    : define outcome
// /utility       : define outcome
// transaction_tracker : define configuration /interfaces /utility
