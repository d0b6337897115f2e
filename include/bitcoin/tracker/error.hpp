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
#ifndef LIBBITCOIN_TRACKER_ERROR_HPP
#define LIBBITCOIN_TRACKER_ERROR_HPP

#include <bitcoin/system.hpp>
#include <bitcoin/tracker/version.hpp>

namespace libbitcoin {
namespace tracker {

/// Alias system code.
/// std::error_code "tracker" category holds tracker::error::error_t.
typedef std::error_code code;

namespace error {

/// Input conditions are reported and otherwise ignored.
/// Faults indicate a state tracking defect and are terminal.
enum error_t : uint8_t
{
    /// general
    success,

    /// input
    unknown_event,
    unknown_block,
    duplicate_block,
    duplicate_transaction,

    /// state
    tracker_faulted,

    /// faults (terminal, code error assumed)
    settle1,
    settle2,
    settle3,
    finalize1,
    finalize2,
    finalize3,
    finalize4,
    prune1,
    prune2
};

// No current need for error_code equivalence mapping.
DECLARE_ERROR_T_CODE_CATEGORY(error);

} // namespace error
} // namespace tracker
} // namespace libbitcoin

DECLARE_STD_ERROR_REGISTRATION(bc::tracker::error::error)

#endif
