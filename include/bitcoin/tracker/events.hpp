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
#ifndef LIBBITCOIN_TRACKER_EVENTS_HPP
#define LIBBITCOIN_TRACKER_EVENTS_HPP

#include <bitcoin/system.hpp>
#include <bitcoin/tracker/error.hpp>

namespace libbitcoin {
namespace tracker {

/// Reporting events.
enum events : uint8_t
{
    /// Blocks.
    block_archived,      // block recorded in the tree (height)
    block_finalized,     // finalization applied (height)
    blocks_unpinned,     // blocks released to the store (count)

    /// Transactions.
    tx_submitted,        // transaction pending (queue size)
    tx_settled,          // transaction settled valid (queue size)
    tx_invalidated,      // transaction settled invalid (queue size)
    tx_done              // transactions done by one finalization (count)
};

} // namespace tracker
} // namespace libbitcoin

#endif
