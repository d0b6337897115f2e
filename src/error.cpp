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
#include <bitcoin/tracker/error.hpp>

#include <bitcoin/system.hpp>

namespace libbitcoin {
namespace tracker {
namespace error {

DEFINE_ERROR_T_MESSAGE_MAP(error)
{
    // general
    { success, "success" },

    // input
    { unknown_event, "unknown event" },
    { unknown_block, "unknown block" },
    { duplicate_block, "duplicate block" },
    { duplicate_transaction, "duplicate transaction" },

    // state
    { tracker_faulted, "tracker faulted" },

    /// faults
    { settle1, "settle1" },
    { settle2, "settle2" },
    { settle3, "settle3" },
    { finalize1, "finalize1" },
    { finalize2, "finalize2" },
    { finalize3, "finalize3" },
    { finalize4, "finalize4" },
    { prune1, "prune1" },
    { prune2, "prune2" }
};

DEFINE_ERROR_T_CATEGORY(error, "tracker", "tracker code")

} // namespace error
} // namespace tracker
} // namespace libbitcoin
