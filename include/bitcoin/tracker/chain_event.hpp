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
#ifndef LIBBITCOIN_TRACKER_CHAIN_EVENT_HPP
#define LIBBITCOIN_TRACKER_CHAIN_EVENT_HPP

#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

/// A block has been announced (settles the transactions of its body).
struct new_block
{
    block_id block_hash;
    block_id parent_hash;
};

/// A transaction has been submitted.
struct new_transaction
{
    tx_id value;
};

/// A block (and implicitly all of its ancestors) has been finalized.
struct finalized
{
    block_id block_hash;
};

/// An event of unrecognized kind (ignored).
struct unknown_event
{
    std::string type;
};

/// Inbound events from the event source.
using chain_event = std::variant
<
    new_block,
    new_transaction,
    finalized,
    unknown_event
>;

} // namespace tracker
} // namespace libbitcoin

#endif
