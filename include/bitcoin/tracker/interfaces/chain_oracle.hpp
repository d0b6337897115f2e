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
#ifndef LIBBITCOIN_TRACKER_INTERFACES_CHAIN_ORACLE_HPP
#define LIBBITCOIN_TRACKER_INTERFACES_CHAIN_ORACLE_HPP

#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

/// Abstract synchronous read-only view of the chain, plus the block store
/// unpin hint. Implementations must not throw and must be consistent:
/// validity and success of a transaction within a block never change.
class BCT_API chain_oracle
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(chain_oracle);
    chain_oracle() = default;

    /// Ordered transaction identifiers of the block body.
    virtual tx_ids get_body(const block_id& block_hash) NOEXCEPT = 0;

    /// Transaction is valid within the block.
    virtual bool is_valid(const block_id& block_hash,
        const tx_id& tx) NOEXCEPT = 0;

    /// Transaction is successful within the block (only when valid).
    virtual bool is_successful(const block_id& block_hash,
        const tx_id& tx) NOEXCEPT = 0;

    /// The blocks are no longer required by the tracker (hint).
    virtual void unpin(const block_set& block_hashes) NOEXCEPT = 0;
};

} // namespace tracker
} // namespace libbitcoin

#endif
