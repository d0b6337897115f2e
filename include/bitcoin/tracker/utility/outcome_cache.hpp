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
#ifndef LIBBITCOIN_TRACKER_UTILITY_OUTCOME_CACHE_HPP
#define LIBBITCOIN_TRACKER_UTILITY_OUTCOME_CACHE_HPP

#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/outcome.hpp>

namespace libbitcoin {
namespace tracker {

/// Not thread safe.
/// Outcomes keyed by (block, transaction). An entry is written once and is
/// authoritative thereafter, it is never overwritten.
class BCT_API outcome_cache
{
public:
    /// The cache contains no entries.
    bool empty() const NOEXCEPT;

    /// The number of (block, transaction) entries.
    size_t size() const NOEXCEPT;

    /// The (block, transaction) outcome is cached.
    bool contains(const block_id& block, const tx_id& tx) const NOEXCEPT;

    /// Get the cached outcome, false if not cached.
    bool find(outcome& out, const block_id& block,
        const tx_id& tx) const NOEXCEPT;

    /// Cache the outcome, false if already cached (not overwritten).
    bool emplace(const block_id& block, const tx_id& tx,
        const outcome& value) NOEXCEPT;

    /// Evict one entry, false if not cached.
    bool erase(const block_id& block, const tx_id& tx) NOEXCEPT;

    /// Evict all entries of the block, returns the number evicted.
    size_t erase(const block_id& block) NOEXCEPT;

private:
    using outcomes = std::unordered_map<tx_id, outcome>;

    std::unordered_map<block_id, outcomes> blocks_{};
    size_t size_{};
};

} // namespace tracker
} // namespace libbitcoin

#endif
