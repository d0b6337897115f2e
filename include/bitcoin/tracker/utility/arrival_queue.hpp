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
#ifndef LIBBITCOIN_TRACKER_UTILITY_ARRIVAL_QUEUE_HPP
#define LIBBITCOIN_TRACKER_UTILITY_ARRIVAL_QUEUE_HPP

#include <map>
#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

/// Not thread safe.
/// First-seen order of transaction identifiers. Entries may be removed out
/// of order, the relative order of the remainder is preserved.
class BCT_API arrival_queue
{
public:
    /// The queue contains no entries.
    bool empty() const NOEXCEPT;

    /// The number of entries in the queue.
    size_t size() const NOEXCEPT;

    /// The transaction is in the queue.
    bool contains(const tx_id& tx) const NOEXCEPT;

    /// Enqueue the transaction at back, false if already queued.
    bool enqueue(const tx_id& tx) NOEXCEPT;

    /// Remove the transaction, false if not queued.
    bool dequeue(const tx_id& tx) NOEXCEPT;

    /// Sort the transactions into arrival order, false if any is not queued
    /// (in which case the list is unchanged).
    bool sort(tx_ids& txs) const NOEXCEPT;

    /// All queued transactions in arrival order.
    tx_ids ordered() const NOEXCEPT;

private:
    using sequence = uint64_t;

    std::map<sequence, tx_id> order_{};
    std::unordered_map<tx_id, sequence> index_{};
    sequence next_{};
};

} // namespace tracker
} // namespace libbitcoin

#endif
