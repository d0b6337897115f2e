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
#include <bitcoin/tracker/utility/arrival_queue.hpp>

#include <algorithm>
#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

bool arrival_queue::empty() const NOEXCEPT
{
    return order_.empty();
}

size_t arrival_queue::size() const NOEXCEPT
{
    return order_.size();
}

bool arrival_queue::contains(const tx_id& tx) const NOEXCEPT
{
    return index_.contains(tx);
}

bool arrival_queue::enqueue(const tx_id& tx) NOEXCEPT
{
    if (!index_.emplace(tx, next_).second)
        return false;

    order_.emplace(next_++, tx);
    return true;
}

bool arrival_queue::dequeue(const tx_id& tx) NOEXCEPT
{
    const auto it = index_.find(tx);
    if (it == index_.end())
        return false;

    order_.erase(it->second);
    index_.erase(it);
    return true;
}

bool arrival_queue::sort(tx_ids& txs) const NOEXCEPT
{
    std::vector<std::pair<sequence, tx_id>> keyed{};
    keyed.reserve(txs.size());

    for (const auto& tx: txs)
    {
        const auto it = index_.find(tx);
        if (it == index_.end())
            return false;

        keyed.emplace_back(it->second, tx);
    }

    std::sort(keyed.begin(), keyed.end());

    txs.clear();
    for (auto& entry: keyed)
        txs.push_back(std::move(entry.second));

    return true;
}

tx_ids arrival_queue::ordered() const NOEXCEPT
{
    tx_ids out{};
    out.reserve(order_.size());
    for (const auto& entry: order_)
        out.push_back(entry.second);

    return out;
}

BC_POP_WARNING()

} // namespace tracker
} // namespace libbitcoin
