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
#include <bitcoin/tracker/utility/outcome_cache.hpp>

#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/outcome.hpp>

namespace libbitcoin {
namespace tracker {

using namespace system;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

bool outcome_cache::empty() const NOEXCEPT
{
    return is_zero(size_);
}

size_t outcome_cache::size() const NOEXCEPT
{
    return size_;
}

bool outcome_cache::contains(const block_id& block,
    const tx_id& tx) const NOEXCEPT
{
    const auto it = blocks_.find(block);
    return it != blocks_.end() && it->second.contains(tx);
}

bool outcome_cache::find(outcome& out, const block_id& block,
    const tx_id& tx) const NOEXCEPT
{
    const auto it = blocks_.find(block);
    if (it == blocks_.end())
        return false;

    const auto entry = it->second.find(tx);
    if (entry == it->second.end())
        return false;

    out = entry->second;
    return true;
}

bool outcome_cache::emplace(const block_id& block, const tx_id& tx,
    const outcome& value) NOEXCEPT
{
    if (!blocks_[block].emplace(tx, value).second)
        return false;

    ++size_;
    return true;
}

bool outcome_cache::erase(const block_id& block, const tx_id& tx) NOEXCEPT
{
    const auto it = blocks_.find(block);
    if (it == blocks_.end() || is_zero(it->second.erase(tx)))
        return false;

    // Drop the emptied block entry.
    if (it->second.empty())
        blocks_.erase(it);

    --size_;
    return true;
}

size_t outcome_cache::erase(const block_id& block) NOEXCEPT
{
    const auto it = blocks_.find(block);
    if (it == blocks_.end())
        return zero;

    const auto count = it->second.size();
    blocks_.erase(it);
    size_ -= count;
    return count;
}

BC_POP_WARNING()

} // namespace tracker
} // namespace libbitcoin
