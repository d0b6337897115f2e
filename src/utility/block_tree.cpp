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
#include <bitcoin/tracker/utility/block_tree.hpp>

#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

using namespace system;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

bool block_tree::empty() const NOEXCEPT
{
    return nodes_.empty();
}

size_t block_tree::size() const NOEXCEPT
{
    return nodes_.size();
}

bool block_tree::contains(const block_id& block) const NOEXCEPT
{
    return nodes_.contains(block);
}

bool block_tree::insert(const block_id& block, const block_id& parent) NOEXCEPT
{
    if (contains(block))
        return false;

    const auto it = nodes_.find(parent);
    const auto linked = (it != nodes_.end());
    const auto height = linked ? add1(it->second.height) : zero;
    nodes_.emplace(block, node{ parent, height, linked });
    children_[parent].insert(block);
    adopt(block);
    return true;
}

// Link roots that announced the parent before it arrived.
void block_tree::adopt(const block_id& parent) NOEXCEPT
{
    const auto it = children_.find(parent);
    if (it == children_.end())
        return;

    for (const auto& child: it->second)
    {
        auto& node = nodes_.at(child);
        if (node.linked)
            continue;

        // The parent descends from the child, a link would close a cycle.
        if (is_descendant(parent, child))
            continue;

        node.linked = true;
        rebase(child);
    }
}

// Recompute heights of the linked block and its linked descendants.
void block_tree::rebase(const block_id& block) NOEXCEPT
{
    block_ids pending{ block };
    while (!pending.empty())
    {
        const auto current = pending.back();
        pending.pop_back();

        auto& node = nodes_.at(current);
        node.height = add1(nodes_.at(node.parent).height);

        const auto it = children_.find(current);
        if (it == children_.end())
            continue;

        for (const auto& child: it->second)
            if (nodes_.at(child).linked)
                pending.push_back(child);
    }
}

void block_tree::forget(const block_id& parent, const block_id& child) NOEXCEPT
{
    const auto it = children_.find(parent);
    if (it == children_.end())
        return;

    it->second.erase(child);
    if (it->second.empty())
        children_.erase(it);
}

bool block_tree::get_height(size_t& out, const block_id& block) const NOEXCEPT
{
    const auto it = nodes_.find(block);
    if (it == nodes_.end())
        return false;

    out = it->second.height;
    return true;
}

bool block_tree::get_parent(block_id& out, const block_id& block) const NOEXCEPT
{
    const auto it = nodes_.find(block);
    if (it == nodes_.end())
        return false;

    out = it->second.parent;
    return true;
}

bool block_tree::is_linked(const block_id& block) const NOEXCEPT
{
    const auto it = nodes_.find(block);
    return it != nodes_.end() && it->second.linked;
}

bool block_tree::get_ancestry(block_ids& out, const block_id& block,
    size_t limit) const NOEXCEPT
{
    out.clear();
    auto it = nodes_.find(block);

    // Linked parents are in the tree, so each step resolves.
    while (it != nodes_.end())
    {
        if (out.size() >= limit)
            return false;

        out.push_back(it->first);
        if (!it->second.linked)
            break;

        it = nodes_.find(it->second.parent);
    }

    return true;
}

// Heights strictly decrease toward the root, so the walk stops at the
// ancestor's height.
bool block_tree::is_descendant(const block_id& block,
    const block_id& ancestor) const NOEXCEPT
{
    size_t floor{};
    if (!get_height(floor, ancestor))
        return false;

    auto it = nodes_.find(block);
    while (it != nodes_.end() && it->second.height > floor &&
        it->second.linked)
    {
        it = nodes_.find(it->second.parent);
    }

    return it != nodes_.end() && it->first == ancestor;
}

block_set block_tree::prune(const block_id& root) NOEXCEPT
{
    block_set removed{};
    if (!contains(root))
        return removed;

    for (const auto& item: nodes_)
        if (!is_descendant(item.first, root))
            removed.insert(item.first);

    for (const auto& block: removed)
    {
        forget(nodes_.at(block).parent, block);
        children_.erase(block);
        nodes_.erase(block);
    }

    // The root's ancestry is released, making it a root. It is no longer a
    // child, so a later announcement of its parent does not relink it.
    auto& node = nodes_.at(root);
    forget(node.parent, root);
    node.linked = false;
    return removed;
}

BC_POP_WARNING()

} // namespace tracker
} // namespace libbitcoin
