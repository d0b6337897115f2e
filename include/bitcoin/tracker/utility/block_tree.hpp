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
#ifndef LIBBITCOIN_TRACKER_UTILITY_BLOCK_TREE_HPP
#define LIBBITCOIN_TRACKER_UTILITY_BLOCK_TREE_HPP

#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

/// Not thread safe.
/// Parent links and heights of pinned blocks. A block is linked to its
/// announced parent once both are in the tree, in either arrival order, and
/// its height is then one above the parent's. An unlinked block is a root at
/// height zero. A link that would close a cycle is not made, and a pruned
/// root is never relinked.
class BCT_API block_tree
{
public:
    /// The tree contains no blocks.
    bool empty() const NOEXCEPT;

    /// The number of blocks in the tree (pinned).
    size_t size() const NOEXCEPT;

    /// The block is in the tree.
    bool contains(const block_id& block) const NOEXCEPT;

    /// Add a block, false if it already exists (not updated). Blocks already
    /// in the tree that announced this block as parent are linked to it.
    bool insert(const block_id& block, const block_id& parent) NOEXCEPT;

    /// Get the height of the block above its root, false if not found.
    bool get_height(size_t& out, const block_id& block) const NOEXCEPT;

    /// Get the announced parent of the block, false if not found.
    bool get_parent(block_id& out, const block_id& block) const NOEXCEPT;

    /// The block is in the tree and linked to its parent.
    bool is_linked(const block_id& block) const NOEXCEPT;

    /// Populate the block and its ancestors in descending height order,
    /// ending at the first unlinked block. Empty for an unknown block.
    /// False if the walk exceeds limit blocks.
    bool get_ancestry(block_ids& out, const block_id& block,
        size_t limit) const NOEXCEPT;

    /// The block is the ancestor or one of its descendants.
    bool is_descendant(const block_id& block,
        const block_id& ancestor) const NOEXCEPT;

    /// Remove all blocks other than the root and its descendants, and unlink
    /// the root. Returns the removed blocks, empty if root is not in the tree.
    block_set prune(const block_id& root) NOEXCEPT;

private:
    struct node
    {
        block_id parent;
        size_t height;
        bool linked;
    };

    using nodes = std::unordered_map<block_id, node>;
    using children = std::unordered_map<block_id, block_set>;

    void adopt(const block_id& parent) NOEXCEPT;
    void rebase(const block_id& block) NOEXCEPT;
    void forget(const block_id& parent, const block_id& child) NOEXCEPT;

    nodes nodes_{};

    // Blocks by announced parent, whether or not the parent is in the tree.
    children children_{};
};

} // namespace tracker
} // namespace libbitcoin

#endif
