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
#include <bitcoin/tracker/transaction_tracker.hpp>

#include <algorithm>
#include <bitcoin/network.hpp>
#include <bitcoin/tracker/chain_event.hpp>
#include <bitcoin/tracker/configuration.hpp>
#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/interfaces/interfaces.hpp>
#include <bitcoin/tracker/outcome.hpp>

namespace libbitcoin {
namespace tracker {

using namespace network;
using namespace system;

namespace {

template <class... Handlers>
struct overloaded : Handlers...
{
    using Handlers::operator()...;
};

template <class... Handlers>
overloaded(Handlers...) -> overloaded<Handlers...>;

} // namespace

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

transaction_tracker::transaction_tracker(chain_oracle& oracle,
    notification_sink& sink, const configuration& config,
    const logger& log) NOEXCEPT
  : reporter(log),
    oracle_(oracle),
    sink_(sink),
    config_(config)
{
}

// Dispatch.
// ----------------------------------------------------------------------------

// An unhandled event alternative does not compile.
code transaction_tracker::handle(const chain_event& event) NOEXCEPT
{
    if (fault_)
        return error::tracker_faulted;

    return std::visit(overloaded
    {
        [this](const new_block& value) NOEXCEPT
        {
            return do_new_block(value);
        },
        [this](const new_transaction& value) NOEXCEPT
        {
            return do_new_transaction(value);
        },
        [this](const finalized& value) NOEXCEPT
        {
            return do_finalized(value);
        },
        [this](const unknown_event& value) NOEXCEPT
        {
            return do_unknown(value);
        }
    }, event);
}

// Settlement.
// ----------------------------------------------------------------------------

code transaction_tracker::do_new_block(const new_block& event) NOEXCEPT
{
    const auto& block = event.block_hash;
    if (!tree_.insert(block, event.parent_hash))
    {
        LOGV("Duplicate block [" << block << "] ignored.");
        return error::duplicate_block;
    }

    size_t height{};
    if (!tree_.get_height(height, block))
        return fault(error::settle1);

    if (!tree_.is_linked(block))
    {
        LOGV("Block [" << block << "] parent [" << event.parent_hash
            << "] not pinned, rooted.");
    }

    LOGV("Block archived [" << block << ":" << height << "].");
    fire(events::block_archived, height);

    // First settlement wins, later inclusions are not notified.
    for (const auto& tx: oracle_.get_body(block))
    {
        if (done_.contains(tx) || abandoned_.contains(tx))
            continue;

        auto it = records_.find(tx);
        if (it == records_.end())
        {
            // Arriving and settling together.
            if (!queue_.enqueue(tx))
                return fault(error::settle2);

            it = records_.emplace(tx, record{ tx_state::pending, {} }).first;
            ++pending_;
        }
        else if (it->second.state == tx_state::settled)
        {
            continue;
        }
        else if (!queue_.contains(tx))
        {
            return fault(error::settle3);
        }

        const auto result = query_outcome(block, tx);
        it->second = { tx_state::settled, block };
        settlements_[block].push_back(tx);
        --pending_;

        LOGV("Transaction settled [" << tx << "] " << result);
        fire(result.is_valid() ? events::tx_settled : events::tx_invalidated,
            queue_.size());

        sink_.on_tx_settled(tx, result);
    }

    return error::success;
}

// Validity and success are queried at most once per (block, tx).
outcome transaction_tracker::query_outcome(const block_id& block,
    const tx_id& tx) NOEXCEPT
{
    outcome result{};
    if (cache_.find(result, block, tx))
        return result;

    result = oracle_.is_valid(block, tx) ?
        outcome::valid(block, oracle_.is_successful(block, tx)) :
        outcome::invalid(block);

    cache_.emplace(block, tx, result);
    return result;
}

// Submission.
// ----------------------------------------------------------------------------

code transaction_tracker::do_new_transaction(
    const new_transaction& event) NOEXCEPT
{
    const auto& tx = event.value;
    if (done_.contains(tx) || abandoned_.contains(tx) ||
        records_.contains(tx))
    {
        LOGV("Duplicate transaction [" << tx << "] ignored.");
        return error::duplicate_transaction;
    }

    if (!queue_.enqueue(tx))
        return fault(error::settle2);

    records_.emplace(tx, record{ tx_state::pending, {} });
    ++pending_;

    LOGV("Transaction submitted [" << tx << "].");
    fire(events::tx_submitted, queue_.size());
    return error::success;
}

// Finalization.
// ----------------------------------------------------------------------------

code transaction_tracker::do_finalized(const finalized& event) NOEXCEPT
{
    const auto& block = event.block_hash;
    if (!tree_.contains(block))
    {
        LOGV("Finalized block [" << block << "] not pinned, ignored.");
        return error::unknown_block;
    }

    // A walk longer than the tree implies a cycle.
    size_t height{};
    block_ids ancestry{};
    if (!tree_.get_height(height, block) ||
        !tree_.get_ancestry(ancestry, block, tree_.size()))
        return fault(error::finalize1);

    // Collect transactions settled in the finalized ancestry.
    tx_ids batch{};
    for (const auto& ancestor: ancestry)
    {
        const auto it = settlements_.find(ancestor);
        if (it == settlements_.end())
            continue;

        batch.insert(batch.end(), it->second.begin(), it->second.end());
        settlements_.erase(it);
    }

    // Done notifications follow arrival order, not block order.
    if (!queue_.sort(batch))
        return fault(error::finalize2);

    if (const auto ec = complete(batch))
        return ec;

    finalized_ = block;

    LOGV("Block finalized [" << block << ":" << height << "] completed ["
        << batch.size() << "] of [" << ancestry.size() << "] blocks.");
    fire(events::block_finalized, height);
    fire(events::tx_done, batch.size());

    if (!config_.tracker.prune)
        return error::success;

    return do_prune(block, ancestry);
}

code transaction_tracker::complete(const tx_ids& batch) NOEXCEPT
{
    for (const auto& tx: batch)
    {
        const auto it = records_.find(tx);
        if (it == records_.end() || it->second.state != tx_state::settled)
            return fault(error::finalize3);

        // Done reuses the settlement outcome.
        outcome result{};
        const auto block = it->second.block;
        if (!cache_.find(result, block, tx))
            return fault(error::finalize4);

        // Only the identifier is retained once done.
        records_.erase(it);
        cache_.erase(block, tx);
        queue_.dequeue(tx);
        done_.insert(tx);

        LOGV("Transaction done [" << tx << "] " << result);
        sink_.on_tx_done(tx, result);
    }

    return error::success;
}

// Pruning.
// ----------------------------------------------------------------------------

// Finalized ancestors and abandoned forks are released, the root and its
// descendants remain pinned. Transactions settled on an abandoned fork stay
// settled and can no longer complete, only their identifiers are retained.
code transaction_tracker::do_prune(const block_id& root,
    const block_ids& ancestry) NOEXCEPT
{
    const auto removed = tree_.prune(root);
    if (!tree_.contains(root))
        return fault(error::prune1);

    for (const auto& block: removed)
    {
        const auto it = settlements_.find(block);
        if (it != settlements_.end())
        {
            // Finalized ancestors are fully resolved by completion.
            if (std::find(ancestry.begin(), ancestry.end(), block) !=
                ancestry.end())
                return fault(error::prune2);

            for (const auto& tx: it->second)
            {
                queue_.dequeue(tx);
                records_.erase(tx);
                abandoned_.insert(tx);
            }

            LOGV("Block [" << block << "] abandoned with ["
                << it->second.size() << "] settled transactions.");
            settlements_.erase(it);
        }

        cache_.erase(block);
    }

    if (removed.empty())
        return error::success;

    LOGV("Unpinned [" << removed.size() << "] blocks below ["
        << root << "].");
    fire(events::blocks_unpinned, removed.size());
    oracle_.unpin(removed);
    return error::success;
}

// Other.
// ----------------------------------------------------------------------------

code transaction_tracker::do_unknown(const unknown_event& event) NOEXCEPT
{
    LOGV("Unknown event [" << event.type << "] ignored.");
    return error::unknown_event;
}

code transaction_tracker::fault(const code& ec) NOEXCEPT
{
    LOGF("Tracker fault, " << ec.message());
    fault_ = ec;
    return ec;
}

// Properties.
// ----------------------------------------------------------------------------

transaction_tracker::tx_state transaction_tracker::state(
    const tx_id& tx) const NOEXCEPT
{
    if (done_.contains(tx))
        return tx_state::done;

    if (abandoned_.contains(tx))
        return tx_state::settled;

    const auto it = records_.find(tx);
    return it == records_.end() ? tx_state::unknown : it->second.state;
}

bool transaction_tracker::get_settlement(block_id& out,
    const tx_id& tx) const NOEXCEPT
{
    const auto it = records_.find(tx);
    if (it == records_.end() || it->second.state != tx_state::settled)
        return false;

    out = it->second.block;
    return true;
}

bool transaction_tracker::get_outcome(outcome& out,
    const tx_id& tx) const NOEXCEPT
{
    block_id block{};
    return get_settlement(block, tx) && cache_.find(out, block, tx);
}

bool transaction_tracker::get_height(size_t& out,
    const block_id& block) const NOEXCEPT
{
    return tree_.get_height(out, block);
}

bool transaction_tracker::is_pinned(const block_id& block) const NOEXCEPT
{
    return tree_.contains(block);
}

size_t transaction_tracker::pending() const NOEXCEPT
{
    return pending_;
}

size_t transaction_tracker::settled() const NOEXCEPT
{
    return records_.size() - pending_;
}

size_t transaction_tracker::done() const NOEXCEPT
{
    return done_.size();
}

size_t transaction_tracker::abandoned() const NOEXCEPT
{
    return abandoned_.size();
}

size_t transaction_tracker::queued() const NOEXCEPT
{
    return queue_.size();
}

size_t transaction_tracker::pinned() const NOEXCEPT
{
    return tree_.size();
}

size_t transaction_tracker::cached() const NOEXCEPT
{
    return cache_.size();
}

const block_id& transaction_tracker::last_finalized() const NOEXCEPT
{
    return finalized_;
}

const code& transaction_tracker::faulted() const NOEXCEPT
{
    return fault_;
}

BC_POP_WARNING()

} // namespace tracker
} // namespace libbitcoin
