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
#ifndef LIBBITCOIN_TRACKER_TRANSACTION_TRACKER_HPP
#define LIBBITCOIN_TRACKER_TRANSACTION_TRACKER_HPP

#include <bitcoin/network.hpp>
#include <bitcoin/tracker/chain_event.hpp>
#include <bitcoin/tracker/configuration.hpp>
#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/interfaces/interfaces.hpp>
#include <bitcoin/tracker/outcome.hpp>
#include <bitcoin/tracker/utility/arrival_queue.hpp>
#include <bitcoin/tracker/utility/block_tree.hpp>
#include <bitcoin/tracker/utility/outcome_cache.hpp>

namespace libbitcoin {
namespace tracker {

/// Not thread safe, events must be handled sequentially.
/// Consumes chain events, maintains transaction and block state, notifies
/// the sink of settlement and finalization (each at most once per
/// transaction, in arrival order) and releases blocks no longer required.
/// A fault indicates a state tracking defect and is terminal.
class BCT_API transaction_tracker
  : public network::reporter
{
public:
    DELETE_COPY_MOVE_DESTRUCT(transaction_tracker);

    /// Transaction lifecycle, never transitions backward.
    enum class tx_state : uint8_t
    {
        unknown,
        pending,
        settled,
        done
    };

    /// Collaborators must outlive the tracker.
    transaction_tracker(chain_oracle& oracle, notification_sink& sink,
        const configuration& config, const network::logger& log) NOEXCEPT;

    /// Handle the next event to completion.
    /// Input conditions are returned as codes and otherwise ignored.
    code handle(const chain_event& event) NOEXCEPT;

    /// Properties.
    /// -----------------------------------------------------------------------

    /// Lifecycle state of the transaction, settled if abandoned.
    tx_state state(const tx_id& tx) const NOEXCEPT;

    /// Settlement block of a settled transaction, false if abandoned.
    bool get_settlement(block_id& out, const tx_id& tx) const NOEXCEPT;

    /// Cached outcome of a settled transaction.
    bool get_outcome(outcome& out, const tx_id& tx) const NOEXCEPT;

    /// Height of a pinned block above its root.
    bool get_height(size_t& out, const block_id& block) const NOEXCEPT;

    /// The block is retained (not yet unpinned).
    bool is_pinned(const block_id& block) const NOEXCEPT;

    size_t pending() const NOEXCEPT;
    size_t settled() const NOEXCEPT;
    size_t done() const NOEXCEPT;

    /// Settled on a released fork, these can no longer complete.
    size_t abandoned() const NOEXCEPT;

    size_t queued() const NOEXCEPT;
    size_t pinned() const NOEXCEPT;
    size_t cached() const NOEXCEPT;

    /// Most recently finalized (known) block, empty if none.
    const block_id& last_finalized() const NOEXCEPT;

    /// The fault code, success if not faulted.
    const code& faulted() const NOEXCEPT;

protected:
    /// Handlers.
    virtual code do_new_block(const new_block& event) NOEXCEPT;
    virtual code do_new_transaction(const new_transaction& event) NOEXCEPT;
    virtual code do_finalized(const finalized& event) NOEXCEPT;
    virtual code do_unknown(const unknown_event& event) NOEXCEPT;

    /// Release all blocks other than root and its descendants.
    virtual code do_prune(const block_id& root,
        const block_ids& ancestry) NOEXCEPT;

    /// Enter the terminal faulted state.
    virtual code fault(const code& ec) NOEXCEPT;

private:
    struct record
    {
        tx_state state;
        block_id block;
    };

    using records = std::unordered_map<tx_id, record>;
    using settlements = std::unordered_map<block_id, tx_ids>;

    outcome query_outcome(const block_id& block, const tx_id& tx) NOEXCEPT;
    code complete(const tx_ids& batch) NOEXCEPT;

    // These are not owned.
    chain_oracle& oracle_;
    notification_sink& sink_;
    const configuration& config_;

    // These are owned exclusively and mutated only by handlers.
    records records_{};
    settlements settlements_{};
    std::unordered_set<tx_id> done_{};
    std::unordered_set<tx_id> abandoned_{};
    arrival_queue queue_{};
    block_tree tree_{};
    outcome_cache cache_{};
    block_id finalized_{};
    code fault_{};
    size_t pending_{};
};

} // namespace tracker
} // namespace libbitcoin

#endif
