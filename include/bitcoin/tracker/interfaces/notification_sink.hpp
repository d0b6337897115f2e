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
#ifndef LIBBITCOIN_TRACKER_INTERFACES_NOTIFICATION_SINK_HPP
#define LIBBITCOIN_TRACKER_INTERFACES_NOTIFICATION_SINK_HPP

#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/outcome.hpp>

namespace libbitcoin {
namespace tracker {

/// Abstract synchronous consumer of ordered lifecycle notifications.
/// Each transaction is notified at most once per method, settled first.
class BCT_API notification_sink
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(notification_sink);
    notification_sink() = default;

    /// The transaction is included in a processed block.
    virtual void on_tx_settled(const tx_id& tx,
        const outcome& result) NOEXCEPT = 0;

    /// The settlement block of the transaction is finalized.
    virtual void on_tx_done(const tx_id& tx,
        const outcome& result) NOEXCEPT = 0;
};

} // namespace tracker
} // namespace libbitcoin

#endif
