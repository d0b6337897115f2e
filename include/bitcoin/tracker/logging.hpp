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
#ifndef LIBBITCOIN_TRACKER_LOGGING_HPP
#define LIBBITCOIN_TRACKER_LOGGING_HPP

#include <ostream>
#include <bitcoin/network.hpp>
#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/settings.hpp>

namespace libbitcoin {
namespace tracker {

/// Fixed width name of the reporting event, empty if not an event.
BCT_API std::string event_name(uint8_t event_) NOEXCEPT;

/// Write log messages enabled by settings to the sink, formatted as
/// "<zulu-time>.<level> <message>". Settings are copied, the sink must
/// outlive logger stop.
BCT_API void subscribe_messages(network::logger& log, std::ostream& sink,
    const log::settings& settings) NOEXCEPT;

/// Write reporting events to the sink, formatted as
/// "<event-name> <value> <seconds-since-subscribe>".
/// Sink must outlive logger stop.
BCT_API void subscribe_events(network::logger& log,
    std::ostream& sink) NOEXCEPT;

} // namespace tracker
} // namespace libbitcoin

#endif
