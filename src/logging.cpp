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
#include <bitcoin/tracker/logging.hpp>

#include <chrono>
#include <bitcoin/network.hpp>
#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/settings.hpp>

namespace libbitcoin {
namespace tracker {

using namespace network;
using namespace system;
using namespace std::chrono;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

static const std::unordered_map<uint8_t, std::string> fired
{
    { events::block_archived,  "block_archived.." },
    { events::block_finalized, "block_finalized." },
    { events::blocks_unpinned, "blocks_unpinned." },

    { events::tx_submitted,    "tx_submitted...." },
    { events::tx_settled,      "tx_settled......" },
    { events::tx_invalidated,  "tx_invalidated.." },
    { events::tx_done,         "tx_done........." }
};

std::string event_name(uint8_t event_) NOEXCEPT
{
    const auto it = fired.find(event_);
    return it == fired.end() ? std::string{} : it->second;
}

void subscribe_messages(logger& log, std::ostream& sink,
    const log::settings& settings) NOEXCEPT
{
    log.subscribe_messages([&sink, settings](const code& ec, uint8_t level,
        time_t time, const std::string& message)
    {
        // Stopped, no further messages.
        if (ec)
            return false;

        // Write only selected logs.
        if (!settings.enabled(level))
            return true;

        sink << format_zulu_time(time) << "." << serialize(level) << " "
            << message;
        sink.flush();
        return true;
    });
}

void subscribe_events(logger& log, std::ostream& sink) NOEXCEPT
{
    log.subscribe_events([&sink, start = logger::now()](const code& ec,
        uint8_t event_, uint64_t value, const logger::time& point)
    {
        if (ec)
            return false;

        const auto name = event_name(event_);
        if (name.empty())
            return true;

        const auto time = duration_cast<seconds>(point - start).count();
        sink << name << " " << value << " " << time << std::endl;
        return true;
    });
}

BC_POP_WARNING()

} // namespace tracker
} // namespace libbitcoin
