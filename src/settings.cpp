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
#include <bitcoin/tracker/settings.hpp>

#include <bitcoin/network.hpp>

using namespace bc::system;
using namespace bc::network;

namespace libbitcoin {
namespace log {

// Log states default to network compiled states or explicit false.
settings::settings() NOEXCEPT
  : application{ levels::application_defined },
    news{ levels::news_defined },
    fault{ levels::fault_defined },
    verbose{ false /*levels::verbose_defined*/ }
{
}

// Levels not configurable here are not written.
bool settings::enabled(uint8_t level) const NOEXCEPT
{
    switch (level)
    {
        case levels::application:
            return application;
        case levels::news:
            return news;
        case levels::fault:
            return fault;
        case levels::verbose:
            return verbose;
        default:
            return false;
    }
}

} // namespace log

namespace tracker {

settings::settings() NOEXCEPT
  : prune{ true }
{
}

} // namespace tracker
} // namespace libbitcoin
