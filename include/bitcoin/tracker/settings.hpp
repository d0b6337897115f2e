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
#ifndef LIBBITCOIN_TRACKER_SETTINGS_HPP
#define LIBBITCOIN_TRACKER_SETTINGS_HPP

#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace log {

/// [log] settings.
class BCT_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    bool application;
    bool news;
    bool fault;
    bool verbose;

    /// Level is written to the log sink.
    virtual bool enabled(uint8_t level) const NOEXCEPT;
};

} // namespace log

namespace tracker {

/// [tracker] settings.
class BCT_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    /// Properties.
    bool prune;
};

} // namespace tracker
} // namespace libbitcoin

#endif
