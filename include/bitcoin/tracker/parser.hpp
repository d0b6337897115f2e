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
#ifndef LIBBITCOIN_TRACKER_PARSER_HPP
#define LIBBITCOIN_TRACKER_PARSER_HPP

#include <iostream>
#include <bitcoin/tracker/configuration.hpp>
#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/settings.hpp>

// This must be lower case but the env var part can be any case.
#define BT_CONFIG_VARIABLE "config"

// This must match the case of the env var.
#define BT_ENVIRONMENT_VARIABLE_PREFIX "BT_"

namespace libbitcoin {
namespace tracker {

/// Parse configurable values from environment variables, settings file, and
/// the command line settings file path.
class BCT_API parser
  : public system::config::parser
{
public:
    parser() NOEXCEPT;
    parser(const configuration& defaults) NOEXCEPT;

    /// Load command line options (named).
    options_metadata load_options() THROWS override;

    /// Load command line arguments (positional), there are none.
    arguments_metadata load_arguments() THROWS override;

    /// Load environment variable settings.
    options_metadata load_environment() THROWS override;

    /// Load configuration file settings.
    options_metadata load_settings() THROWS override;

    /// Parse all configuration into member settings.
    virtual bool parse(int argc, const char* argv[],
        std::ostream& error) THROWS;

    /// The populated configuration settings values.
    configuration configured;
};

} // namespace tracker
} // namespace libbitcoin

#endif
