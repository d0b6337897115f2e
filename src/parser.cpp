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
#include <bitcoin/tracker/parser.hpp>

#include <iostream>
#include <bitcoin/system.hpp>
#include <bitcoin/network.hpp>
#include <bitcoin/tracker/configuration.hpp>

std::filesystem::path config_default_path() NOEXCEPT
{
    return { "libbitcoin/bt.cfg" };
}

namespace libbitcoin {
namespace tracker {

using namespace bc::system;
using namespace bc::system::config;
using namespace boost::program_options;

// Initialize configuration using default settings.
parser::parser() NOEXCEPT
  : configured{}
{
}

// Initialize configuration by copying the given instance.
parser::parser(const configuration& defaults) NOEXCEPT
  : configured(defaults)
{
}

options_metadata parser::load_options() THROWS
{
    options_metadata description("options");
    description.add_options()
    (
        BT_CONFIG_VARIABLE ",c",
        value<std::filesystem::path>(&configured.file),
        "Specify path to a configuration settings file."
    );

    return description;
}

// No positional arguments.
arguments_metadata parser::load_arguments() THROWS
{
    arguments_metadata description;
    return description;
}

options_metadata parser::load_environment() THROWS
{
    options_metadata description("environment");
    description.add_options()
    (
        // For some reason po requires this to be a lower case name.
        // The case must match the other declarations for it to compose.
        // This composes with the cmdline options and inits to default path.
        BT_CONFIG_VARIABLE,
        value<std::filesystem::path>(&configured.file)->composing()
            ->default_value(config_default_path()),
        "The path to the configuration settings file."
    );

    return description;
}

options_metadata parser::load_settings() THROWS
{
    options_metadata description("settings");
    description.add_options()

    /* [log] */
#if defined(HAVE_LOGA)
    (
        "log.application",
        value<bool>(&configured.log.application),
        "Enable application logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGN)
    (
        "log.news",
        value<bool>(&configured.log.news),
        "Enable news logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGF)
    (
        "log.fault",
        value<bool>(&configured.log.fault),
        "Enable local fault logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGV)
    (
        "log.verbose",
        value<bool>(&configured.log.verbose),
        "Enable verbose logging, defaults to false."
    )
#endif

    /* [tracker] */
    (
        "tracker.prune",
        value<bool>(&configured.tracker.prune),
        "Unpin blocks that are abandoned or older than the finalized block, defaults to true."
    );

    return description;
}

bool parser::parse(int argc, const char* argv[], std::ostream& error) THROWS
{
    try
    {
        variables_map variables;
        load_command_variables(variables, argc, argv);
        load_environment_variables(variables, BT_ENVIRONMENT_VARIABLE_PREFIX);

        // Returns true if the settings were loaded from a file.
        const auto file = load_configuration_variables(variables,
            BT_CONFIG_VARIABLE);

        // Update bound variables in metadata.settings.
        notify(variables);

        // Clear the config file path if it wasn't used.
        if (!file)
            configured.file.clear();
    }
    catch (const boost::program_options::error& e)
    {
        // This is obtained from boost, which circumvents our localization.
        error << format_invalid_parameter(e.what()) << std::endl;
        return false;
    }

    return true;
}

} // namespace tracker
} // namespace libbitcoin
