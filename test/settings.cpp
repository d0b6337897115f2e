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
#include "test.hpp"

BOOST_AUTO_TEST_SUITE(settings_tests)

using namespace bc::network;

// [log]

BOOST_AUTO_TEST_CASE(settings__log__default_context__expected)
{
    const log::settings log{};
    BOOST_REQUIRE_EQUAL(log.application, levels::application_defined);
    BOOST_REQUIRE_EQUAL(log.news, levels::news_defined);
    BOOST_REQUIRE_EQUAL(log.fault, levels::fault_defined);
    BOOST_REQUIRE_EQUAL(log.verbose, false /*levels::verbose_defined*/);
}

BOOST_AUTO_TEST_CASE(settings__log_enabled__toggles__expected)
{
    log::settings log{};
    log.application = true;
    log.news = false;
    log.fault = true;
    log.verbose = true;
    BOOST_REQUIRE(log.enabled(levels::application));
    BOOST_REQUIRE(!log.enabled(levels::news));
    BOOST_REQUIRE(log.enabled(levels::fault));
    BOOST_REQUIRE(log.enabled(levels::verbose));
}

BOOST_AUTO_TEST_CASE(settings__log_enabled__unconfigurable_level__false)
{
    const log::settings log{};
    BOOST_REQUIRE(!log.enabled(levels::session));
    BOOST_REQUIRE(!log.enabled(levels::protocol));
    BOOST_REQUIRE(!log.enabled(levels::objects));
}

// [tracker]

BOOST_AUTO_TEST_CASE(settings__tracker__default_context__expected)
{
    const tracker::settings tracker{};
    BOOST_REQUIRE(tracker.prune);
}

BOOST_AUTO_TEST_SUITE_END()
