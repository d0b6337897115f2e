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

BOOST_AUTO_TEST_SUITE(outcome_cache_tests)

BOOST_AUTO_TEST_CASE(outcome_cache__construct__default__empty)
{
    const outcome_cache instance{};
    outcome out{};
    BOOST_REQUIRE(instance.empty());
    BOOST_REQUIRE_EQUAL(instance.size(), 0u);
    BOOST_REQUIRE(!instance.contains("b1", "t1"));
    BOOST_REQUIRE(!instance.find(out, "b1", "t1"));
}

BOOST_AUTO_TEST_CASE(outcome_cache__emplace__new__found)
{
    outcome_cache instance{};
    const auto expected = outcome::valid("b1", false);
    BOOST_REQUIRE(instance.emplace("b1", "t1", expected));
    BOOST_REQUIRE(instance.contains("b1", "t1"));
    BOOST_REQUIRE(!instance.contains("b2", "t1"));
    BOOST_REQUIRE_EQUAL(instance.size(), 1u);

    outcome out{};
    BOOST_REQUIRE(instance.find(out, "b1", "t1"));
    BOOST_REQUIRE_EQUAL(out, expected);
}

BOOST_AUTO_TEST_CASE(outcome_cache__emplace__existing__false_not_overwritten)
{
    outcome_cache instance{};
    BOOST_REQUIRE(instance.emplace("b1", "t1", outcome::valid("b1", true)));
    BOOST_REQUIRE(!instance.emplace("b1", "t1", outcome::invalid("b1")));
    BOOST_REQUIRE_EQUAL(instance.size(), 1u);

    outcome out{};
    BOOST_REQUIRE(instance.find(out, "b1", "t1"));
    BOOST_REQUIRE_EQUAL(out, outcome::valid("b1", true));
}

BOOST_AUTO_TEST_CASE(outcome_cache__emplace__same_tx_other_block__distinct)
{
    outcome_cache instance{};
    BOOST_REQUIRE(instance.emplace("b1", "t1", outcome::valid("b1", true)));
    BOOST_REQUIRE(instance.emplace("b2", "t1", outcome::invalid("b2")));
    BOOST_REQUIRE_EQUAL(instance.size(), 2u);

    outcome out{};
    BOOST_REQUIRE(instance.find(out, "b2", "t1"));
    BOOST_REQUIRE_EQUAL(out, outcome::invalid("b2"));
}

BOOST_AUTO_TEST_CASE(outcome_cache__erase__entry__removed)
{
    outcome_cache instance{};
    instance.emplace("b1", "t1", outcome::invalid("b1"));
    instance.emplace("b1", "t2", outcome::invalid("b1"));
    BOOST_REQUIRE(instance.erase("b1", "t1"));
    BOOST_REQUIRE(!instance.erase("b1", "t1"));
    BOOST_REQUIRE(!instance.contains("b1", "t1"));
    BOOST_REQUIRE(instance.contains("b1", "t2"));
    BOOST_REQUIRE_EQUAL(instance.size(), 1u);
    BOOST_REQUIRE(instance.erase("b1", "t2"));
    BOOST_REQUIRE(instance.empty());
}

BOOST_AUTO_TEST_CASE(outcome_cache__erase__block__all_removed)
{
    outcome_cache instance{};
    instance.emplace("b1", "t1", outcome::invalid("b1"));
    instance.emplace("b1", "t2", outcome::valid("b1", true));
    instance.emplace("b2", "t3", outcome::valid("b2", true));
    BOOST_REQUIRE_EQUAL(instance.erase("b1"), 2u);
    BOOST_REQUIRE_EQUAL(instance.erase("b1"), 0u);
    BOOST_REQUIRE_EQUAL(instance.size(), 1u);
    BOOST_REQUIRE(instance.contains("b2", "t3"));
}

BOOST_AUTO_TEST_SUITE_END()
