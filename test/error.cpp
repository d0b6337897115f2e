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

BOOST_AUTO_TEST_SUITE(error_tests)

// error_t
// These test std::error_code equality operator overrides.

// general

BOOST_AUTO_TEST_CASE(error_t__code__success__false_exected_message)
{
    constexpr auto value = error::success;
    const auto ec = code(value);
    BOOST_REQUIRE(!ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "success");
}


// input

BOOST_AUTO_TEST_CASE(error_t__code__unknown_event__true_exected_message)
{
    constexpr auto value = error::unknown_event;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "unknown event");
}

BOOST_AUTO_TEST_CASE(error_t__code__unknown_block__true_exected_message)
{
    constexpr auto value = error::unknown_block;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "unknown block");
}

BOOST_AUTO_TEST_CASE(error_t__code__duplicate_block__true_exected_message)
{
    constexpr auto value = error::duplicate_block;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "duplicate block");
}

BOOST_AUTO_TEST_CASE(error_t__code__duplicate_transaction__true_exected_message)
{
    constexpr auto value = error::duplicate_transaction;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "duplicate transaction");
}


// state

BOOST_AUTO_TEST_CASE(error_t__code__tracker_faulted__true_exected_message)
{
    constexpr auto value = error::tracker_faulted;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "tracker faulted");
}


// faults

BOOST_AUTO_TEST_CASE(error_t__code__settle1__true_exected_message)
{
    constexpr auto value = error::settle1;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "settle1");
}

BOOST_AUTO_TEST_CASE(error_t__code__settle2__true_exected_message)
{
    constexpr auto value = error::settle2;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "settle2");
}

BOOST_AUTO_TEST_CASE(error_t__code__settle3__true_exected_message)
{
    constexpr auto value = error::settle3;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "settle3");
}

BOOST_AUTO_TEST_CASE(error_t__code__finalize1__true_exected_message)
{
    constexpr auto value = error::finalize1;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "finalize1");
}

BOOST_AUTO_TEST_CASE(error_t__code__finalize2__true_exected_message)
{
    constexpr auto value = error::finalize2;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "finalize2");
}

BOOST_AUTO_TEST_CASE(error_t__code__finalize3__true_exected_message)
{
    constexpr auto value = error::finalize3;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "finalize3");
}

BOOST_AUTO_TEST_CASE(error_t__code__finalize4__true_exected_message)
{
    constexpr auto value = error::finalize4;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "finalize4");
}

BOOST_AUTO_TEST_CASE(error_t__code__prune1__true_exected_message)
{
    constexpr auto value = error::prune1;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "prune1");
}

BOOST_AUTO_TEST_CASE(error_t__code__prune2__true_exected_message)
{
    constexpr auto value = error::prune2;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "prune2");
}

BOOST_AUTO_TEST_SUITE_END()
