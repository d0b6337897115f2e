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

BOOST_AUTO_TEST_SUITE(arrival_queue_tests)

BOOST_AUTO_TEST_CASE(arrival_queue__construct__default__empty)
{
    const arrival_queue instance{};
    BOOST_REQUIRE(instance.empty());
    BOOST_REQUIRE_EQUAL(instance.size(), 0u);
    BOOST_REQUIRE(instance.ordered().empty());
}

BOOST_AUTO_TEST_CASE(arrival_queue__enqueue__distinct__arrival_order)
{
    arrival_queue instance{};
    BOOST_REQUIRE(instance.enqueue("t2"));
    BOOST_REQUIRE(instance.enqueue("t1"));
    BOOST_REQUIRE(instance.enqueue("t3"));
    BOOST_REQUIRE_EQUAL(instance.size(), 3u);
    BOOST_REQUIRE(instance.contains("t1"));
    BOOST_REQUIRE(instance.ordered() == tx_ids({ "t2", "t1", "t3" }));
}

BOOST_AUTO_TEST_CASE(arrival_queue__enqueue__duplicate__false_first_position_kept)
{
    arrival_queue instance{};
    BOOST_REQUIRE(instance.enqueue("t1"));
    BOOST_REQUIRE(instance.enqueue("t2"));
    BOOST_REQUIRE(!instance.enqueue("t1"));
    BOOST_REQUIRE(instance.ordered() == tx_ids({ "t1", "t2" }));
}

BOOST_AUTO_TEST_CASE(arrival_queue__dequeue__middle__order_preserved)
{
    arrival_queue instance{};
    instance.enqueue("t1");
    instance.enqueue("t2");
    instance.enqueue("t3");
    BOOST_REQUIRE(instance.dequeue("t2"));
    BOOST_REQUIRE(!instance.contains("t2"));
    BOOST_REQUIRE(instance.ordered() == tx_ids({ "t1", "t3" }));
}

BOOST_AUTO_TEST_CASE(arrival_queue__dequeue__unknown__false)
{
    arrival_queue instance{};
    instance.enqueue("t1");
    BOOST_REQUIRE(!instance.dequeue("t2"));
    BOOST_REQUIRE_EQUAL(instance.size(), 1u);
}

BOOST_AUTO_TEST_CASE(arrival_queue__enqueue__after_dequeue__moves_to_back)
{
    arrival_queue instance{};
    instance.enqueue("t1");
    instance.enqueue("t2");
    instance.dequeue("t1");
    BOOST_REQUIRE(instance.enqueue("t1"));
    BOOST_REQUIRE(instance.ordered() == tx_ids({ "t2", "t1" }));
}

BOOST_AUTO_TEST_CASE(arrival_queue__sort__subset__arrival_order)
{
    arrival_queue instance{};
    instance.enqueue("t1");
    instance.enqueue("t2");
    instance.enqueue("t3");
    instance.enqueue("t4");

    tx_ids batch{ "t4", "t1", "t3" };
    BOOST_REQUIRE(instance.sort(batch));
    BOOST_REQUIRE(batch == tx_ids({ "t1", "t3", "t4" }));
}

BOOST_AUTO_TEST_CASE(arrival_queue__sort__empty__true)
{
    const arrival_queue instance{};
    tx_ids batch{};
    BOOST_REQUIRE(instance.sort(batch));
    BOOST_REQUIRE(batch.empty());
}

BOOST_AUTO_TEST_CASE(arrival_queue__sort__unqueued__false_unchanged)
{
    arrival_queue instance{};
    instance.enqueue("t1");
    instance.enqueue("t2");

    tx_ids batch{ "t2", "t9", "t1" };
    BOOST_REQUIRE(!instance.sort(batch));
    BOOST_REQUIRE(batch == tx_ids({ "t2", "t9", "t1" }));
}

BOOST_AUTO_TEST_SUITE_END()
