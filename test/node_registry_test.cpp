/*
 * Copyright (c) 2013-2016 John Connor
 * Copyright (c) 2016-2017 The Vcash developers
 *
 * This file is part of cloudsim.
 *
 * cloudsim is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License with
 * additional permissions to the one published by the Free Software
 * Foundation, either version 3 of the License, or (at your option)
 * any later version. For more information see LICENSE.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#include <chrono>
#include <thread>

#include <catch2/catch.hpp>

#include <cloudsim/node_registry.hpp>

using namespace cloudsim;

static node_record make_record(
    const std::string & node_id, const std::int64_t & storage,
    const std::int64_t & bandwidth = 1000
    )
{
    node_record ret;
    
    ret.node_id = node_id;
    ret.host = "127.0.0.1";
    ret.tcp_port = 8080;
    ret.udp_port = 0;
    ret.capacity.cpu_cores = 4;
    ret.capacity.memory_gb = 8;
    ret.capacity.storage_bytes = storage;
    ret.capacity.bandwidth_bps = bandwidth;
    
    return ret;
}

TEST_CASE("re-registration replaces the record in place", "[registry]")
{
    node_registry registry;
    
    REQUIRE(registry.register_node(make_record("a", 100)) == error_code_none);
    REQUIRE(registry.register_node(make_record("b", 200)) == error_code_none);
    
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    
    registry.on_probe_failure("a", std::chrono::milliseconds(1));
    
    node_record record;
    
    REQUIRE(registry.find("a", record));
    REQUIRE_FALSE(record.active);
    
    auto updated = make_record("a", 500, 42);
    
    updated.udp_port = 6000;
    
    REQUIRE(registry.register_node(updated) == error_code_none);
    
    auto nodes = registry.list_nodes();
    
    REQUIRE(nodes.size() == 2);
    CHECK(nodes[0].node_id == "a");
    CHECK(nodes[0].capacity.storage_bytes == 500);
    CHECK(nodes[0].capacity.bandwidth_bps == 42);
    CHECK(nodes[0].udp_port == 6000);
    CHECK(nodes[0].active);
    CHECK(nodes[1].node_id == "b");
}

TEST_CASE("registration validation", "[registry]")
{
    node_registry registry;
    
    CHECK(registry.register_node(make_record("", 100)) == error_code_validation);
    CHECK(registry.register_node(make_record("a", -1)) == error_code_validation);
    CHECK(
        registry.register_node(make_record("a", 100, -5)) ==
        error_code_validation
    );
    CHECK(registry.list_nodes().empty());
}

TEST_CASE("heartbeat and active notification", "[registry]")
{
    node_registry registry;
    
    SECTION("unregistered nodes are rejected without a state change")
    {
        CHECK(registry.heartbeat("ghost") == error_code_not_registered);
        CHECK(registry.notify_active("ghost") == error_code_not_registered);
        CHECK(registry.list_nodes().empty());
    }
    
    SECTION("heartbeat refreshes last_seen")
    {
        REQUIRE(registry.register_node(make_record("a", 100)) == error_code_none);
        
        node_record before;
        
        REQUIRE(registry.find("a", before));
        
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        
        CHECK(registry.heartbeat("a") == error_code_none);
        
        node_record after;
        
        REQUIRE(registry.find("a", after));
        CHECK(after.last_seen > before.last_seen);
    }
    
    SECTION("active notification reactivates")
    {
        REQUIRE(registry.register_node(make_record("a", 100)) == error_code_none);
        
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        
        registry.on_probe_failure("a", std::chrono::milliseconds(1));
        
        node_record record;
        
        REQUIRE(registry.find("a", record));
        REQUIRE_FALSE(record.active);
        
        CHECK(registry.notify_active("a") == error_code_none);
        REQUIRE(registry.find("a", record));
        CHECK(record.active);
    }
}

TEST_CASE("staleness and probe outcomes", "[registry]")
{
    node_registry registry;
    
    REQUIRE(registry.register_node(make_record("a", 100)) == error_code_none);
    REQUIRE(registry.register_node(make_record("b", 100)) == error_code_none);
    
    CHECK(registry.stale_nodes(std::chrono::milliseconds(10000)).empty());
    
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    
    REQUIRE(registry.heartbeat("b") == error_code_none);
    
    auto stale = registry.stale_nodes(std::chrono::milliseconds(10));
    
    REQUIRE(stale.size() == 1);
    CHECK(stale[0].node_id == "a");
    
    SECTION("failure of a stale node marks it inactive but keeps it")
    {
        registry.on_probe_failure("a", std::chrono::milliseconds(10));
        
        auto nodes = registry.list_nodes();
        
        REQUIRE(nodes.size() == 2);
        CHECK_FALSE(nodes[0].active);
        CHECK(nodes[1].active);
    }
    
    SECTION("failure of a node that recovered is ignored")
    {
        registry.on_probe_failure("b", std::chrono::milliseconds(10));
        
        node_record record;
        
        REQUIRE(registry.find("b", record));
        CHECK(record.active);
    }
    
    SECTION("success refreshes and reactivates")
    {
        registry.on_probe_failure("a", std::chrono::milliseconds(10));
        registry.on_probe_success("a");
        
        node_record record;
        
        REQUIRE(registry.find("a", record));
        CHECK(record.active);
        CHECK(registry.stale_nodes(std::chrono::milliseconds(10)).empty());
    }
}

TEST_CASE("network stats", "[registry]")
{
    node_registry registry;
    
    REQUIRE(registry.register_node(make_record("a", 100, 10)) == error_code_none);
    REQUIRE(registry.register_node(make_record("b", 200, 20)) == error_code_none);
    
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    
    registry.on_probe_failure("b", std::chrono::milliseconds(1));
    registry.on_connection();
    registry.on_connection();
    registry.on_bytes(100);
    registry.on_bytes(28);
    
    auto stats = registry.stats();
    
    CHECK(stats.total_nodes == 2);
    CHECK(stats.active_nodes == 1);
    CHECK(stats.total_connections == 2);
    CHECK(stats.total_data_transferred == 128);
    CHECK(stats.total_storage_capacity == 300);
    CHECK(stats.total_bandwidth_capacity == 30);
}
