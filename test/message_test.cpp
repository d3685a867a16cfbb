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

#include <catch2/catch.hpp>

#include <cloudsim/json_parser.hpp>
#include <cloudsim/message.hpp>
#include <cloudsim/protocol.hpp>
#include <cloudsim/utility.hpp>

using namespace cloudsim;

static message decoded(const message & msg)
{
    message ret(msg.data(), msg.size());
    
    REQUIRE(ret.decode());
    
    return ret;
}

TEST_CASE("message writes numbers and booleans unquoted", "[message]")
{
    node_record record;
    
    record.node_id = "node1";
    record.host = "127.0.0.1";
    record.tcp_port = 8080;
    record.udp_port = 5005;
    record.capacity.cpu_cores = 4;
    record.capacity.memory_gb = 8;
    record.capacity.storage_bytes = 1024;
    record.capacity.bandwidth_bps = 1000000;
    
    auto msg = message::create_register(record);
    
    REQUIRE(msg.encode());
    
    CHECK(msg.str().find("\"action\":\"REGISTER\"") != std::string::npos);
    CHECK(msg.str().find("\"node_id\":\"node1\"") != std::string::npos);
    CHECK(msg.str().find("\"tcp_port\":8080") != std::string::npos);
    CHECK(msg.str().find("\"port\":5005") != std::string::npos);
    CHECK(msg.str().find("\"storage\":1024") != std::string::npos);
    
    auto m = decoded(msg);
    
    CHECK(m.action() == protocol::action_register);
    CHECK(m.node_id() == "node1");
    CHECK(m.ptree().get<std::int64_t> ("capacity.bandwidth") == 1000000);
}

TEST_CASE("message escapes strings", "[message]")
{
    auto msg = message::create_error("bad \"quote\" and \\ slash\n");
    
    REQUIRE(msg.encode());
    
    auto m = decoded(msg);
    
    CHECK(m.status() == "ERROR");
    CHECK(m.error_message() == "bad \"quote\" and \\ slash\n");
}

TEST_CASE("message node list", "[message]")
{
    SECTION("empty list is an array")
    {
        auto msg = message::create_node_list(std::vector<node_record> ());
        
        REQUIRE(msg.encode());
        
        CHECK(msg.str().find("\"nodes\":[]") != std::string::npos);
        
        std::vector<node_record> nodes;
        
        CHECK(decoded(msg).nodes(nodes));
        CHECK(nodes.empty());
    }
    
    SECTION("entries keep order and fields")
    {
        std::vector<node_record> in(2);
        
        in[0].node_id = "a";
        in[0].host = "10.0.0.1";
        in[0].udp_port = 6001;
        in[0].active = false;
        in[0].capacity.storage_bytes = 500;
        in[1].node_id = "b";
        in[1].host = "10.0.0.2";
        in[1].capacity.bandwidth_bps = 1000;
        
        auto msg = message::create_node_list(in);
        
        REQUIRE(msg.encode());
        
        CHECK(msg.str().find("\"active\":false") != std::string::npos);
        
        std::vector<node_record> out;
        
        REQUIRE(decoded(msg).nodes(out));
        REQUIRE(out.size() == 2);
        CHECK(out[0].node_id == "a");
        CHECK(out[0].host == "10.0.0.1");
        CHECK(out[0].udp_port == 6001);
        CHECK(out[0].active == false);
        CHECK(out[0].capacity.storage_bytes == 500);
        CHECK(out[1].node_id == "b");
        CHECK(out[1].active == true);
        CHECK(out[1].capacity.bandwidth_bps == 1000);
    }
}

TEST_CASE("message stats", "[message]")
{
    network_stats stats;
    
    stats.total_nodes = 3;
    stats.active_nodes = 2;
    stats.total_connections = 10;
    stats.total_data_transferred = 4096;
    stats.total_storage_capacity = 300;
    stats.total_bandwidth_capacity = 3000;
    
    auto msg = message::create_stats(stats);
    
    REQUIRE(msg.encode());
    
    network_stats out;
    
    REQUIRE(decoded(msg).stats(out));
    CHECK(out.total_nodes == 3);
    CHECK(out.active_nodes == 2);
    CHECK(out.total_connections == 10);
    CHECK(out.total_data_transferred == 4096);
    CHECK(out.total_storage_capacity == 300);
    CHECK(out.total_bandwidth_capacity == 3000);
}

TEST_CASE("message rejects malformed input", "[message]")
{
    std::string buf = "{\"action\": ";
    
    message msg(buf.data(), buf.size());
    
    CHECK_FALSE(msg.decode());
    CHECK_FALSE(message().decode());
}

TEST_CASE("protocol action names", "[protocol]")
{
    CHECK(protocol::action_from_string("HEARTBEAT") == protocol::action_heartbeat);
    CHECK(protocol::action_from_string("LIST_NODES") == protocol::action_list_nodes);
    CHECK(protocol::action_from_string("FOO") == protocol::action_unknown);
    CHECK(protocol::action_to_string(protocol::action_stats) == "STATS");
}

TEST_CASE("json completeness", "[utility]")
{
    CHECK(utility::is_complete_json("{\"a\":1}"));
    CHECK(utility::is_complete_json("{\"a\":{\"b\":[1,2]}}"));
    CHECK(utility::is_complete_json("{\"a\":\"}\"}"));
    CHECK_FALSE(utility::is_complete_json("{\"a\":\"}\""));
    CHECK_FALSE(utility::is_complete_json("{\"a\":{\"b\":1}"));
    CHECK_FALSE(utility::is_complete_json(""));
}

TEST_CASE("md5 hex", "[utility]")
{
    CHECK(utility::md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(utility::md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
}
