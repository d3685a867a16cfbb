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
#include <memory>
#include <stdexcept>
#include <thread>

#include <boost/asio.hpp>

#include <catch2/catch.hpp>

#include <cloudsim/controller.hpp>
#include <cloudsim/node_agent.hpp>
#include <cloudsim/orchestrator.hpp>
#include <cloudsim/rpc_client.hpp>
#include <cloudsim/tcp_acceptor.hpp>

using namespace cloudsim;

static message call(controller & c, const std::string & request)
{
    auto response = c.handle_request(request.data(), request.size());
    
    message ret(response.data(), response.size());
    
    REQUIRE(ret.decode());
    
    return ret;
}

static std::uint16_t unused_tcp_port()
{
    boost::asio::io_service ios;
    
    boost::asio::ip::tcp::acceptor acceptor(
        ios, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), 0)
    );
    
    return acceptor.local_endpoint().port();
}

static configuration test_configuration()
{
    configuration ret;
    
    ret.set_controller_host("127.0.0.1");
    ret.set_controller_port(0);
    ret.set_controller_threads(2);
    ret.set_heartbeat_interval_ms(100);
    ret.set_request_timeout_ms(2000);
    ret.set_simulated_link_bps(1000000000);
    ret.set_transfer_deadline_ms(10000);
    
    return ret;
}

TEST_CASE("controller registration", "[controller]")
{
    configuration config;
    
    controller c(config);
    
    SECTION("a full registration is listed")
    {
        auto response = call(c,
            "{\"action\": \"REGISTER\", \"node_id\": \"node1\", "
            "\"host\": \"10.0.0.5\", \"tcp_port\": 9000, \"port\": 5005, "
            "\"capacity\": {\"cpu\": 8, \"memory\": 16, \"storage\": 1000, "
            "\"bandwidth\": 2000}}"
        );
        
        CHECK(response.status() == "OK");
        
        std::vector<node_record> nodes;
        
        REQUIRE(call(c, "{\"action\": \"LIST_NODES\"}").nodes(nodes));
        REQUIRE(nodes.size() == 1);
        CHECK(nodes[0].node_id == "node1");
        CHECK(nodes[0].host == "10.0.0.5");
        CHECK(nodes[0].tcp_port == 9000);
        CHECK(nodes[0].udp_port == 5005);
        CHECK(nodes[0].active);
        CHECK(nodes[0].capacity.cpu_cores == 8);
        CHECK(nodes[0].capacity.memory_gb == 16);
        CHECK(nodes[0].capacity.storage_bytes == 1000);
        CHECK(nodes[0].capacity.bandwidth_bps == 2000);
    }
    
    SECTION("missing fields take defaults")
    {
        auto response = call(c,
            "{\"action\": \"REGISTER\", \"node_id\": \"node2\"}"
        );
        
        CHECK(response.status() == "OK");
        
        node_record record;
        
        REQUIRE(c.registry().find("node2", record));
        CHECK(record.host == "127.0.0.1");
        CHECK(record.tcp_port == 8080);
        CHECK(record.udp_port == 0);
        CHECK(record.capacity.cpu_cores == 4);
        CHECK(record.capacity.memory_gb == 8);
        CHECK(record.capacity.storage_bytes == 100LL * 1024 * 1024 * 1024);
        CHECK(record.capacity.bandwidth_bps == 1000000000);
    }
    
    SECTION("invalid registrations are rejected")
    {
        CHECK(call(c, "{\"action\": \"REGISTER\"}").status() == "ERROR");
        CHECK(
            call(c, "{\"action\": \"REGISTER\", \"node_id\": \"n\", "
            "\"capacity\": {\"storage\": -1}}").status() == "ERROR"
        );
        CHECK(
            call(c, "{\"action\": \"REGISTER\", \"node_id\": \"n\", "
            "\"capacity\": {\"cpu\": \"many\"}}").status() == "ERROR"
        );
        CHECK(
            call(c, "{\"action\": \"REGISTER\", \"node_id\": \"n\", "
            "\"port\": 70000}").status() == "ERROR"
        );
        CHECK(c.registry().list_nodes().empty());
    }
}

TEST_CASE("controller heartbeat and notification", "[controller]")
{
    configuration config;
    
    controller c(config);
    
    auto unknown = call(c, "{\"action\": \"HEARTBEAT\", \"node_id\": \"x\"}");
    
    CHECK(unknown.status() == "ERROR");
    CHECK(unknown.error_message() == "Node not registered");
    
    unknown = call(c,
        "{\"action\": \"ACTIVE_NOTIFICATION\", \"node_id\": \"x\"}"
    );
    
    CHECK(unknown.error_message() == "Node not registered");
    CHECK(c.registry().list_nodes().empty());
    
    REQUIRE(
        call(c, "{\"action\": \"REGISTER\", \"node_id\": \"x\"}").status() ==
        "OK"
    );
    
    CHECK(
        call(c, "{\"action\": \"HEARTBEAT\", \"node_id\": \"x\"}").status() ==
        "ACK"
    );
    CHECK(
        call(c, "{\"action\": \"ACTIVE_NOTIFICATION\", \"node_id\": \"x\"}")
        .status() == "ACK"
    );
}

TEST_CASE("controller errors", "[controller]")
{
    configuration config;
    
    controller c(config);
    
    auto response = call(c, "{\"action\": \"DELETE\"}");
    
    CHECK(response.status() == "ERROR");
    CHECK(response.error_message() == "Unknown action: DELETE");
    
    response = call(c, "{\"action\": ");
    
    CHECK(response.status() == "ERROR");
    CHECK(response.error_message().find("Malformed request") == 0);
}

TEST_CASE("controller stats", "[controller]")
{
    configuration config;
    
    controller c(config);
    
    call(c,
        "{\"action\": \"REGISTER\", \"node_id\": \"a\", \"capacity\": "
        "{\"storage\": 100, \"bandwidth\": 10}}"
    );
    call(c,
        "{\"action\": \"REGISTER\", \"node_id\": \"b\", \"capacity\": "
        "{\"storage\": 200, \"bandwidth\": 20}}"
    );
    
    network_stats stats;
    
    REQUIRE(call(c, "{\"action\": \"STATS\"}").stats(stats));
    CHECK(stats.total_nodes == 2);
    CHECK(stats.active_nodes == 2);
    CHECK(stats.total_storage_capacity == 300);
    CHECK(stats.total_bandwidth_capacity == 30);
    CHECK(stats.total_data_transferred > 0);
}

TEST_CASE("controller refuses a port in use", "[controller][tcp]")
{
    auto config = test_configuration();
    
    controller first(config);
    
    first.start();
    
    config.set_controller_port(first.port());
    
    controller second(config);
    
    CHECK_THROWS_AS(second.start(), std::runtime_error);
    
    first.stop();
}

TEST_CASE("acceptor counts and caps connections", "[controller][tcp]")
{
    boost::asio::io_service ios;
    
    std::unique_ptr<boost::asio::io_service::work> work(
        new boost::asio::io_service::work(ios)
    );
    
    std::thread thread([&ios]()
    {
        ios.run();
    });
    
    auto acceptor = std::make_shared<tcp_acceptor> (ios, 1);
    
    acceptor->set_on_request([](const char *, const std::size_t &)
    {
        return std::string("{\"status\": \"OK\"}");
    });
    
    acceptor->open("127.0.0.1", 0);
    
    boost::asio::ip::tcp::endpoint ep(
        boost::asio::ip::address_v4::loopback(),
        acceptor->local_endpoint().port()
    );
    
    boost::asio::io_service client_ios;
    
    boost::asio::ip::tcp::socket first(client_ios);
    
    first.connect(ep);
    
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    
    while (
        acceptor->connections() == 0 &&
        std::chrono::steady_clock::now() < deadline
        )
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    
    REQUIRE(acceptor->connections() == 1);
    
    /**
     * The second connection is closed at accept.
     */
    boost::asio::ip::tcp::socket second(client_ios);
    
    second.connect(ep);
    
    auto start = std::chrono::steady_clock::now();
    
    char buf[64];
    
    boost::system::error_code ec;
    
    second.read_some(boost::asio::buffer(buf), ec);
    
    CHECK(ec);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
    CHECK(acceptor->connections() == 1);
    
    /**
     * The first connection is still served.
     */
    std::string request = "{\"action\": \"STATS\"}";
    
    boost::asio::write(first, boost::asio::buffer(request));
    
    std::string response;
    
    for (;;)
    {
        auto len = first.read_some(boost::asio::buffer(buf), ec);
        
        if (ec)
        {
            break;
        }
        
        response.append(buf, len);
    }
    
    CHECK(response.find("OK") != std::string::npos);
    
    acceptor->close();
    
    work.reset();
    
    thread.join();
}

TEST_CASE("node registration fails without a controller", "[node][tcp]")
{
    auto config = test_configuration();
    
    config.set_controller_port(unused_tcp_port());
    config.set_request_timeout_ms(500);
    
    node_record record;
    
    record.node_id = "lonely";
    
    node_agent n(config, record);
    
    CHECK_THROWS_AS(n.start(), std::runtime_error);
}

TEST_CASE("end to end transfer over loopback", "[controller][node][tcp]")
{
    auto config = test_configuration();
    
    controller c(config);
    
    c.start();
    
    REQUIRE(c.port() != 0);
    
    config.set_controller_port(c.port());
    
    node_record record;
    
    record.node_id = "node1";
    record.capacity.cpu_cores = 4;
    record.capacity.memory_gb = 8;
    record.capacity.storage_bytes = 100LL * 1024 * 1024 * 1024;
    record.capacity.bandwidth_bps = 1000000000;
    
    node_agent n(config, record);
    
    n.start();
    
    CHECK(n.record().udp_port >= config.udp_port_minimum());
    CHECK(n.record().udp_port <= config.udp_port_maximum());
    
    orchestrator o(config);
    
    std::vector<node_record> nodes;
    
    REQUIRE(o.list_nodes(nodes));
    REQUIRE(nodes.size() == 1);
    CHECK(nodes[0].node_id == "node1");
    CHECK(nodes[0].active);
    CHECK(nodes[0].udp_port == n.record().udp_port);
    
    std::shared_ptr<file_transfer> transfer;
    
    REQUIRE(
        o.initiate_transfer("test file.bin", 10 * 1000 * 1000, 1, transfer) ==
        error_code_none
    );
    REQUIRE(transfer);
    
    CHECK(o.transfers().size() == 1);
    
    REQUIRE(o.wait(transfer, std::chrono::milliseconds(15000)));
    
    CHECK(transfer->status() == transfer_status_completed);
    
    auto chunks = transfer->chunks();
    
    REQUIRE(chunks.size() == 20);
    
    for (auto & i : chunks)
    {
        CHECK(i.delivered_to.count("node1") == 1);
    }
    
    o.stop();
    
    CHECK(o.ledger().total() == 0);
    
    /**
     * Heartbeats flow every 100ms.
     */
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    
    while (
        n.heartbeats_acknowledged() == 0 &&
        std::chrono::steady_clock::now() < deadline
        )
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    
    CHECK(n.heartbeats_acknowledged() > 0);
    
    network_stats stats;
    
    REQUIRE(o.stats(stats));
    CHECK(stats.total_nodes == 1);
    CHECK(stats.active_nodes == 1);
    CHECK(stats.total_connections >= 4);
    CHECK(stats.total_data_transferred > 0);
    
    n.stop();
    c.stop();
}
