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

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <boost/asio.hpp>

#include <catch2/catch.hpp>

#include <cloudsim/liveness_monitor.hpp>
#include <cloudsim/node_registry.hpp>
#include <cloudsim/udp_probe.hpp>
#include <cloudsim/udp_responder.hpp>

using namespace cloudsim;

static node_record make_record(
    const std::string & node_id, const std::uint16_t & udp_port
    )
{
    node_record ret;
    
    ret.node_id = node_id;
    ret.host = "127.0.0.1";
    ret.udp_port = udp_port;
    ret.capacity.storage_bytes = 100;
    
    return ret;
}

/**
 * Runs a udp_responder on its own io_service for the lifetime of the
 * object.
 */
class responder_fixture
{
    public:
    
        responder_fixture()
            : work_(new boost::asio::io_service::work(io_service_))
        {
            responder_ = std::make_shared<udp_responder> (io_service_, "node1");
            responder_->open(0, 20000, 40000);
            
            thread_ = std::thread([this]() { io_service_.run(); });
        }
    
        ~responder_fixture()
        {
            responder_->close();
            work_.reset();
            thread_.join();
        }
    
        std::uint16_t port() const
        {
            return responder_->port();
        }
    
    private:
    
        boost::asio::io_service io_service_;
        std::unique_ptr<boost::asio::io_service::work> work_;
        std::shared_ptr<udp_responder> responder_;
        std::thread thread_;
};

static std::uint16_t unused_udp_port()
{
    boost::asio::io_service ios;
    
    boost::asio::ip::udp::socket socket(
        ios, boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), 0)
    );
    
    return socket.local_endpoint().port();
}

TEST_CASE("sweep with an injected probe", "[liveness]")
{
    node_registry registry;
    liveness_monitor monitor(registry);
    
    monitor.set_timeout(std::chrono::milliseconds(10));
    
    REQUIRE(registry.register_node(make_record("a", 0)) == error_code_none);
    
    std::atomic<int> probes(0);
    
    SECTION("fresh nodes are not probed")
    {
        monitor.set_probe([&probes](const node_record &)
        {
            ++probes;
            
            return false;
        });
        
        CHECK(monitor.sweep() == 0);
        CHECK(probes == 0);
    }
    
    SECTION("a failed probe marks the node inactive and keeps it")
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        
        monitor.set_probe([&probes](const node_record &)
        {
            ++probes;
            
            return false;
        });
        
        CHECK(monitor.sweep() == 1);
        CHECK(probes == 1);
        
        auto nodes = registry.list_nodes();
        
        REQUIRE(nodes.size() == 1);
        CHECK_FALSE(nodes[0].active);
    }
    
    SECTION("a successful probe refreshes the node")
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        
        monitor.set_probe([&probes](const node_record & record)
        {
            ++probes;
            
            return record.node_id == "a";
        });
        
        CHECK(monitor.sweep() == 1);
        
        node_record record;
        
        REQUIRE(registry.find("a", record));
        CHECK(record.active);
        CHECK(registry.stale_nodes(std::chrono::milliseconds(10)).empty());
    }
}

TEST_CASE("udp probe against a responder", "[liveness][udp]")
{
    responder_fixture responder;
    
    REQUIRE(responder.port() >= 20000);
    REQUIRE(responder.port() <= 40000);
    
    CHECK(udp_probe::probe("127.0.0.1", responder.port(), 1000) == error_code_none);
    CHECK(udp_probe::probe("127.0.0.1", 0, 1000) == error_code_probe_timeout);
    CHECK(
        udp_probe::probe("127.0.0.1", unused_udp_port(), 200) !=
        error_code_none
    );
}

TEST_CASE("sweep with the udp probe", "[liveness][udp]")
{
    responder_fixture responder;
    
    node_registry registry;
    liveness_monitor monitor(registry);
    
    monitor.set_timeout(std::chrono::milliseconds(10));
    monitor.set_probe_timeout(std::chrono::milliseconds(500));
    
    REQUIRE(
        registry.register_node(make_record("alive", responder.port())) ==
        error_code_none
    );
    REQUIRE(registry.register_node(make_record("silent", 0)) == error_code_none);
    
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    
    CHECK(monitor.sweep() == 2);
    
    auto nodes = registry.list_nodes();
    
    REQUIRE(nodes.size() == 2);
    CHECK(nodes[0].active);
    CHECK_FALSE(nodes[1].active);
}

TEST_CASE("monitor thread sweeps periodically", "[liveness]")
{
    node_registry registry;
    liveness_monitor monitor(registry);
    
    monitor.set_interval(std::chrono::milliseconds(20));
    monitor.set_timeout(std::chrono::milliseconds(10));
    monitor.set_probe([](const node_record &) { return false; });
    
    REQUIRE(registry.register_node(make_record("a", 0)) == error_code_none);
    
    monitor.start();
    
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    
    node_record record;
    
    while (std::chrono::steady_clock::now() < deadline)
    {
        REQUIRE(registry.find("a", record));
        
        if (record.active == false)
        {
            break;
        }
        
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    
    monitor.stop();
    
    CHECK_FALSE(record.active);
}
