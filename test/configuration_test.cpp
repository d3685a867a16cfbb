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

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include <catch2/catch.hpp>

#include <cloudsim/configuration.hpp>

using namespace cloudsim;

TEST_CASE("configuration defaults", "[configuration]")
{
    configuration config;
    
    CHECK(config.controller_host() == "127.0.0.1");
    CHECK(config.controller_port() == 8080);
    CHECK(config.controller_threads() == 4);
    CHECK(config.controller_connections_maximum() == 128);
    CHECK(config.heartbeat_interval_ms() == 2000);
    CHECK(config.heartbeat_timeout_ms() == 10000);
    CHECK(config.liveness_check_interval_ms() == 5000);
    CHECK(config.probe_timeout_ms() == 1000);
    CHECK(config.transfer_deadline_ms() == 30000);
    CHECK(config.simulated_link_bps() == 100000000);
    CHECK(config.udp_port_minimum() == 5001);
    CHECK(config.udp_port_maximum() == 9000);
}

TEST_CASE("configuration arguments", "[configuration]")
{
    configuration config;
    
    std::map<std::string, std::string> args;
    
    args["controller.port"] = "9090";
    args["controller.threads"] = "0";
    args["heartbeat.interval"] = "250";
    args["transfer.link.bps"] = "1000000000";
    args["network.udp.port.minimum"] = "6000";
    args["unrelated"] = "ignored";
    
    REQUIRE(config.set_args(args));
    
    CHECK(config.controller_port() == 9090);
    CHECK(config.controller_threads() == 1);
    CHECK(config.heartbeat_interval_ms() == 250);
    CHECK(config.simulated_link_bps() == 1000000000);
    CHECK(config.udp_port_minimum() == 6000);
    CHECK(config.args().size() == 6);
    
    SECTION("bad values are rejected")
    {
        std::map<std::string, std::string> bad;
        
        bad["controller.port"] = "70000";
        
        CHECK_FALSE(config.set_args(bad));
        
        bad["controller.port"] = "abc";
        
        CHECK_FALSE(config.set_args(bad));
        
        CHECK(config.controller_port() == 9090);
    }
    
    SECTION("the udp port range must be ordered")
    {
        std::map<std::string, std::string> bad;
        
        bad["network.udp.port.maximum"] = "5000";
        
        CHECK_FALSE(config.set_args(bad));
        CHECK_THROWS_AS(
            config.set_udp_port_range(0, 10), std::invalid_argument
        );
    }
}

TEST_CASE("configuration file", "[configuration]")
{
    std::string path = "cloudsim_configuration_test.json";
    
    SECTION("known keys are applied")
    {
        {
            std::ofstream ofs(path);
            
            ofs <<
                "{\"version\": 1, \"controller\": {\"host\": \"10.1.1.1\", "
                "\"port\": 7000, \"connections\": {\"maximum\": 16}}, "
                "\"liveness\": {\"interval\": 100, \"probe\": "
                "{\"timeout\": 50}}, \"transfer\": {\"deadline\": 1500}}"
            ;
        }
        
        configuration config;
        
        REQUIRE(config.load(path));
        
        CHECK(config.controller_host() == "10.1.1.1");
        CHECK(config.controller_port() == 7000);
        CHECK(config.controller_connections_maximum() == 16);
        CHECK(config.liveness_check_interval_ms() == 100);
        CHECK(config.probe_timeout_ms() == 50);
        CHECK(config.transfer_deadline_ms() == 1500);
    }
    
    SECTION("an unsupported version is rejected")
    {
        {
            std::ofstream ofs(path);
            
            ofs << "{\"version\": 2}";
        }
        
        configuration config;
        
        CHECK_FALSE(config.load(path));
    }
    
    SECTION("a missing file is rejected")
    {
        configuration config;
        
        CHECK_FALSE(config.load("does_not_exist.json"));
    }
    
    std::remove(path.c_str());
}
