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

#include <cloudsim/file_transfer.hpp>
#include <cloudsim/reservation_ledger.hpp>

using namespace cloudsim;

TEST_CASE("file ids", "[transfer]")
{
    auto file_id = file_transfer::make_file_id("my big file.bin");
    
    REQUIRE(file_id.find("my_big_file.bin-") == 0);
    
    auto rest = file_id.substr(std::string("my_big_file.bin-").size());
    auto dash = rest.find('-');
    
    REQUIRE(dash != std::string::npos);
    
    auto ms = std::stoull(rest.substr(0, dash));
    auto suffix = std::stoul(rest.substr(dash + 1));
    
    CHECK(ms > 0);
    CHECK(suffix <= 9999);
}

TEST_CASE("delivery tracking per chunk and target", "[transfer]")
{
    std::vector<file_chunk> chunks;
    
    chunks.push_back(file_chunk(0, 10, "x"));
    chunks.push_back(file_chunk(1, 5, "y"));
    
    file_transfer transfer("f-1-1", "f", 15, chunks);
    
    std::vector<std::string> targets;
    
    targets.push_back("a");
    targets.push_back("b");
    
    transfer.set_target_nodes(targets);
    
    CHECK_FALSE(transfer.is_complete());
    
    transfer.mark_delivered(0, "a");
    
    CHECK(transfer.chunks()[0].status == transfer_status_in_progress);
    
    transfer.mark_delivered(0, "b");
    transfer.mark_delivered(1, "a");
    
    CHECK(transfer.chunks()[0].status == transfer_status_completed);
    CHECK_FALSE(transfer.is_complete());
    
    /**
     * Out of range indexes are ignored.
     */
    transfer.mark_delivered(7, "a");
    transfer.mark_delivered(1, "b");
    
    CHECK(transfer.is_complete());
}

TEST_CASE("failing marks undelivered chunks", "[transfer]")
{
    std::vector<file_chunk> chunks;
    
    chunks.push_back(file_chunk(0, 10, "x"));
    chunks.push_back(file_chunk(1, 5, "y"));
    
    file_transfer transfer("f-1-1", "f", 15, chunks);
    
    transfer.set_target_nodes(std::vector<std::string> (1, "a"));
    transfer.mark_in_progress();
    transfer.mark_delivered(0, "a");
    transfer.mark_failed();
    
    auto out = transfer.chunks();
    
    CHECK(transfer.status() == transfer_status_failed);
    CHECK(out[0].status == transfer_status_completed);
    CHECK(out[1].status == transfer_status_failed);
    CHECK(transfer_status_string(transfer.status()) == "FAILED");
}

TEST_CASE("waiting for a terminal status", "[transfer]")
{
    file_transfer transfer("f-1-1", "f", 0, std::vector<file_chunk> ());
    
    CHECK_FALSE(transfer.wait(std::chrono::milliseconds(10)));
    
    std::thread t([&transfer]()
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        
        transfer.mark_completed();
    });
    
    CHECK(transfer.wait(std::chrono::milliseconds(5000)));
    CHECK(transfer.status() == transfer_status_completed);
    
    t.join();
}

TEST_CASE("reservations release exactly once", "[ledger]")
{
    reservation_ledger ledger;
    
    std::vector<std::string> nodes;
    
    nodes.push_back("a");
    nodes.push_back("b");
    
    reservation other(ledger, std::vector<std::string> (1, "a"), 7);
    
    {
        reservation res(ledger, nodes, 100);
        
        CHECK(ledger.reserved("a") == 107);
        CHECK(ledger.reserved("b") == 100);
        
        res.release();
        res.release();
        
        CHECK(res.released());
        CHECK(ledger.reserved("a") == 7);
        CHECK(ledger.reserved("b") == 0);
    }
    
    CHECK(ledger.reserved("a") == 7);
    
    {
        reservation res(ledger, nodes, 50);
        
        CHECK(ledger.total() == 107);
    }
    
    CHECK(ledger.total() == 7);
    
    /**
     * Never below zero.
     */
    ledger.release("b", 1000);
    
    CHECK(ledger.reserved("b") == 0);
}
