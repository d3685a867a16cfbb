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
#include <stdexcept>

#include <catch2/catch.hpp>

#include <cloudsim/placement_planner.hpp>
#include <cloudsim/reservation_ledger.hpp>
#include <cloudsim/transfer_executor.hpp>

using namespace cloudsim;

static std::shared_ptr<file_transfer> make_transfer(
    const std::uint64_t & len, const std::vector<std::string> & targets
    )
{
    auto ret = std::make_shared<file_transfer> (
        "f-1-1", "f", len, placement_planner::make_chunks("f-1-1", len)
    );
    
    ret->set_target_nodes(targets);
    
    return ret;
}

TEST_CASE("chunk delay follows the link bitrate", "[executor]")
{
    transfer_executor executor(100000000, std::chrono::milliseconds(1000));
    
    CHECK(executor.delay_for(1250000, 1.0).count() == 100000);
    CHECK(executor.delay_for(1250000, 1.2).count() == 120000);
    CHECK(executor.delay_for(0, 1.0).count() == 0);
}

TEST_CASE("transfer completes on every target", "[executor]")
{
    reservation_ledger ledger;
    
    std::vector<std::string> targets;
    
    targets.push_back("a");
    targets.push_back("b");
    
    auto transfer = make_transfer(4 * 1024 * 1024, targets);
    
    auto res = std::make_shared<reservation> (
        ledger, targets, transfer->total_size()
    );
    
    REQUIRE(ledger.total() == 2 * transfer->total_size());
    
    transfer_executor executor(1000000000, std::chrono::milliseconds(10000));
    
    CHECK(executor.execute(transfer, res) == transfer_status_completed);
    CHECK(transfer->status() == transfer_status_completed);
    CHECK(transfer->is_complete());
    CHECK(transfer->completed_at() != 0);
    
    auto chunks = transfer->chunks();
    
    REQUIRE(chunks.size() == 8);
    
    for (auto & i : chunks)
    {
        CHECK(i.status == transfer_status_completed);
        CHECK(i.delivered_to.size() == 2);
        CHECK(i.delivered_to.count("a") == 1);
        CHECK(i.delivered_to.count("b") == 1);
    }
    
    CHECK(res->released());
    CHECK(ledger.total() == 0);
}

TEST_CASE("transfer fails at the deadline", "[executor]")
{
    reservation_ledger ledger;
    
    std::vector<std::string> targets(1, "a");
    
    /**
     * 10 MiB at 1 Mbps takes well over a minute.
     */
    auto transfer = make_transfer(10 * 1024 * 1024, targets);
    
    auto res = std::make_shared<reservation> (
        ledger, targets, transfer->total_size()
    );
    
    transfer_executor executor(1000000, std::chrono::milliseconds(100));
    
    auto start = std::chrono::steady_clock::now();
    
    CHECK(executor.execute(transfer, res) == transfer_status_failed);
    
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    CHECK(transfer->status() == transfer_status_failed);
    CHECK_FALSE(transfer->is_complete());
    CHECK(transfer->completed_at() == 0);
    CHECK(transfer->chunks().back().status == transfer_status_failed);
    CHECK(ledger.total() == 0);
}

TEST_CASE("a zero byte transfer completes immediately", "[executor]")
{
    reservation_ledger ledger;
    
    std::vector<std::string> targets(1, "a");
    
    auto transfer = make_transfer(0, targets);
    
    auto res = std::make_shared<reservation> (ledger, targets, 0);
    
    transfer_executor executor(1000000, std::chrono::milliseconds(1000));
    
    CHECK(executor.execute(transfer, res) == transfer_status_completed);
    CHECK(transfer->chunk_count() == 0);
    CHECK(ledger.total() == 0);
}

TEST_CASE("a failing worker still releases the reservation", "[executor]")
{
    reservation_ledger ledger;
    
    std::vector<std::string> targets;
    
    targets.push_back("a");
    targets.push_back("b");
    
    auto transfer = make_transfer(2 * 1024 * 1024, targets);
    
    auto res = std::make_shared<reservation> (
        ledger, targets, transfer->total_size()
    );
    
    REQUIRE(ledger.total() == 2 * transfer->total_size());
    
    transfer_executor executor(1000000000, std::chrono::milliseconds(10000));
    
    executor.set_on_chunk(
        [](const std::string & node_id, const file_chunk & chunk)
    {
        if (node_id == "b" && chunk.chunk_id == 2)
        {
            throw std::runtime_error("disk full");
        }
    });
    
    auto start = std::chrono::steady_clock::now();
    
    CHECK(executor.execute(transfer, res) == transfer_status_failed);
    
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    CHECK(transfer->status() == transfer_status_failed);
    
    auto chunks = transfer->chunks();
    
    REQUIRE(chunks.size() == 4);
    
    for (auto & i : chunks)
    {
        CHECK(i.delivered_to.count("a") == 1);
        CHECK(i.delivered_to.count("b") == (i.chunk_id < 2 ? 1 : 0));
    }
    
    CHECK(chunks[3].status == transfer_status_failed);
    CHECK(res->released());
    CHECK(ledger.total() == 0);
}
