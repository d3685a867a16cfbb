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

#include <algorithm>

#include <cloudsim/constants.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/placement_planner.hpp>
#include <cloudsim/reservation_ledger.hpp>
#include <cloudsim/utility.hpp>

using namespace cloudsim;

placement_planner::placement_planner(
    reservation_ledger & ledger, const node_source_t & f
    )
    : m_ledger(ledger)
    , m_node_source(f)
{
    // ...
}

void placement_planner::set_node_source(const node_source_t & f)
{
    m_node_source = f;
}

error_code_t placement_planner::plan(
    const std::string & file_name, const std::uint64_t & file_size,
    const std::int32_t & replication,
    std::shared_ptr<file_transfer> & transfer,
    std::shared_ptr<reservation> & res
    )
{
    if (replication < 1)
    {
        log_error(
            "Placement planner got replication factor " << replication << "."
        );
        
        return error_code_no_capacity;
    }
    
    std::vector<node_record> nodes;
    
    if (!m_node_source || m_node_source(nodes) == false)
    {
        log_error("Placement planner failed to get the node list.");
        
        return error_code_no_capacity;
    }
    
    /**
     * Rank, select and reserve as one step.
     */
    std::lock_guard<std::mutex> l(mutex_);
    
    auto ranked = rank(nodes, file_size);
    
    if (ranked.empty())
    {
        log_info(
            "Placement planner found no suitable nodes for " << file_name <<
            " (" << file_size << " bytes)."
        );
        
        return error_code_no_capacity;
    }
    
    if (ranked.size() > static_cast<std::size_t> (replication))
    {
        ranked.resize(replication);
    }
    
    std::vector<std::string> targets;
    
    for (auto & i : ranked)
    {
        targets.push_back(i.node_id);
    }
    
    auto file_id = file_transfer::make_file_id(file_name);
    
    transfer = std::make_shared<file_transfer> (
        file_id, file_name, file_size, make_chunks(file_id, file_size)
    );
    
    transfer->set_target_nodes(targets);
    
    /**
     * Reserve on every target.
     */
    res = std::make_shared<reservation> (m_ledger, targets, file_size);
    
    log_info(
        "Placement planner planned " << file_id << " with " <<
        transfer->chunk_count() << " chunks on " << targets.size() <<
        " targets."
    );
    
    return error_code_none;
}

std::vector<node_record> placement_planner::rank(
    const std::vector<node_record> & nodes, const std::uint64_t & file_size
    ) const
{
    std::vector< std::pair<std::uint64_t, node_record> > suitable;
    
    for (auto & i : nodes)
    {
        if (i.active == false)
        {
            continue;
        }
        
        auto available = estimated_available(i);
        
        if (available >= file_size)
        {
            suitable.push_back(std::make_pair(available, i));
        }
    }
    
    std::stable_sort(suitable.begin(), suitable.end(),
        [](const std::pair<std::uint64_t, node_record> & a,
        const std::pair<std::uint64_t, node_record> & b)
    {
        if (a.first != b.first)
        {
            return a.first > b.first;
        }
        
        return a.second.capacity.bandwidth_bps > b.second.capacity.bandwidth_bps;
    });
    
    std::vector<node_record> ret;
    
    for (auto & i : suitable)
    {
        ret.push_back(i.second);
    }
    
    return ret;
}

std::uint64_t placement_planner::estimated_available(
    const node_record & record
    ) const
{
    if (record.capacity.storage_bytes <= 0)
    {
        return 0;
    }
    
    auto storage = static_cast<std::uint64_t> (record.capacity.storage_bytes);
    auto reserved = m_ledger.reserved(record.node_id);
    
    return storage > reserved ? storage - reserved : 0;
}

std::uint64_t placement_planner::chunk_size_for(const std::uint64_t & file_size)
{
    if (file_size < constants::chunk_threshold_small)
    {
        return constants::chunk_size_small;
    }
    else if (file_size < constants::chunk_threshold_medium)
    {
        return constants::chunk_size_medium;
    }
    
    return constants::chunk_size_large;
}

std::vector<file_chunk> placement_planner::make_chunks(
    const std::string & file_id, const std::uint64_t & file_size
    )
{
    std::vector<file_chunk> ret;
    
    auto len = chunk_size_for(file_size);
    
    auto count = (file_size + len - 1) / len;
    
    for (std::uint64_t i = 0; i < count; i++)
    {
        auto part = std::min(len, file_size - i * len);
        
        ret.push_back(
            file_chunk(static_cast<std::uint32_t> (i), part,
            utility::md5_hex(file_id + "-" + std::to_string(i)))
        );
    }
    
    return ret;
}
