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

#include <cloudsim/file_transfer.hpp>
#include <cloudsim/random.hpp>
#include <cloudsim/utility.hpp>

using namespace cloudsim;

std::string cloudsim::transfer_status_string(const transfer_status_t & val)
{
    switch (val)
    {
        case transfer_status_pending:
            return "PENDING";
        case transfer_status_in_progress:
            return "IN_PROGRESS";
        case transfer_status_completed:
            return "COMPLETED";
        case transfer_status_failed:
            return "FAILED";
    }
    
    return "UNKNOWN";
}

file_chunk::file_chunk(
    const std::uint32_t & id, const std::uint64_t & len,
    const std::string & val
    )
    : chunk_id(id)
    , size(len)
    , checksum(val)
    , status(transfer_status_pending)
{
    // ...
}

file_transfer::file_transfer(
    const std::string & file_id, const std::string & file_name,
    const std::uint64_t & total_size, const std::vector<file_chunk> & chunks
    )
    : m_file_id(file_id)
    , m_file_name(file_name)
    , m_total_size(total_size)
    , m_chunks(chunks)
    , m_status(transfer_status_pending)
    , m_created_at(std::time(0))
    , m_completed_at(0)
{
    // ...
}

std::string file_transfer::make_file_id(const std::string & file_name)
{
    std::string ret = file_name;
    
    std::replace(ret.begin(), ret.end(), ' ', '_');
    
    ret += "-" + std::to_string(utility::now_ms());
    ret += "-" + std::to_string(random::uint32_random_range(0, 9999));
    
    return ret;
}

const std::string & file_transfer::file_id() const
{
    return m_file_id;
}

const std::string & file_transfer::file_name() const
{
    return m_file_name;
}

const std::uint64_t & file_transfer::total_size() const
{
    return m_total_size;
}

std::vector<file_chunk> file_transfer::chunks() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    return m_chunks;
}

std::size_t file_transfer::chunk_count() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    return m_chunks.size();
}

void file_transfer::set_target_nodes(const std::vector<std::string> & val)
{
    std::lock_guard<std::mutex> l(mutex_);
    
    m_target_nodes = val;
}

std::vector<std::string> file_transfer::target_nodes() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    return m_target_nodes;
}

transfer_status_t file_transfer::status() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    return m_status;
}

void file_transfer::mark_in_progress()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    m_status = transfer_status_in_progress;
}

void file_transfer::mark_delivered(
    const std::size_t & index, const std::string & node_id
    )
{
    std::lock_guard<std::mutex> l(mutex_);
    
    if (index >= m_chunks.size())
    {
        return;
    }
    
    auto & chunk = m_chunks[index];
    
    chunk.delivered_to.insert(node_id);
    
    auto all = std::all_of(
        m_target_nodes.begin(), m_target_nodes.end(),
        [&chunk](const std::string & target)
        {
            return chunk.delivered_to.count(target) > 0;
        }
    );
    
    chunk.status = all ? transfer_status_completed : transfer_status_in_progress;
}

bool file_transfer::is_complete() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    return is_complete_locked();
}

void file_transfer::mark_completed()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    m_status = transfer_status_completed;
    m_completed_at = std::time(0);
    
    condition_.notify_all();
}

void file_transfer::mark_failed()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    m_status = transfer_status_failed;
    
    for (auto & i : m_chunks)
    {
        if (i.status != transfer_status_completed)
        {
            i.status = transfer_status_failed;
        }
    }
    
    condition_.notify_all();
}

bool file_transfer::wait(const std::chrono::milliseconds & timeout) const
{
    std::unique_lock<std::mutex> l(mutex_);
    
    return condition_.wait_for(l, timeout, [this]()
    {
        return
            m_status == transfer_status_completed ||
            m_status == transfer_status_failed
        ;
    });
}

const std::time_t & file_transfer::created_at() const
{
    return m_created_at;
}

std::time_t file_transfer::completed_at() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    return m_completed_at;
}

bool file_transfer::is_complete_locked() const
{
    if (m_target_nodes.empty())
    {
        return false;
    }
    
    for (auto & i : m_chunks)
    {
        for (auto & j : m_target_nodes)
        {
            if (i.delivered_to.count(j) == 0)
            {
                return false;
            }
        }
    }
    
    return true;
}
