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

#include <cloudsim/logger.hpp>
#include <cloudsim/node_registry.hpp>

using namespace cloudsim;

node_registry::node_registry()
    : m_total_connections(0)
    , m_total_data_transferred(0)
{
    // ...
}

error_code_t node_registry::register_node(const node_record & record)
{
    if (validate(record) == false)
    {
        return error_code_validation;
    }
    
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    node_record r = record;
    
    r.registered_at = std::time(0);
    r.last_seen = std::chrono::steady_clock::now();
    r.active = true;
    
    auto it = find_node(r.node_id);
    
    if (it == m_nodes.end())
    {
        log_info(
            "Node registry registered " << r.node_id << " (" << r.host <<
            ":" << r.tcp_port << ", udp " << r.udp_port << ")."
        );
        
        m_nodes.push_back(r);
    }
    else
    {
        log_info("Node registry re-registered " << r.node_id << ".");
        
        *it = r;
    }
    
    return error_code_none;
}

error_code_t node_registry::heartbeat(const std::string & node_id)
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    auto it = find_node(node_id);
    
    if (it == m_nodes.end())
    {
        return error_code_not_registered;
    }
    
    it->last_seen = std::chrono::steady_clock::now();
    
    return error_code_none;
}

error_code_t node_registry::notify_active(const std::string & node_id)
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    auto it = find_node(node_id);
    
    if (it == m_nodes.end())
    {
        return error_code_not_registered;
    }
    
    it->active = true;
    it->last_seen = std::chrono::steady_clock::now();
    
    log_debug("Node registry marked " << node_id << " active.");
    
    return error_code_none;
}

std::vector<node_record> node_registry::list_nodes() const
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    return m_nodes;
}

bool node_registry::find(
    const std::string & node_id, node_record & record
    ) const
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    for (auto & i : m_nodes)
    {
        if (i.node_id == node_id)
        {
            record = i;
            
            return true;
        }
    }
    
    return false;
}

network_stats node_registry::stats() const
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    network_stats ret;
    
    ret.total_nodes = m_nodes.size();
    ret.total_connections = m_total_connections;
    ret.total_data_transferred = m_total_data_transferred;
    
    for (auto & i : m_nodes)
    {
        if (i.active)
        {
            ret.active_nodes++;
        }
        
        ret.total_storage_capacity += i.capacity.storage_bytes;
        ret.total_bandwidth_capacity += i.capacity.bandwidth_bps;
    }
    
    return ret;
}

std::vector<node_record> node_registry::stale_nodes(
    const std::chrono::milliseconds & timeout
    ) const
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    std::vector<node_record> ret;
    
    auto now = std::chrono::steady_clock::now();
    
    for (auto & i : m_nodes)
    {
        if (now - i.last_seen > timeout)
        {
            ret.push_back(i);
        }
    }
    
    return ret;
}

void node_registry::on_probe_success(const std::string & node_id)
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    auto it = find_node(node_id);
    
    if (it != m_nodes.end())
    {
        it->last_seen = std::chrono::steady_clock::now();
        it->active = true;
    }
}

void node_registry::on_probe_failure(
    const std::string & node_id, const std::chrono::milliseconds & timeout
    )
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    auto it = find_node(node_id);
    
    if (it == m_nodes.end())
    {
        return;
    }
    
    /**
     * A heartbeat may have arrived while probing.
     */
    if (std::chrono::steady_clock::now() - it->last_seen > timeout)
    {
        if (it->active)
        {
            log_warn("Node registry marking " << node_id << " inactive.");
            
            it->active = false;
        }
    }
}

void node_registry::on_connection()
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    m_total_connections++;
}

void node_registry::on_bytes(const std::size_t & len)
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    m_total_data_transferred += len;
}

bool node_registry::validate(const node_record & record)
{
    if (record.node_id.empty())
    {
        return false;
    }
    
    if (
        record.capacity.cpu_cores < 0 || record.capacity.memory_gb < 0 ||
        record.capacity.storage_bytes < 0 ||
        record.capacity.bandwidth_bps < 0
        )
    {
        return false;
    }
    
    return true;
}

std::vector<node_record>::iterator node_registry::find_node(
    const std::string & node_id
    )
{
    auto it = m_nodes.begin();
    
    for (; it != m_nodes.end(); ++it)
    {
        if (it->node_id == node_id)
        {
            break;
        }
    }
    
    return it;
}
