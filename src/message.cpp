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

#include <sstream>

#include <boost/property_tree/json_parser.hpp>

#include <cloudsim/json_parser.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/message.hpp>

using namespace cloudsim;

message::message()
    : m_action(protocol::action_none)
{
    // ...
}

message::message(const protocol::action_t & action)
    : m_action(action)
    , m_action_name(protocol::action_to_string(action))
{
    put_string("action", m_action_name);
}

message::message(const char * buf, const std::size_t & len)
    : m_action(protocol::action_none)
    , m_data(buf, len)
{
    // ...
}

bool message::encode()
{
    try
    {
        std::stringstream ss;
        
        /**
         * Write the property tree as (typed) JSON.
         */
        json_parser::write_json(ss, m_ptree, false);
        
        m_data = ss.str();
    }
    catch (std::exception & e)
    {
        log_error("Message failed to encode, what = " << e.what() << ".");
        
        return false;
    }
    
    return true;
}

bool message::decode()
{
    if (m_data.empty())
    {
        return false;
    }
    
    try
    {
        std::stringstream ss;
        
        ss << m_data;
        
        m_ptree.clear();
        
        boost::property_tree::read_json(ss, m_ptree);
        
        /**
         * Get the action (responses carry none).
         */
        m_action_name = m_ptree.get<std::string> ("action", "");
        
        m_action = protocol::action_from_string(m_action_name);
    }
    catch (std::exception & e)
    {
        log_debug("Message failed to decode, what = " << e.what() << ".");
        
        return false;
    }
    
    return true;
}

const char * message::data() const
{
    return m_data.data();
}

std::size_t message::size() const
{
    return m_data.size();
}

const std::string & message::str() const
{
    return m_data;
}

const protocol::action_t & message::action() const
{
    return m_action;
}

const std::string & message::action_name() const
{
    return m_action_name;
}

boost::property_tree::ptree & message::ptree()
{
    return m_ptree;
}

const boost::property_tree::ptree & message::ptree() const
{
    return m_ptree;
}

void message::put_string(const std::string & key, const std::string & val)
{
    m_ptree.put(key, val, json_parser::translator<std::string> ());
}

std::string message::status() const
{
    return m_ptree.get<std::string> ("status", "");
}

std::string message::error_message() const
{
    return m_ptree.get<std::string> ("message", "");
}

std::string message::node_id() const
{
    return m_ptree.get<std::string> ("node_id", "");
}

bool message::nodes(std::vector<node_record> & nodes_out) const
{
    auto it = m_ptree.find("nodes");
    
    if (it == m_ptree.not_found())
    {
        return false;
    }
    
    try
    {
        for (auto & i : it->second)
        {
            const auto & pt = i.second;
            
            node_record record;
            
            record.node_id = pt.get<std::string> ("node_id");
            record.host = pt.get<std::string> ("host", "");
            record.tcp_port = pt.get<std::uint16_t> ("tcp_port", 0);
            record.udp_port = pt.get<std::uint16_t> ("udp_port", 0);
            record.active = pt.get<bool> ("active", false);
            record.capacity.cpu_cores = pt.get<std::int64_t> (
                "capacity.cpu", 0
            );
            record.capacity.memory_gb = pt.get<std::int64_t> (
                "capacity.memory", 0
            );
            record.capacity.storage_bytes = pt.get<std::int64_t> (
                "capacity.storage", 0
            );
            record.capacity.bandwidth_bps = pt.get<std::int64_t> (
                "capacity.bandwidth", 0
            );
            
            nodes_out.push_back(record);
        }
    }
    catch (std::exception & e)
    {
        log_error("Message failed to read nodes, what = " << e.what() << ".");
        
        return false;
    }
    
    return true;
}

bool message::stats(network_stats & stats_out) const
{
    try
    {
        const auto & pt = m_ptree.get_child("stats");
        
        stats_out.total_nodes = pt.get<std::size_t> ("total_nodes");
        stats_out.active_nodes = pt.get<std::size_t> ("active_nodes");
        stats_out.total_connections = pt.get<std::uint64_t> (
            "total_connections"
        );
        stats_out.total_data_transferred = pt.get<std::uint64_t> (
            "total_data_transferred"
        );
        stats_out.total_storage_capacity = pt.get<std::int64_t> (
            "total_storage_capacity"
        );
        stats_out.total_bandwidth_capacity = pt.get<std::int64_t> (
            "total_bandwidth_capacity"
        );
    }
    catch (std::exception & e)
    {
        log_error("Message failed to read stats, what = " << e.what() << ".");
        
        return false;
    }
    
    return true;
}

message message::create_status(const std::string & status)
{
    message ret;
    
    ret.put_string("status", status);
    
    return ret;
}

message message::create_error(const std::string & what)
{
    message ret = create_status(protocol::status_error);
    
    ret.put_string("message", what);
    
    return ret;
}

message message::create_register(const node_record & record)
{
    message ret(protocol::action_register);
    
    ret.put_string("node_id", record.node_id);
    ret.put_string("host", record.host);
    ret.ptree().put("tcp_port", record.tcp_port);
    ret.ptree().put("port", record.udp_port);
    ret.ptree().put("capacity.cpu", record.capacity.cpu_cores);
    ret.ptree().put("capacity.memory", record.capacity.memory_gb);
    ret.ptree().put("capacity.storage", record.capacity.storage_bytes);
    ret.ptree().put("capacity.bandwidth", record.capacity.bandwidth_bps);
    
    return ret;
}

message message::create_node_request(
    const protocol::action_t & action, const std::string & node_id
    )
{
    message ret(action);
    
    ret.put_string("node_id", node_id);
    
    return ret;
}

message message::create_node_list(const std::vector<node_record> & nodes)
{
    message ret = create_status(protocol::status_ok);
    
    boost::property_tree::ptree pt_nodes;
    
    for (auto & i : nodes)
    {
        boost::property_tree::ptree pt;
        
        pt.put("node_id", i.node_id, json_parser::translator<std::string> ());
        pt.put("host", i.host, json_parser::translator<std::string> ());
        pt.put("tcp_port", i.tcp_port);
        pt.put("udp_port", i.udp_port);
        pt.put("active", i.active);
        pt.put("capacity.cpu", i.capacity.cpu_cores);
        pt.put("capacity.memory", i.capacity.memory_gb);
        pt.put("capacity.storage", i.capacity.storage_bytes);
        pt.put("capacity.bandwidth", i.capacity.bandwidth_bps);
        
        pt_nodes.push_back(std::make_pair("", pt));
    }
    
    ret.ptree().put_child("nodes", pt_nodes);
    
    return ret;
}

message message::create_stats(const network_stats & stats)
{
    message ret = create_status(protocol::status_ok);
    
    ret.ptree().put("stats.total_nodes", stats.total_nodes);
    ret.ptree().put("stats.active_nodes", stats.active_nodes);
    ret.ptree().put("stats.total_connections", stats.total_connections);
    ret.ptree().put(
        "stats.total_data_transferred", stats.total_data_transferred
    );
    ret.ptree().put(
        "stats.total_storage_capacity", stats.total_storage_capacity
    );
    ret.ptree().put(
        "stats.total_bandwidth_capacity", stats.total_bandwidth_capacity
    );
    
    return ret;
}
