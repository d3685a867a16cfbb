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

#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cloudsim/configuration.hpp>
#include <cloudsim/constants.hpp>
#include <cloudsim/logger.hpp>

using namespace cloudsim;

/**
 * The keys the configuration file and the arguments understand.
 */
static const char * g_keys[] =
{
    "controller.host",
    "controller.port",
    "controller.threads",
    "controller.connections.maximum",
    "heartbeat.interval",
    "heartbeat.timeout",
    "liveness.interval",
    "liveness.probe.timeout",
    "transfer.deadline",
    "transfer.link.bps",
    "network.request.timeout",
    "network.udp.port.minimum",
    "network.udp.port.maximum",
    0
};

configuration::configuration()
    : m_controller_host("127.0.0.1")
    , m_controller_port(constants::default_controller_port)
    , m_controller_threads(constants::controller_threads)
    , m_controller_connections_maximum(
        constants::controller_connections_maximum
    )
    , m_heartbeat_interval_ms(constants::heartbeat_interval_ms)
    , m_heartbeat_timeout_ms(constants::heartbeat_timeout_ms)
    , m_liveness_check_interval_ms(constants::liveness_check_interval_ms)
    , m_probe_timeout_ms(constants::probe_timeout_ms)
    , m_transfer_deadline_ms(constants::transfer_deadline_ms)
    , m_request_timeout_ms(constants::tcp_request_timeout_ms)
    , m_simulated_link_bps(constants::simulated_link_bps)
    , m_udp_port_minimum(constants::udp_port_minimum)
    , m_udp_port_maximum(constants::udp_port_maximum)
{
    // ...
}

bool configuration::load(const std::string & path)
{
    log_info("Configuration is loading from " << path << ".");
    
    boost::property_tree::ptree pt;
    
    try
    {
        /**
         * Read the json configuration from disk.
         */
        boost::property_tree::read_json(path, pt);
        
        /**
         * Get the version.
         */
        auto file_version = std::stoul(
            pt.get("version", std::to_string(version))
        );
        
        if (file_version != version)
        {
            log_error(
                "Configuration version " << file_version <<
                " is not supported."
            );
            
            return false;
        }
        
        for (auto i = 0; g_keys[i] != 0; i++)
        {
            auto value = pt.get_optional<std::string> (g_keys[i]);
            
            if (value)
            {
                apply(g_keys[i], *value);
                
                log_debug(
                    "Configuration read " << g_keys[i] << " = " <<
                    *value << "."
                );
            }
        }
    }
    catch (std::exception & e)
    {
        log_error("Configuration failed to load, what = " << e.what() << ".");
    
        return false;
    }
    
    return true;
}

bool configuration::set_args(const std::map<std::string, std::string> & val)
{
    m_args = val;
    
    for (auto & i : m_args)
    {
        for (auto j = 0; g_keys[j] != 0; j++)
        {
            if (i.first == g_keys[j])
            {
                try
                {
                    apply(i.first, i.second);
                }
                catch (std::exception & e)
                {
                    log_error(
                        "Configuration argument " << i.first <<
                        " is invalid, what = " << e.what() << "."
                    );
                    
                    return false;
                }
            }
        }
    }
    
    return true;
}

const std::map<std::string, std::string> & configuration::args() const
{
    return m_args;
}

void configuration::apply(const std::string & key, const std::string & value)
{
    if (key == "controller.host")
    {
        if (value.empty())
        {
            throw std::invalid_argument("empty host");
        }
        
        m_controller_host = value;
    }
    else if (
        key == "network.udp.port.minimum" || key == "network.udp.port.maximum"
        )
    {
        auto port = std::stoul(value);
        
        if (port > 65535)
        {
            throw std::out_of_range("port");
        }
        
        if (key == "network.udp.port.minimum")
        {
            set_udp_port_range(
                static_cast<std::uint16_t> (port), m_udp_port_maximum
            );
        }
        else
        {
            set_udp_port_range(
                m_udp_port_minimum, static_cast<std::uint16_t> (port)
            );
        }
    }
    else if (key == "transfer.link.bps")
    {
        auto bps = std::stoull(value);
        
        if (bps == 0)
        {
            throw std::invalid_argument("zero bitrate");
        }
        
        m_simulated_link_bps = bps;
    }
    else
    {
        auto number = std::stoul(value);
        
        if (key == "controller.port")
        {
            if (number > 65535)
            {
                throw std::out_of_range("port");
            }
            
            m_controller_port = static_cast<std::uint16_t> (number);
        }
        else if (key == "controller.threads")
        {
            /**
             * Enforce the minimum controller.threads.
             */
            m_controller_threads = number > 0 ? number : 1;
        }
        else if (key == "controller.connections.maximum")
        {
            m_controller_connections_maximum = number > 0 ? number : 1;
        }
        else if (key == "heartbeat.interval")
        {
            m_heartbeat_interval_ms = static_cast<std::uint32_t> (number);
        }
        else if (key == "heartbeat.timeout")
        {
            m_heartbeat_timeout_ms = static_cast<std::uint32_t> (number);
        }
        else if (key == "liveness.interval")
        {
            m_liveness_check_interval_ms = static_cast<std::uint32_t> (number);
        }
        else if (key == "liveness.probe.timeout")
        {
            m_probe_timeout_ms = static_cast<std::uint32_t> (number);
        }
        else if (key == "transfer.deadline")
        {
            m_transfer_deadline_ms = static_cast<std::uint32_t> (number);
        }
        else if (key == "network.request.timeout")
        {
            m_request_timeout_ms = static_cast<std::uint32_t> (number);
        }
    }
}

void configuration::set_controller_host(const std::string & val)
{
    m_controller_host = val;
}

const std::string & configuration::controller_host() const
{
    return m_controller_host;
}

void configuration::set_controller_port(const std::uint16_t & val)
{
    m_controller_port = val;
}

const std::uint16_t & configuration::controller_port() const
{
    return m_controller_port;
}

void configuration::set_controller_threads(const std::size_t & val)
{
    m_controller_threads = val > 0 ? val : 1;
}

const std::size_t & configuration::controller_threads() const
{
    return m_controller_threads;
}

void configuration::set_controller_connections_maximum(const std::size_t & val)
{
    m_controller_connections_maximum = val > 0 ? val : 1;
}

const std::size_t & configuration::controller_connections_maximum() const
{
    return m_controller_connections_maximum;
}

void configuration::set_heartbeat_interval_ms(const std::uint32_t & val)
{
    m_heartbeat_interval_ms = val;
}

const std::uint32_t & configuration::heartbeat_interval_ms() const
{
    return m_heartbeat_interval_ms;
}

void configuration::set_heartbeat_timeout_ms(const std::uint32_t & val)
{
    m_heartbeat_timeout_ms = val;
}

const std::uint32_t & configuration::heartbeat_timeout_ms() const
{
    return m_heartbeat_timeout_ms;
}

void configuration::set_liveness_check_interval_ms(const std::uint32_t & val)
{
    m_liveness_check_interval_ms = val;
}

const std::uint32_t & configuration::liveness_check_interval_ms() const
{
    return m_liveness_check_interval_ms;
}

void configuration::set_probe_timeout_ms(const std::uint32_t & val)
{
    m_probe_timeout_ms = val;
}

const std::uint32_t & configuration::probe_timeout_ms() const
{
    return m_probe_timeout_ms;
}

void configuration::set_transfer_deadline_ms(const std::uint32_t & val)
{
    m_transfer_deadline_ms = val;
}

const std::uint32_t & configuration::transfer_deadline_ms() const
{
    return m_transfer_deadline_ms;
}

void configuration::set_request_timeout_ms(const std::uint32_t & val)
{
    m_request_timeout_ms = val;
}

const std::uint32_t & configuration::request_timeout_ms() const
{
    return m_request_timeout_ms;
}

void configuration::set_simulated_link_bps(const std::uint64_t & val)
{
    m_simulated_link_bps = val > 0 ? val : 1;
}

const std::uint64_t & configuration::simulated_link_bps() const
{
    return m_simulated_link_bps;
}

void configuration::set_udp_port_range(
    const std::uint16_t & low, const std::uint16_t & high
    )
{
    if (low == 0 || low > high)
    {
        throw std::invalid_argument("invalid udp port range");
    }
    
    m_udp_port_minimum = low;
    m_udp_port_maximum = high;
}

const std::uint16_t & configuration::udp_port_minimum() const
{
    return m_udp_port_minimum;
}

const std::uint16_t & configuration::udp_port_maximum() const
{
    return m_udp_port_maximum;
}
