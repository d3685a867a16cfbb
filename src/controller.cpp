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

#include <limits>
#include <stdexcept>

#include <cloudsim/constants.hpp>
#include <cloudsim/controller.hpp>
#include <cloudsim/error.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/tcp_acceptor.hpp>

using namespace cloudsim;

controller::controller(const configuration & config)
    : m_configuration(config)
    , m_liveness_monitor(m_registry)
    , m_port(0)
{
    m_liveness_monitor.set_interval(
        std::chrono::milliseconds(m_configuration.liveness_check_interval_ms())
    );
    m_liveness_monitor.set_timeout(
        std::chrono::milliseconds(m_configuration.heartbeat_timeout_ms())
    );
    m_liveness_monitor.set_probe_timeout(
        std::chrono::milliseconds(m_configuration.probe_timeout_ms())
    );
}

controller::~controller()
{
    stop();
}

void controller::start()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    if (work_)
    {
        return;
    }
    
    log_info("Controller is starting.");
    
    /**
     * Reset the boost::asio::io_service.
     */
    io_service_.reset();
    
    /**
     * Allocate the boost::asio::io_service::work.
     */
    work_.reset(new boost::asio::io_service::work(io_service_));
    
    /**
     * Allocate the tcp_acceptor.
     */
    tcp_acceptor_.reset(
        new tcp_acceptor(
        io_service_, m_configuration.controller_connections_maximum())
    );
    
    tcp_acceptor_->set_on_accept(
        [this](const boost::asio::ip::tcp::endpoint & ep)
    {
        m_registry.on_connection();
    });
    
    tcp_acceptor_->set_on_request(
        [this](const char * buf, const std::size_t & len)
    {
        return handle_request(buf, len);
    });
    
    try
    {
        /**
         * Open the tcp_acceptor.
         */
        tcp_acceptor_->open(
            m_configuration.controller_host(),
            m_configuration.controller_port()
        );
    }
    catch (std::exception & e)
    {
        log_error("Controller failed to listen, what = " << e.what());
        
        tcp_acceptor_.reset();
        work_.reset();
        
        throw std::runtime_error(
            "controller failed to listen on port " +
            std::to_string(m_configuration.controller_port()) + ": " +
            e.what()
        );
    }
    
    m_port = tcp_acceptor_->local_endpoint().port();
    
    /**
     * Allocate the threads.
     */
    for (std::size_t i = 0; i < m_configuration.controller_threads(); i++)
    {
        auto thread = std::make_shared<std::thread> (
            std::bind(&controller::loop, this)
        );
        
        /**
         * Retain the thread.
         */
        threads_.push_back(thread);
    }
    
    /**
     * Start the liveness_monitor.
     */
    m_liveness_monitor.start();
    
    log_info(
        "Controller listening on TCP " << m_port << " with " <<
        threads_.size() << " threads."
    );
}

void controller::stop()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    if (!work_)
    {
        return;
    }
    
    log_info("Controller is stopping.");
    
    /**
     * Stop the liveness_monitor.
     */
    m_liveness_monitor.stop();
    
    /**
     * Close the tcp_acceptor.
     */
    if (tcp_acceptor_)
    {
        tcp_acceptor_->close();
    }
    
    /**
     * Reset the work, the threads exit once the closed sockets drain.
     */
    work_.reset();
    
    /**
     * Join the threads.
     */
    for (auto & i : threads_)
    {
        if (i->joinable())
        {
            i->join();
        }
    }
    
    /**
     * Clear the threads.
     */
    threads_.clear();
    
    tcp_acceptor_.reset();
    
    log_info("Controller stopped.");
}

std::uint16_t controller::port() const
{
    return m_port;
}

std::string controller::handle_request(
    const char * buf, const std::size_t & len
    )
{
    m_registry.on_bytes(len);
    
    message request(buf, len);
    
    message response;
    
    if (request.decode())
    {
        response = handle_message(request);
    }
    else
    {
        response = message::create_error(
            error_string(error_code_malformed_message) +
            ": could not decode JSON object"
        );
    }
    
    if (response.encode() == false)
    {
        return std::string();
    }
    
    m_registry.on_bytes(response.size());
    
    return response.str();
}

message controller::handle_message(const message & request)
{
    switch (request.action())
    {
        case protocol::action_register:
        {
            return handle_register(request);
        }
        break;
        case protocol::action_heartbeat:
        {
            return handle_heartbeat(request);
        }
        break;
        case protocol::action_active_notification:
        {
            return handle_active_notification(request);
        }
        break;
        case protocol::action_list_nodes:
        {
            return handle_list_nodes(request);
        }
        break;
        case protocol::action_stats:
        {
            return handle_stats(request);
        }
        break;
        default:
        break;
    }
    
    log_debug("Controller got unknown action " << request.action_name() << ".");
    
    return message::create_error("Unknown action: " + request.action_name());
}

liveness_monitor & controller::monitor()
{
    return m_liveness_monitor;
}

node_registry & controller::registry()
{
    return m_registry;
}

void controller::loop()
{
    for (;;)
    {
        try
        {
            io_service_.run();
            
            break;
        }
        catch (const boost::system::system_error & e)
        {
            log_error("Controller io_service, what = " << e.what());
        }
    }
}

message controller::handle_register(const message & request)
{
    const auto & pt = request.ptree();
    
    node_record record;
    
    try
    {
        record.node_id = pt.get<std::string> ("node_id", "");
        record.host = pt.get<std::string> ("host", "127.0.0.1");
        
        auto tcp_port = pt.get<std::int64_t> (
            "tcp_port", m_configuration.controller_port()
        );
        auto udp_port = pt.get<std::int64_t> ("port", 0);
        
        if (
            tcp_port < 0 || tcp_port > std::numeric_limits<std::uint16_t>::max()
            )
        {
            return message::create_error(
                error_string(error_code_validation) + ": tcp_port out of range"
            );
        }
        
        if (
            udp_port < 0 || udp_port > std::numeric_limits<std::uint16_t>::max()
            )
        {
            return message::create_error(
                error_string(error_code_validation) + ": port out of range"
            );
        }
        
        record.tcp_port = static_cast<std::uint16_t> (tcp_port);
        record.udp_port = static_cast<std::uint16_t> (udp_port);
        
        record.capacity.cpu_cores = pt.get<std::int64_t> (
            "capacity.cpu", constants::default_cpu
        );
        record.capacity.memory_gb = pt.get<std::int64_t> (
            "capacity.memory", constants::default_memory_gb
        );
        record.capacity.storage_bytes = pt.get<std::int64_t> (
            "capacity.storage", constants::default_storage_bytes
        );
        record.capacity.bandwidth_bps = pt.get<std::int64_t> (
            "capacity.bandwidth", constants::default_bandwidth_bps
        );
    }
    catch (std::exception & e)
    {
        return message::create_error(
            error_string(error_code_validation) + ": " + e.what()
        );
    }
    
    if (record.node_id.empty())
    {
        return message::create_error(
            error_string(error_code_validation) + ": node_id is required"
        );
    }
    
    if (m_registry.register_node(record) != error_code_none)
    {
        return message::create_error(
            error_string(error_code_validation) +
            ": capacity must be non-negative"
        );
    }
    
    return message::create_status(protocol::status_ok);
}

message controller::handle_heartbeat(const message & request)
{
    if (m_registry.heartbeat(request.node_id()) == error_code_none)
    {
        return message::create_status(protocol::status_ack);
    }
    
    return message::create_error(error_string(error_code_not_registered));
}

message controller::handle_active_notification(const message & request)
{
    if (m_registry.notify_active(request.node_id()) == error_code_none)
    {
        log_info("Controller node " << request.node_id() << " is now active.");
        
        return message::create_status(protocol::status_ack);
    }
    
    return message::create_error(error_string(error_code_not_registered));
}

message controller::handle_list_nodes(const message & request)
{
    return message::create_node_list(m_registry.list_nodes());
}

message controller::handle_stats(const message & request)
{
    return message::create_stats(m_registry.stats());
}
