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

#include <cloudsim/logger.hpp>
#include <cloudsim/node_agent.hpp>
#include <cloudsim/protocol.hpp>
#include <cloudsim/rpc_client.hpp>
#include <cloudsim/udp_responder.hpp>

using namespace cloudsim;

node_agent::node_agent(
    const configuration & config, const node_record & record
    )
    : m_configuration(config)
    , m_record(record)
    , m_heartbeats_acknowledged(0)
    , m_heartbeats_failed(0)
    , m_stopping(false)
    , strand_(io_service_)
    , heartbeat_timer_(io_service_)
{
    if (m_record.host.empty())
    {
        m_record.host = "127.0.0.1";
    }
    
    if (m_record.tcp_port == 0)
    {
        m_record.tcp_port = m_configuration.controller_port();
    }
}

node_agent::~node_agent()
{
    stop();
}

void node_agent::start()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    if (work_)
    {
        return;
    }
    
    log_info("Node " << m_record.node_id << " is starting.");
    
    io_service_.reset();
    
    m_stopping = false;
    
    work_.reset(new boost::asio::io_service::work(io_service_));
    
    thread_ = std::thread([this]()
    {
        try
        {
            io_service_.run();
        }
        catch (std::exception & e)
        {
            log_error("Node io_service, what = " << e.what());
        }
    });
    
    try
    {
        /**
         * Allocate and open the udp_responder.
         */
        udp_responder_ = std::make_shared<udp_responder> (
            io_service_, m_record.node_id
        );
        
        udp_responder_->open(
            m_record.udp_port, m_configuration.udp_port_minimum(),
            m_configuration.udp_port_maximum()
        );
        
        m_record.udp_port = udp_responder_->port();
        
        /**
         * Register with the controller.
         */
        message reg = message::create_register(m_record);
        
        if (request(reg, protocol::status_ok) == false)
        {
            throw std::runtime_error(
                "registration with " + m_configuration.controller_host() +
                ":" + std::to_string(m_configuration.controller_port()) +
                " failed"
            );
        }
    }
    catch (std::exception & e)
    {
        log_error("Node " << m_record.node_id << " failed, what = " << e.what());
        
        if (udp_responder_)
        {
            udp_responder_->close();
        }
        
        work_.reset();
        
        if (thread_.joinable())
        {
            thread_.join();
        }
        
        udp_responder_.reset();
        
        throw;
    }
    
    /**
     * Announce that we are active.
     */
    message active = message::create_node_request(
        protocol::action_active_notification, m_record.node_id
    );
    
    if (request(active, protocol::status_ack) == false)
    {
        log_warn(
            "Node " << m_record.node_id << " active notification failed."
        );
    }
    
    /**
     * Start heartbeating.
     */
    strand_.post([this]()
    {
        do_tick();
    });
    
    log_info(
        "Node " << m_record.node_id << " started (udp = " <<
        m_record.udp_port << ")."
    );
}

void node_agent::stop()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    if (!work_)
    {
        return;
    }
    
    log_info("Node " << m_record.node_id << " is stopping.");
    
    m_stopping = true;
    
    strand_.post([this]()
    {
        heartbeat_timer_.cancel();
    });
    
    if (udp_responder_)
    {
        udp_responder_->close();
    }
    
    work_.reset();
    
    if (thread_.joinable())
    {
        thread_.join();
    }
    
    udp_responder_.reset();
}

const node_record & node_agent::record() const
{
    return m_record;
}

std::uint32_t node_agent::heartbeats_acknowledged() const
{
    return m_heartbeats_acknowledged;
}

std::uint32_t node_agent::heartbeats_failed() const
{
    return m_heartbeats_failed;
}

bool node_agent::request(message & request, const std::string & status)
{
    message response;
    
    auto ec = rpc_client::call(
        m_configuration.controller_host(), m_configuration.controller_port(),
        m_configuration.request_timeout_ms(), request, response
    );
    
    if (ec != error_code_none)
    {
        log_error(
            "Node " << m_record.node_id << " " << request.action_name() <<
            " failed, " << error_string(ec) << "."
        );
        
        return false;
    }
    
    if (response.status() != status)
    {
        log_error(
            "Node " << m_record.node_id << " " << request.action_name() <<
            " rejected, message = " << response.error_message() << "."
        );
        
        return false;
    }
    
    return true;
}

void node_agent::do_tick()
{
    if (m_stopping)
    {
        return;
    }
    
    heartbeat_timer_.expires_from_now(
        std::chrono::milliseconds(m_configuration.heartbeat_interval_ms())
    );
    heartbeat_timer_.async_wait(strand_.wrap(
        [this](boost::system::error_code ec)
    {
        if (ec)
        {
            // ...
        }
        else
        {
            send_heartbeat();
            
            do_tick();
        }
    }));
}

void node_agent::send_heartbeat()
{
    message request = message::create_node_request(
        protocol::action_heartbeat, m_record.node_id
    );
    
    auto client = std::make_shared<rpc_client> (
        io_service_, m_configuration.controller_host(),
        m_configuration.controller_port()
    );
    
    client->set_timeout(m_configuration.request_timeout_ms());
    
    client->start(request,
        [this](const error_code_t & ec, const message & response)
    {
        if (ec != error_code_none)
        {
            ++m_heartbeats_failed;
            
            log_warn(
                "Node " << m_record.node_id << " heartbeat failed, " <<
                error_string(ec) << ", retrying."
            );
        }
        else if (response.status() != protocol::status_ack)
        {
            ++m_heartbeats_failed;
            
            log_warn(
                "Node " << m_record.node_id << " heartbeat rejected, "
                "message = " << response.error_message() << "."
            );
        }
        else
        {
            ++m_heartbeats_acknowledged;
            
            log_debug("Node " << m_record.node_id << " heartbeat acknowledged.");
        }
    });
}
