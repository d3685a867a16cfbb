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

#include <cloudsim/constants.hpp>
#include <cloudsim/liveness_monitor.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/node_registry.hpp>
#include <cloudsim/udp_probe.hpp>

using namespace cloudsim;

liveness_monitor::liveness_monitor(node_registry & registry)
    : m_registry(registry)
    , m_interval(constants::liveness_check_interval_ms)
    , m_timeout(constants::heartbeat_timeout_ms)
    , m_probe_timeout(constants::probe_timeout_ms)
    , timer_(io_service_)
{
    m_probe = [this](const node_record & record)
    {
        return
            udp_probe::probe(record.host, record.udp_port,
            static_cast<std::uint32_t> (m_probe_timeout.count())) ==
            error_code_none
        ;
    };
}

liveness_monitor::~liveness_monitor()
{
    if (thread_.joinable())
    {
        io_service_.stop();
        
        thread_.join();
    }
}

void liveness_monitor::start()
{
    io_service_.reset();
    
    do_tick();
    
    thread_ = std::thread([this]()
    {
        try
        {
            io_service_.run();
        }
        catch (std::exception & e)
        {
            log_error("Liveness monitor thread, what = " << e.what());
        }
    });
}

void liveness_monitor::stop()
{
    io_service_.post([this]()
    {
        timer_.cancel();
    });
    
    if (thread_.joinable())
    {
        thread_.join();
    }
}

std::size_t liveness_monitor::sweep()
{
    /**
     * The registry lock is released before probing.
     */
    auto stale = m_registry.stale_nodes(m_timeout);
    
    for (auto & i : stale)
    {
        log_debug(
            "Liveness monitor probing " << i.node_id << " at " << i.host <<
            ":" << i.udp_port << "."
        );
        
        if (m_probe && m_probe(i))
        {
            log_debug("Liveness monitor probe of " << i.node_id << " succeeded.");
            
            m_registry.on_probe_success(i.node_id);
        }
        else
        {
            log_info("Liveness monitor probe of " << i.node_id << " failed.");
            
            m_registry.on_probe_failure(i.node_id, m_timeout);
        }
    }
    
    return stale.size();
}

void liveness_monitor::set_probe(
    const std::function<bool (const node_record &)> & f
    )
{
    m_probe = f;
}

void liveness_monitor::set_interval(const std::chrono::milliseconds & val)
{
    m_interval = val;
}

void liveness_monitor::set_timeout(const std::chrono::milliseconds & val)
{
    m_timeout = val;
}

void liveness_monitor::set_probe_timeout(
    const std::chrono::milliseconds & val
    )
{
    m_probe_timeout = val;
}

void liveness_monitor::do_tick()
{
    timer_.expires_from_now(m_interval);
    timer_.async_wait([this](boost::system::error_code ec)
    {
        if (ec)
        {
            // ...
        }
        else
        {
            sweep();
            
            do_tick();
        }
    });
}
