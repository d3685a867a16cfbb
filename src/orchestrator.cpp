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
#include <cloudsim/orchestrator.hpp>
#include <cloudsim/protocol.hpp>
#include <cloudsim/rpc_client.hpp>

using namespace cloudsim;

orchestrator::orchestrator(const configuration & config)
    : m_configuration(config)
    , m_placement_planner(
        m_ledger, std::bind(&orchestrator::list_nodes, this,
        std::placeholders::_1)
    )
    , m_transfer_executor(
        m_configuration.simulated_link_bps(),
        std::chrono::milliseconds(m_configuration.transfer_deadline_ms())
    )
{
    // ...
}

orchestrator::~orchestrator()
{
    stop();
}

error_code_t orchestrator::initiate_transfer(
    const std::string & file_name, const std::uint64_t & file_size,
    const std::int32_t & replication, std::shared_ptr<file_transfer> & transfer
    )
{
    std::shared_ptr<reservation> res;
    
    auto ec = m_placement_planner.plan(
        file_name, file_size, replication, transfer, res
    );
    
    if (ec != error_code_none)
    {
        log_error("Orchestrator " << error_string(ec) << ".");
        
        return ec;
    }
    
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    m_transfers.push_back(transfer);
    
    try
    {
        auto t = transfer;
        
        threads_.push_back(std::thread([this, t, res]()
        {
            m_transfer_executor.execute(t, res);
        }));
    }
    catch (std::exception & e)
    {
        log_error("Orchestrator failed to start transfer, what = " << e.what());
        
        res->release();
        
        transfer->mark_failed();
    }
    
    return error_code_none;
}

bool orchestrator::wait(
    const std::shared_ptr<file_transfer> & transfer,
    const std::chrono::milliseconds & timeout
    )
{
    if (transfer)
    {
        return transfer->wait(timeout);
    }
    
    return false;
}

std::vector< std::shared_ptr<file_transfer> > orchestrator::transfers() const
{
    std::lock_guard<std::recursive_mutex> l(mutex_);
    
    return m_transfers;
}

void orchestrator::stop()
{
    std::vector<std::thread> threads;
    
    {
        std::lock_guard<std::recursive_mutex> l(mutex_);
        
        threads.swap(threads_);
    }
    
    for (auto & i : threads)
    {
        if (i.joinable())
        {
            i.join();
        }
    }
}

bool orchestrator::list_nodes(std::vector<node_record> & nodes)
{
    message request(protocol::action_list_nodes);
    message response;
    
    if (this->request(request, response))
    {
        return response.nodes(nodes);
    }
    
    return false;
}

bool orchestrator::stats(network_stats & stats)
{
    message request(protocol::action_stats);
    message response;
    
    if (this->request(request, response))
    {
        return response.stats(stats);
    }
    
    return false;
}

void orchestrator::set_node_source(
    const placement_planner::node_source_t & f
    )
{
    m_placement_planner.set_node_source(f);
}

reservation_ledger & orchestrator::ledger()
{
    return m_ledger;
}

bool orchestrator::request(message & request, message & response)
{
    auto ec = rpc_client::call(
        m_configuration.controller_host(), m_configuration.controller_port(),
        m_configuration.request_timeout_ms(), request, response
    );
    
    if (ec != error_code_none)
    {
        log_error(
            "Orchestrator " << request.action_name() << " failed, " <<
            error_string(ec) << "."
        );
        
        return false;
    }
    
    if (response.status() != protocol::status_ok)
    {
        log_error(
            "Orchestrator " << request.action_name() << " rejected, "
            "message = " << response.error_message() << "."
        );
        
        return false;
    }
    
    return true;
}
