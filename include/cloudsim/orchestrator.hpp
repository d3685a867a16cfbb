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

#ifndef CLOUDSIM_ORCHESTRATOR_HPP
#define CLOUDSIM_ORCHESTRATOR_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <cloudsim/configuration.hpp>
#include <cloudsim/error.hpp>
#include <cloudsim/file_transfer.hpp>
#include <cloudsim/message.hpp>
#include <cloudsim/node_record.hpp>
#include <cloudsim/placement_planner.hpp>
#include <cloudsim/reservation_ledger.hpp>
#include <cloudsim/transfer_executor.hpp>

namespace cloudsim {

    /**
     * Implements the transfer orchestrator.
     */
    class orchestrator
    {
        public:
        
            /**
             * Constructor
             * @param config The configuration (controller endpoint, link
             * bitrate and deadline).
             */
            explicit orchestrator(const configuration & config);
        
            /**
             * Destructor
             */
            ~orchestrator();
        
            /**
             * Plans a transfer and runs it on a background thread.
             * @param file_name The file name.
             * @param file_size The file size.
             * @param replication The replication factor.
             * @param transfer The file_transfer (out).
             */
            error_code_t initiate_transfer(
                const std::string & file_name, const std::uint64_t & file_size,
                const std::int32_t & replication,
                std::shared_ptr<file_transfer> & transfer
            );
        
            /**
             * Waits for a transfer to reach a terminal status.
             * @param transfer The file_transfer.
             * @param timeout The timeout.
             */
            bool wait(
                const std::shared_ptr<file_transfer> & transfer,
                const std::chrono::milliseconds & timeout
            );
        
            /**
             * The transfers initiated so far.
             */
            std::vector< std::shared_ptr<file_transfer> > transfers() const;
        
            /**
             * Joins all transfer threads.
             */
            void stop();
        
            /**
             * Asks the controller for its node list.
             * @param nodes The nodes (out).
             */
            bool list_nodes(std::vector<node_record> & nodes);
        
            /**
             * Asks the controller for its stats.
             * @param stats The network_stats (out).
             */
            bool stats(network_stats & stats);
        
            /**
             * Replaces the node source (LIST_NODES by default).
             * @param f The placement_planner::node_source_t.
             */
            void set_node_source(const placement_planner::node_source_t & f);
        
            /**
             * The reservation_ledger.
             */
            reservation_ledger & ledger();
        
        private:
        
            /**
             * Sends a request to the controller.
             * @param request The message.
             * @param response The message.
             */
            bool request(message & request, message & response);
        
            /**
             * The configuration.
             */
            configuration m_configuration;
        
            /**
             * The reservation_ledger.
             */
            reservation_ledger m_ledger;
        
            /**
             * The placement_planner.
             */
            placement_planner m_placement_planner;
        
            /**
             * The transfer_executor.
             */
            transfer_executor m_transfer_executor;
        
            /**
             * The transfers.
             */
            std::vector< std::shared_ptr<file_transfer> > m_transfers;
        
        protected:
        
            /**
             * The transfer threads.
             */
            std::vector<std::thread> threads_;
        
            /**
             * The std::recursive_mutex.
             */
            mutable std::recursive_mutex mutex_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_ORCHESTRATOR_HPP
