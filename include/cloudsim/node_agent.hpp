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

#ifndef CLOUDSIM_NODE_AGENT_HPP
#define CLOUDSIM_NODE_AGENT_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio.hpp>

#include <cloudsim/configuration.hpp>
#include <cloudsim/message.hpp>
#include <cloudsim/node_record.hpp>

namespace cloudsim {

    class udp_responder;
    
    /**
     * Implements a storage node agent.
     */
    class node_agent
    {
        public:
        
            /**
             * Constructor
             * @param config The configuration (controller endpoint and
             * timings).
             * @param record The node id, advertised host, udp port (0 means
             * random) and capacity.
             */
            node_agent(const configuration & config, const node_record & record);
        
            /**
             * Destructor
             */
            ~node_agent();
        
            /**
             * Starts the responder, registers, announces and starts
             * heartbeats. Throws std::runtime_error when registration
             * fails.
             */
            void start();
        
            /**
             * Stops the node agent.
             */
            void stop();
        
            /**
             * The node_record as registered.
             */
            const node_record & record() const;
        
            /**
             * The number of acknowledged heartbeats.
             */
            std::uint32_t heartbeats_acknowledged() const;
        
            /**
             * The number of failed heartbeats.
             */
            std::uint32_t heartbeats_failed() const;
        
        private:
        
            /**
             * Sends a request and checks the response status.
             * @param request The message.
             * @param status The expected status.
             */
            bool request(message & request, const std::string & status);
        
            void do_tick();
        
            void send_heartbeat();
        
            /**
             * The configuration.
             */
            configuration m_configuration;
        
            /**
             * The node_record.
             */
            node_record m_record;
        
            /**
             * The number of acknowledged heartbeats.
             */
            std::atomic<std::uint32_t> m_heartbeats_acknowledged;
        
            /**
             * The number of failed heartbeats.
             */
            std::atomic<std::uint32_t> m_heartbeats_failed;
        
            /**
             * If true heartbeats are no longer scheduled.
             */
            std::atomic<bool> m_stopping;
        
        protected:
        
            /**
             * The boost::asio::io_service.
             */
            boost::asio::io_service io_service_;
        
            /**
             * The boost::asio::io_service::work.
             */
            std::shared_ptr<boost::asio::io_service::work> work_;
        
            /**
             * The boost::asio::io_service::strand.
             */
            boost::asio::io_service::strand strand_;
        
            /**
             * The heartbeat timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > heartbeat_timer_;
        
            /**
             * The udp_responder.
             */
            std::shared_ptr<udp_responder> udp_responder_;
        
            /**
             * The thread.
             */
            std::thread thread_;
        
            /**
             * The std::mutex.
             */
            std::mutex mutex_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_NODE_AGENT_HPP
