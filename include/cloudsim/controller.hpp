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

#ifndef CLOUDSIM_CONTROLLER_HPP
#define CLOUDSIM_CONTROLLER_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include <cloudsim/configuration.hpp>
#include <cloudsim/liveness_monitor.hpp>
#include <cloudsim/message.hpp>
#include <cloudsim/node_registry.hpp>

namespace cloudsim {

    class tcp_acceptor;
    
    /**
     * Implements the network controller.
     */
    class controller
    {
        public:
        
            /**
             * Constructor
             * @param config The configuration.
             */
            explicit controller(const configuration & config);
        
            /**
             * Destructor
             */
            ~controller();
        
            /**
             * Starts the controller, throws std::runtime_error when the
             * listen socket cannot be bound.
             */
            void start();
        
            /**
             * Stops the controller.
             */
            void stop();
        
            /**
             * The bound TCP port.
             */
            std::uint16_t port() const;
        
            /**
             * Handles a raw request, returns the encoded response.
             * @param buf The buffer.
             * @param len The length.
             */
            std::string handle_request(const char * buf, const std::size_t & len);
        
            /**
             * Handles a decoded request.
             * @param request The message.
             */
            message handle_message(const message & request);
        
            /**
             * The node_registry.
             */
            node_registry & registry();
        
            /**
             * The liveness_monitor.
             */
            liveness_monitor & monitor();
        
        private:
        
            /**
             * Runs the io_service.
             */
            void loop();
        
            message handle_register(const message & request);
            message handle_heartbeat(const message & request);
            message handle_active_notification(const message & request);
            message handle_list_nodes(const message & request);
            message handle_stats(const message & request);
        
            /**
             * The configuration.
             */
            configuration m_configuration;
        
            /**
             * The node_registry.
             */
            node_registry m_registry;
        
            /**
             * The liveness_monitor.
             */
            liveness_monitor m_liveness_monitor;
        
            /**
             * The bound TCP port.
             */
            std::uint16_t m_port;
        
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
             * The tcp_acceptor.
             */
            std::shared_ptr<tcp_acceptor> tcp_acceptor_;
        
            /**
             * The threads.
             */
            std::vector< std::shared_ptr<std::thread> > threads_;
        
            /**
             * The std::mutex.
             */
            std::mutex mutex_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_CONTROLLER_HPP
