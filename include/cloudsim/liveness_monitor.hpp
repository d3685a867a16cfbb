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

#ifndef CLOUDSIM_LIVENESS_MONITOR_HPP
#define CLOUDSIM_LIVENESS_MONITOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include <boost/asio.hpp>

#include <cloudsim/node_record.hpp>

namespace cloudsim {

    class node_registry;
    
    /**
     * Implements the periodic staleness sweep with a UDP probe fallback.
     */
    class liveness_monitor
    {
        public:
        
            /**
             * Constructor
             * @param registry The node_registry.
             */
            explicit liveness_monitor(node_registry & registry);
        
            /**
             * Destructor
             */
            ~liveness_monitor();
        
            /**
             * Starts the sweep thread.
             */
            void start();
        
            /**
             * Stops the sweep thread.
             */
            void stop();
        
            /**
             * Performs a single sweep, returns the number of nodes probed.
             */
            std::size_t sweep();
        
            /**
             * Replaces the probe, it returns true when the node answered.
             * @param f The std::function.
             */
            void set_probe(const std::function<bool (const node_record &)> &);
        
            void set_interval(const std::chrono::milliseconds & val);
            void set_timeout(const std::chrono::milliseconds & val);
            void set_probe_timeout(const std::chrono::milliseconds & val);
        
        private:
        
            void do_tick();
        
            /**
             * The node_registry.
             */
            node_registry & m_registry;
        
            /**
             * The sweep interval.
             */
            std::chrono::milliseconds m_interval;
        
            /**
             * The heartbeat timeout.
             */
            std::chrono::milliseconds m_timeout;
        
            /**
             * The probe timeout.
             */
            std::chrono::milliseconds m_probe_timeout;
        
            /**
             * The probe.
             */
            std::function<bool (const node_record &)> m_probe;
        
        protected:
        
            /**
             * The boost::asio::io_service.
             */
            boost::asio::io_service io_service_;
        
            /**
             * The sweep timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > timer_;
        
            /**
             * The sweep thread.
             */
            std::thread thread_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_LIVENESS_MONITOR_HPP
