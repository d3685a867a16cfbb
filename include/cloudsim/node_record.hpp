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

#ifndef CLOUDSIM_NODE_RECORD_HPP
#define CLOUDSIM_NODE_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace cloudsim {

    /**
     * The capacity a node declares when it registers.
     */
    class node_capacity
    {
        public:
        
            node_capacity()
                : cpu_cores(0)
                , memory_gb(0)
                , storage_bytes(0)
                , bandwidth_bps(0)
            {
                // ...
            }
        
            std::int64_t cpu_cores;
            std::int64_t memory_gb;
        
            /**
             * The storage in bytes.
             */
            std::int64_t storage_bytes;
        
            /**
             * The bandwidth in bits per second.
             */
            std::int64_t bandwidth_bps;
        
            bool operator == (const node_capacity & rhs) const
            {
                return
                    cpu_cores == rhs.cpu_cores &&
                    memory_gb == rhs.memory_gb &&
                    storage_bytes == rhs.storage_bytes &&
                    bandwidth_bps == rhs.bandwidth_bps
                ;
            }
        
        protected:
        
            // ...
    };
    
    /**
     * Implements a node record (one member of the cluster).
     */
    class node_record
    {
        public:
        
            node_record()
                : tcp_port(0)
                , udp_port(0)
                , registered_at(std::time(0))
                , last_seen(std::chrono::steady_clock::now())
                , active(true)
            {
                // ...
            }
        
            std::string node_id;
            std::string host;
            std::uint16_t tcp_port;
        
            /**
             * The port the liveness responder listens on.
             */
            std::uint16_t udp_port;
        
            node_capacity capacity;
        
            /**
             * The (wall clock) time the node registered.
             */
            std::time_t registered_at;
        
            /**
             * The time of the last heartbeat, notification or probe.
             */
            std::chrono::steady_clock::time_point last_seen;
        
            bool active;
        
        protected:
        
            // ...
    };
    
    /**
     * The network statistics.
     */
    class network_stats
    {
        public:
        
            network_stats()
                : total_nodes(0)
                , active_nodes(0)
                , total_connections(0)
                , total_data_transferred(0)
                , total_storage_capacity(0)
                , total_bandwidth_capacity(0)
            {
                // ...
            }
        
            std::size_t total_nodes;
            std::size_t active_nodes;
            std::uint64_t total_connections;
            std::uint64_t total_data_transferred;
            std::int64_t total_storage_capacity;
            std::int64_t total_bandwidth_capacity;
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_NODE_RECORD_HPP
