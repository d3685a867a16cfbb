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

#ifndef CLOUDSIM_CONSTANTS_HPP
#define CLOUDSIM_CONSTANTS_HPP

#include <cstdint>

namespace cloudsim {

    namespace constants {

        /**
         * The default controller tcp port.
         */
        enum { default_controller_port = 8080 };
    
        /**
         * The number of controller worker threads.
         */
        enum { controller_threads = 4 };
    
        /**
         * The maximum number of concurrent inbound connections.
         */
        enum { controller_connections_maximum = 128 };
    
        /**
         * The interval (in milliseconds) between node heartbeats.
         */
        enum { heartbeat_interval_ms = 2000 };
    
        /**
         * The age (in milliseconds) after which a node's last heartbeat
         * is considered stale.
         */
        enum { heartbeat_timeout_ms = 10000 };
    
        /**
         * The interval (in milliseconds) between liveness sweeps.
         */
        enum { liveness_check_interval_ms = 5000 };
    
        /**
         * The liveness probe timeout (in milliseconds).
         */
        enum { probe_timeout_ms = 1000 };
    
        /**
         * The time (in milliseconds) a target has to receive every chunk.
         */
        enum { transfer_deadline_ms = 30000 };
    
        /**
         * The tcp read timeout (in seconds) for a single request.
         */
        enum { tcp_read_timeout = 5 };
    
        /**
         * The tcp connect/request timeout (in milliseconds) used by
         * clients.
         */
        enum { tcp_request_timeout_ms = 5000 };
    
        /**
         * The simulated link bitrate every chunk is delivered at.
         */
        static const std::uint64_t simulated_link_bps = 100 * 1000 * 1000;
    
        /**
         * The liveness responder port range.
         */
        enum
        {
            udp_port_minimum = 5001,
            udp_port_maximum = 9000,
        };
    
        /**
         * The chunking thresholds and sizes.
         */
        static const std::uint64_t chunk_threshold_small = 10 * 1024 * 1024;
        static const std::uint64_t chunk_threshold_medium = 100 * 1024 * 1024;
        static const std::uint64_t chunk_size_small = 512 * 1024;
        static const std::uint64_t chunk_size_medium = 2 * 1024 * 1024;
        static const std::uint64_t chunk_size_large = 10 * 1024 * 1024;
    
        /**
         * The jitter bounds applied to every simulated chunk delay.
         */
        static const double jitter_minimum = 0.8;
        static const double jitter_maximum = 1.2;
    
        /**
         * The capacity a node registers with when a field is missing.
         */
        enum
        {
            default_cpu = 4,
            default_memory_gb = 8,
        };
        static const std::int64_t default_storage_bytes =
            100LL * 1024 * 1024 * 1024
        ;
        static const std::int64_t default_bandwidth_bps = 1000LL * 1000 * 1000;

    } // namespace constants

} // namespace cloudsim

#endif // CLOUDSIM_CONSTANTS_HPP
