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

#ifndef CLOUDSIM_NODE_REGISTRY_HPP
#define CLOUDSIM_NODE_REGISTRY_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <cloudsim/error.hpp>
#include <cloudsim/node_record.hpp>

namespace cloudsim {

    /**
     * Implements the controller's authoritative membership registry.
     */
    class node_registry
    {
        public:
        
            /**
             * Constructor
             */
            node_registry();
        
            /**
             * Registers (or fully replaces) a node, the replaced node keeps
             * its position in list order.
             * @param record The node_record.
             */
            error_code_t register_node(const node_record & record);
        
            /**
             * Refreshes last_seen.
             * @param node_id The node id.
             */
            error_code_t heartbeat(const std::string & node_id);
        
            /**
             * Marks the node active and refreshes last_seen.
             * @param node_id The node id.
             */
            error_code_t notify_active(const std::string & node_id);
        
            /**
             * A copy of all nodes in registration order.
             */
            std::vector<node_record> list_nodes() const;
        
            /**
             * Looks up a node.
             * @param node_id The node id.
             * @param record The node_record.
             */
            bool find(const std::string & node_id, node_record & record) const;
        
            /**
             * The network_stats.
             */
            network_stats stats() const;
        
            /**
             * Copies of nodes not seen within the timeout.
             * @param timeout The timeout.
             */
            std::vector<node_record> stale_nodes(
                const std::chrono::milliseconds & timeout
            ) const;
        
            /**
             * Called when a liveness probe succeeded.
             * @param node_id The node id.
             */
            void on_probe_success(const std::string & node_id);
        
            /**
             * Called when a liveness probe failed, the node is marked
             * inactive only if it is still stale.
             * @param node_id The node id.
             * @param timeout The timeout.
             */
            void on_probe_failure(
                const std::string & node_id,
                const std::chrono::milliseconds & timeout
            );
        
            /**
             * Called when a connection is accepted.
             */
            void on_connection();
        
            /**
             * Called when request or response bytes are transferred.
             * @param len The length.
             */
            void on_bytes(const std::size_t & len);
        
            /**
             * Validates a record.
             * @param record The node_record.
             */
            static bool validate(const node_record & record);
        
        private:
        
            /**
             * The nodes in registration order.
             */
            std::vector<node_record> m_nodes;
        
            /**
             * The total number of accepted connections.
             */
            std::uint64_t m_total_connections;
        
            /**
             * The total number of bytes transferred.
             */
            std::uint64_t m_total_data_transferred;
        
        protected:
        
            /**
             * Finds a node (the mutex must be held).
             * @param node_id The node id.
             */
            std::vector<node_record>::iterator find_node(
                const std::string & node_id
            );
        
            /**
             * The std::recursive_mutex.
             */
            mutable std::recursive_mutex mutex_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_NODE_REGISTRY_HPP
