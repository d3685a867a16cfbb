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

#ifndef CLOUDSIM_RESERVATION_LEDGER_HPP
#define CLOUDSIM_RESERVATION_LEDGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace cloudsim {

    /**
     * Implements the orchestrator's ledger of bytes reserved per node for
     * in flight transfers.
     */
    class reservation_ledger
    {
        public:
        
            /**
             * Reserves bytes on a node.
             * @param node_id The node id.
             * @param len The number of bytes.
             */
            void reserve(const std::string & node_id, const std::uint64_t & len);
        
            /**
             * Releases bytes on a node, never going below zero.
             * @param node_id The node id.
             * @param len The number of bytes.
             */
            void release(const std::string & node_id, const std::uint64_t & len);
        
            /**
             * The bytes reserved on a node.
             * @param node_id The node id.
             */
            std::uint64_t reserved(const std::string & node_id) const;
        
            /**
             * The bytes reserved across all nodes.
             */
            std::uint64_t total() const;
        
        private:
        
            /**
             * The reserved bytes by node id.
             */
            std::map<std::string, std::uint64_t> m_reserved;
        
        protected:
        
            /**
             * The std::mutex.
             */
            mutable std::mutex mutex_;
    };
    
    /**
     * Holds the reservation of one transfer and releases it exactly once.
     */
    class reservation
    {
        public:
        
            /**
             * Constructor, reserves len bytes on every node.
             * @param ledger The reservation_ledger.
             * @param node_ids The node ids.
             * @param len The number of bytes per node.
             */
            reservation(
                reservation_ledger & ledger,
                const std::vector<std::string> & node_ids,
                const std::uint64_t & len
            );
        
            /**
             * Destructor, releases if not already released.
             */
            ~reservation();
        
            reservation(const reservation &) = delete;
            reservation & operator = (const reservation &) = delete;
        
            /**
             * Releases the reservation, subsequent calls do nothing.
             */
            void release();
        
            /**
             * If true the reservation was released.
             */
            bool released() const;
        
        private:
        
            reservation_ledger & m_ledger;
            std::vector<std::string> m_node_ids;
            std::uint64_t m_len;
            bool m_released;
        
        protected:
        
            /**
             * The std::mutex.
             */
            mutable std::mutex mutex_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_RESERVATION_LEDGER_HPP
