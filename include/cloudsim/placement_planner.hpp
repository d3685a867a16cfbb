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

#ifndef CLOUDSIM_PLACEMENT_PLANNER_HPP
#define CLOUDSIM_PLACEMENT_PLANNER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <cloudsim/error.hpp>
#include <cloudsim/file_transfer.hpp>
#include <cloudsim/node_record.hpp>

namespace cloudsim {

    class reservation;
    class reservation_ledger;
    
    /**
     * Implements chunk planning and capacity aware target selection.
     */
    class placement_planner
    {
        public:
        
            /**
             * Fills a node snapshot, returns false on failure.
             */
            typedef std::function<
                bool (std::vector<node_record> &)
            > node_source_t;
        
            /**
             * Constructor
             * @param ledger The reservation_ledger.
             * @param f The node_source_t.
             */
            placement_planner(
                reservation_ledger & ledger, const node_source_t & f
            );
        
            /**
             * Replaces the node source.
             * @param f The node_source_t.
             */
            void set_node_source(const node_source_t & f);
        
            /**
             * Plans a transfer and reserves its size on every target.
             * @param file_name The file name.
             * @param file_size The file size.
             * @param replication The replication factor.
             * @param transfer The file_transfer (out).
             * @param res The reservation (out).
             */
            error_code_t plan(
                const std::string & file_name, const std::uint64_t & file_size,
                const std::int32_t & replication,
                std::shared_ptr<file_transfer> & transfer,
                std::shared_ptr<reservation> & res
            );
        
            /**
             * Active nodes able to hold file_size, best first.
             * @param nodes The node snapshot.
             * @param file_size The file size.
             */
            std::vector<node_record> rank(
                const std::vector<node_record> & nodes,
                const std::uint64_t & file_size
            ) const;
        
            /**
             * The node's storage minus its reservations, never negative.
             * @param record The node_record.
             */
            std::uint64_t estimated_available(const node_record & record) const;
        
            /**
             * The chunk size policy.
             * @param file_size The file size.
             */
            static std::uint64_t chunk_size_for(const std::uint64_t & file_size);
        
            /**
             * Splits a file into chunks.
             * @param file_id The file id.
             * @param file_size The file size.
             */
            static std::vector<file_chunk> make_chunks(
                const std::string & file_id, const std::uint64_t & file_size
            );
        
        private:
        
            /**
             * The reservation_ledger.
             */
            reservation_ledger & m_ledger;
        
            /**
             * The node_source_t.
             */
            node_source_t m_node_source;
        
        protected:
        
            /**
             * The std::mutex.
             */
            std::mutex mutex_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_PLACEMENT_PLANNER_HPP
