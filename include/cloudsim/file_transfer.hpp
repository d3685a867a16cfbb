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

#ifndef CLOUDSIM_FILE_TRANSFER_HPP
#define CLOUDSIM_FILE_TRANSFER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace cloudsim {

    /**
     * The transfer and chunk states.
     */
    typedef enum transfer_status_s
    {
        transfer_status_pending,
        transfer_status_in_progress,
        transfer_status_completed,
        transfer_status_failed,
    } transfer_status_t;
    
    /**
     * The transfer_status_t as a string.
     * @param val The transfer_status_t.
     */
    std::string transfer_status_string(const transfer_status_t & val);
    
    /**
     * Implements a file chunk.
     */
    class file_chunk
    {
        public:
        
            /**
             * Constructor
             * @param id The chunk id.
             * @param len The size.
             * @param checksum The placeholder checksum.
             */
            file_chunk(
                const std::uint32_t & id, const std::uint64_t & len,
                const std::string & checksum
            );
        
            /**
             * The zero based chunk id.
             */
            std::uint32_t chunk_id;
        
            /**
             * The size in bytes.
             */
            std::uint64_t size;
        
            /**
             * The placeholder checksum (not a content hash).
             */
            std::string checksum;
        
            /**
             * The state.
             */
            transfer_status_t status;
        
            /**
             * The targets that completed delivery of this chunk.
             */
            std::set<std::string> delivered_to;
        
        protected:
        
            // ...
    };
    
    /**
     * Implements a (simulated) replicated file transfer.
     */
    class file_transfer
    {
        public:
        
            /**
             * Constructor
             * @param file_id The file id.
             * @param file_name The file name.
             * @param total_size The total size.
             * @param chunks The chunks.
             */
            file_transfer(
                const std::string & file_id, const std::string & file_name,
                const std::uint64_t & total_size,
                const std::vector<file_chunk> & chunks
            );
        
            /**
             * Generates a file id, the name with spaces replaced by
             * underscores, a millisecond timestamp and a random suffix.
             * @param file_name The file name.
             */
            static std::string make_file_id(const std::string & file_name);
        
            const std::string & file_id() const;
            const std::string & file_name() const;
            const std::uint64_t & total_size() const;
        
            /**
             * A copy of the chunks.
             */
            std::vector<file_chunk> chunks() const;
        
            /**
             * The number of chunks.
             */
            std::size_t chunk_count() const;
        
            /**
             * Sets the target nodes.
             * @param val The node ids.
             */
            void set_target_nodes(const std::vector<std::string> & val);
        
            /**
             * The target nodes.
             */
            std::vector<std::string> target_nodes() const;
        
            /**
             * The status.
             */
            transfer_status_t status() const;
        
            /**
             * Transitions to in progress.
             */
            void mark_in_progress();
        
            /**
             * Records the delivery of a chunk to a target.
             * @param index The chunk index.
             * @param node_id The target node id.
             */
            void mark_delivered(
                const std::size_t & index, const std::string & node_id
            );
        
            /**
             * If true every chunk has been delivered to every target.
             */
            bool is_complete() const;
        
            /**
             * Concludes the transfer as completed.
             */
            void mark_completed();
        
            /**
             * Concludes the transfer as failed.
             */
            void mark_failed();
        
            /**
             * Waits for a terminal status.
             * @param timeout The timeout.
             */
            bool wait(const std::chrono::milliseconds & timeout) const;
        
            const std::time_t & created_at() const;
        
            /**
             * The completion time, 0 until completed.
             */
            std::time_t completed_at() const;
        
        private:
        
            /**
             * If true every chunk has been delivered to every target (the
             * mutex must be held).
             */
            bool is_complete_locked() const;
        
            std::string m_file_id;
            std::string m_file_name;
            std::uint64_t m_total_size;
            std::vector<file_chunk> m_chunks;
            std::vector<std::string> m_target_nodes;
            transfer_status_t m_status;
            std::time_t m_created_at;
            std::time_t m_completed_at;
        
        protected:
        
            /**
             * The std::mutex.
             */
            mutable std::mutex mutex_;
        
            /**
             * Signalled on a terminal status.
             */
            mutable std::condition_variable condition_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_FILE_TRANSFER_HPP
