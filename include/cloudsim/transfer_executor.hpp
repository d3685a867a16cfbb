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

#ifndef CLOUDSIM_TRANSFER_EXECUTOR_HPP
#define CLOUDSIM_TRANSFER_EXECUTOR_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <cloudsim/file_transfer.hpp>

namespace cloudsim {

    class reservation;
    
    /**
     * Implements the concurrent simulated delivery of a planned transfer.
     */
    class transfer_executor
    {
        public:
        
            /**
             * Constructor
             * @param link_bps The simulated link bitrate.
             * @param deadline The deadline for all targets.
             */
            transfer_executor(
                const std::uint64_t & link_bps,
                const std::chrono::milliseconds & deadline
            );
        
            /**
             * Runs the transfer to completion or deadline, the reservation
             * is released before returning.
             * @param transfer The file_transfer.
             * @param res The reservation.
             */
            transfer_status_t execute(
                const std::shared_ptr<file_transfer> & transfer,
                const std::shared_ptr<reservation> & res
            );
        
            /**
             * The simulated delay of a chunk.
             * @param len The chunk size.
             * @param jitter The jitter factor.
             */
            std::chrono::microseconds delay_for(
                const std::uint64_t & len, const double & jitter
            ) const;
        
            /**
             * Sets the handler invoked as each chunk reaches a target, a
             * throwing handler stops that target's worker.
             * @param f The std::function.
             */
            void set_on_chunk(
                const std::function<
                void (const std::string &, const file_chunk &)> &
            );
        
        private:
        
            /**
             * Shared by the workers of one execution.
             */
            struct context_t
            {
                context_t()
                    : cancelled(false)
                    , finished(0)
                {
                    // ...
                }
                
                std::mutex mutex;
                std::condition_variable condition;
                bool cancelled;
                std::size_t finished;
            };
        
            /**
             * Delivers every chunk to one target.
             * @param transfer The file_transfer.
             * @param node_id The target.
             * @param ctx The context_t.
             */
            void deliver(
                const std::shared_ptr<file_transfer> & transfer,
                const std::string & node_id,
                const std::shared_ptr<context_t> & ctx
            );
        
            /**
             * The simulated link bitrate.
             */
            std::uint64_t m_link_bps;
        
            /**
             * The deadline.
             */
            std::chrono::milliseconds m_deadline;
        
            /**
             * The chunk handler.
             */
            std::function<
                void (const std::string &, const file_chunk &)
            > m_on_chunk;
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_TRANSFER_EXECUTOR_HPP
