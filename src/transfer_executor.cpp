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

#include <thread>
#include <vector>

#include <cloudsim/constants.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/random.hpp>
#include <cloudsim/reservation_ledger.hpp>
#include <cloudsim/transfer_executor.hpp>

using namespace cloudsim;

transfer_executor::transfer_executor(
    const std::uint64_t & link_bps, const std::chrono::milliseconds & deadline
    )
    : m_link_bps(link_bps == 0 ? constants::simulated_link_bps : link_bps)
    , m_deadline(deadline)
{
    // ...
}

transfer_status_t transfer_executor::execute(
    const std::shared_ptr<file_transfer> & transfer,
    const std::shared_ptr<reservation> & res
    )
{
    transfer->mark_in_progress();
    
    auto targets = transfer->target_nodes();
    
    auto ctx = std::make_shared<context_t> ();
    
    std::vector<std::thread> threads;
    
    log_info(
        "Transfer executor starting " << transfer->file_id() << " to " <<
        targets.size() << " targets."
    );
    
    try
    {
        /**
         * Allocate a worker per target.
         */
        for (auto & i : targets)
        {
            threads.push_back(std::thread(
                &transfer_executor::deliver, this, transfer, i, ctx)
            );
        }
        
        std::unique_lock<std::mutex> l(ctx->mutex);
        
        auto done = ctx->condition.wait_for(l, m_deadline, [&ctx, &targets]()
        {
            return ctx->finished == targets.size();
        });
        
        if (done == false)
        {
            log_warn(
                "Transfer executor " << transfer->file_id() << " exceeded " <<
                "the deadline of " << m_deadline.count() << "ms."
            );
        }
    }
    catch (std::exception & e)
    {
        log_error(
            "Transfer executor " << transfer->file_id() << " failed, what = " <<
            e.what()
        );
    }
    
    /**
     * Cancel any stragglers.
     */
    {
        std::lock_guard<std::mutex> l(ctx->mutex);
        
        ctx->cancelled = true;
    }
    
    ctx->condition.notify_all();
    
    for (auto & i : threads)
    {
        if (i.joinable())
        {
            i.join();
        }
    }
    
    if (res)
    {
        res->release();
    }
    
    if (transfer->is_complete())
    {
        transfer->mark_completed();
        
        log_info(
            "Transfer executor completed " << transfer->file_name() << " (" <<
            transfer->file_id() << ")."
        );
    }
    else
    {
        transfer->mark_failed();
        
        log_warn(
            "Transfer executor failed " << transfer->file_name() << " (" <<
            transfer->file_id() << ")."
        );
    }
    
    return transfer->status();
}

std::chrono::microseconds transfer_executor::delay_for(
    const std::uint64_t & len, const double & jitter
    ) const
{
    auto seconds =
        static_cast<double> (len * 8) / static_cast<double> (m_link_bps) *
        jitter
    ;
    
    return std::chrono::microseconds(
        static_cast<std::int64_t> (seconds * 1000000.0)
    );
}

void transfer_executor::set_on_chunk(
    const std::function<void (const std::string &, const file_chunk &)> & f
    )
{
    m_on_chunk = f;
}

void transfer_executor::deliver(
    const std::shared_ptr<file_transfer> & transfer,
    const std::string & node_id, const std::shared_ptr<context_t> & ctx
    )
{
    try
    {
        auto chunks = transfer->chunks();
        
        for (std::size_t i = 0; i < chunks.size(); i++)
        {
            auto delay = delay_for(
                chunks[i].size, random::real_random_range(
                constants::jitter_minimum, constants::jitter_maximum)
            );
            
            std::unique_lock<std::mutex> l(ctx->mutex);
            
            /**
             * Returns true only when cancelled.
             */
            if (
                ctx->condition.wait_for(l, delay, [&ctx]()
                {
                    return ctx->cancelled;
                })
                )
            {
                log_debug(
                    "Transfer executor cancelled " << node_id << " at chunk " <<
                    i << "."
                );
                
                break;
            }
            
            l.unlock();
            
            if (m_on_chunk)
            {
                m_on_chunk(node_id, chunks[i]);
            }
            
            transfer->mark_delivered(i, node_id);
        }
    }
    catch (std::exception & e)
    {
        log_error(
            "Transfer executor worker for " << node_id << " failed, what = " <<
            e.what()
        );
    }
    
    std::lock_guard<std::mutex> l(ctx->mutex);
    
    ctx->finished++;
    
    ctx->condition.notify_all();
}
