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

#include <cloudsim/logger.hpp>
#include <cloudsim/reservation_ledger.hpp>

using namespace cloudsim;

void reservation_ledger::reserve(
    const std::string & node_id, const std::uint64_t & len
    )
{
    std::lock_guard<std::mutex> l(mutex_);
    
    m_reserved[node_id] += len;
}

void reservation_ledger::release(
    const std::string & node_id, const std::uint64_t & len
    )
{
    std::lock_guard<std::mutex> l(mutex_);
    
    auto it = m_reserved.find(node_id);
    
    if (it == m_reserved.end())
    {
        log_warn(
            "Reservation ledger releasing " << len << " bytes on " <<
            node_id << " without a reservation."
        );
        
        return;
    }
    
    if (it->second < len)
    {
        log_warn(
            "Reservation ledger releasing " << len << " bytes on " <<
            node_id << " with only " << it->second << " reserved."
        );
        
        it->second = 0;
    }
    else
    {
        it->second -= len;
    }
    
    if (it->second == 0)
    {
        m_reserved.erase(it);
    }
}

std::uint64_t reservation_ledger::reserved(const std::string & node_id) const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    auto it = m_reserved.find(node_id);
    
    return it == m_reserved.end() ? 0 : it->second;
}

std::uint64_t reservation_ledger::total() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    std::uint64_t ret = 0;
    
    for (auto & i : m_reserved)
    {
        ret += i.second;
    }
    
    return ret;
}

reservation::reservation(
    reservation_ledger & ledger, const std::vector<std::string> & node_ids,
    const std::uint64_t & len
    )
    : m_ledger(ledger)
    , m_node_ids(node_ids)
    , m_len(len)
    , m_released(false)
{
    for (auto & i : m_node_ids)
    {
        m_ledger.reserve(i, m_len);
    }
}

reservation::~reservation()
{
    release();
}

void reservation::release()
{
    std::lock_guard<std::mutex> l(mutex_);
    
    if (m_released)
    {
        return;
    }
    
    m_released = true;
    
    for (auto & i : m_node_ids)
    {
        m_ledger.release(i, m_len);
    }
}

bool reservation::released() const
{
    std::lock_guard<std::mutex> l(mutex_);
    
    return m_released;
}
