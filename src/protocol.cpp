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

#include <cloudsim/protocol.hpp>

using namespace cloudsim;

const char * protocol::status_ok = "OK";
const char * protocol::status_ack = "ACK";
const char * protocol::status_error = "ERROR";
const char * protocol::probe_request = "PING";
const char * protocol::probe_alive = "ALIVE";

protocol::action_t protocol::action_from_string(const std::string & val)
{
    if (val.empty())
    {
        return action_none;
    }
    else if (val == "REGISTER")
    {
        return action_register;
    }
    else if (val == "HEARTBEAT")
    {
        return action_heartbeat;
    }
    else if (val == "ACTIVE_NOTIFICATION")
    {
        return action_active_notification;
    }
    else if (val == "LIST_NODES")
    {
        return action_list_nodes;
    }
    else if (val == "STATS")
    {
        return action_stats;
    }
    
    return action_unknown;
}

std::string protocol::action_to_string(const action_t & val)
{
    switch (val)
    {
        case action_register:
            return "REGISTER";
        case action_heartbeat:
            return "HEARTBEAT";
        case action_active_notification:
            return "ACTIVE_NOTIFICATION";
        case action_list_nodes:
            return "LIST_NODES";
        case action_stats:
            return "STATS";
        default:
        break;
    }
    
    return std::string();
}
