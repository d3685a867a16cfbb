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

#ifndef CLOUDSIM_PROTOCOL_HPP
#define CLOUDSIM_PROTOCOL_HPP

#include <cstdint>
#include <string>

namespace cloudsim {

    /**
     * The protocol.
     */
    class protocol
    {
        public:
        
            /**
             * The request actions.
             */
            typedef enum actions
            {
                action_none,
                action_register,
                action_heartbeat,
                action_active_notification,
                action_list_nodes,
                action_stats,
                action_unknown,
            } action_t;
        
            /**
             * The response status values.
             */
            static const char * status_ok;
            static const char * status_ack;
            static const char * status_error;
        
            /**
             * The liveness probe request token.
             */
            static const char * probe_request;
        
            /**
             * The liveness token a probe response must contain.
             */
            static const char * probe_alive;
        
            /**
             * The largest message either side accepts.
             */
            enum { message_length_maximum = 1024 * 1024 };
        
            /**
             * Converts an action string into an action.
             * @param val The value.
             */
            static action_t action_from_string(const std::string &);
        
            /**
             * Converts an action into its wire string.
             * @param val The value.
             */
            static std::string action_to_string(const action_t &);
        
        private:
        
            // ...
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_PROTOCOL_HPP
