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

#ifndef CLOUDSIM_ERROR_HPP
#define CLOUDSIM_ERROR_HPP

#include <string>

namespace cloudsim {

    /**
     * The error codes.
     */
    typedef enum error_code_s
    {
        error_code_none = 0,
        error_code_validation = -1,
        error_code_not_registered = -2,
        error_code_no_capacity = -3,
        error_code_probe_timeout = -4,
        error_code_transfer_deadline_exceeded = -5,
        error_code_transport = -6,
        error_code_malformed_message = -7,
    } error_code_t;
    
    /**
     * The human readable description of an error code.
     * @param val The value.
     */
    inline std::string error_string(const error_code_t & val)
    {
        switch (val)
        {
            case error_code_none:
                return "None";
            case error_code_validation:
                return "Validation error";
            case error_code_not_registered:
                return "Node not registered";
            case error_code_no_capacity:
                return "No suitable nodes available";
            case error_code_probe_timeout:
                return "Probe timed out";
            case error_code_transfer_deadline_exceeded:
                return "Transfer deadline exceeded";
            case error_code_transport:
                return "Transport error";
            case error_code_malformed_message:
                return "Malformed request";
        }
        
        return "Unknown error";
    }

} // namespace cloudsim

#endif // CLOUDSIM_ERROR_HPP
