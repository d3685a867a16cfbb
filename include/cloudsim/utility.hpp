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

#ifndef CLOUDSIM_UTILITY_HPP
#define CLOUDSIM_UTILITY_HPP

#include <cstdint>
#include <string>

namespace cloudsim {

    namespace utility {
    
        namespace string {

            inline bool starts_with(
                const std::string & s1, const std::string & s2
                )
            {
                return s1.compare(0, s2.length(), s2) == 0;
            }
        
        } // namespace string
    
        /**
         * Checks if the buffer holds one complete JSON object or array
         * (every brace and bracket outside of a string literal is closed).
         * @param buf The buffer.
         */
        bool is_complete_json(const std::string &);
    
        /**
         * The lowercase hexadecimal MD5 digest of the value.
         * @param val The value.
         */
        std::string md5_hex(const std::string &);
    
        /**
         * Milliseconds since the unix epoch.
         */
        std::uint64_t now_ms();
    
    } // namespace utility
    
} // namespace cloudsim

#endif // CLOUDSIM_UTILITY_HPP
