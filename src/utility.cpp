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

#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

#include <cloudsim/utility.hpp>

using namespace cloudsim;

bool utility::is_complete_json(const std::string & buf)
{
    std::size_t depth = 0;
    
    bool started = false;
    bool in_string = false;
    bool escaped = false;
    
    for (auto & c : buf)
    {
        if (in_string)
        {
            if (escaped)
            {
                escaped = false;
            }
            else if (c == '\\')
            {
                escaped = true;
            }
            else if (c == '"')
            {
                in_string = false;
            }
        }
        else if (c == '"')
        {
            in_string = true;
        }
        else if (c == '{' || c == '[')
        {
            started = true;
            
            ++depth;
        }
        else if (c == '}' || c == ']')
        {
            if (depth == 0)
            {
                /**
                 * Unbalanced, let the decoder report it.
                 */
                return true;
            }
            
            if (--depth == 0)
            {
                return true;
            }
        }
    }
    
    return started && depth == 0;
}

std::string utility::md5_hex(const std::string & val)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    
    unsigned int len = 0;
    
    if (
        EVP_Digest(val.data(), val.size(), digest, &len, EVP_md5(), 0) != 1
        )
    {
        throw std::runtime_error("EVP_Digest failed");
    }
    
    std::string ret;
    
    char hex[3];
    
    for (unsigned int i = 0; i < len; i++)
    {
        std::snprintf(hex, sizeof(hex), "%02x", digest[i]);
        
        ret += hex;
    }
    
    return ret;
}

std::uint64_t utility::now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds> (
        std::chrono::system_clock::now().time_since_epoch()).count()
    ;
}
