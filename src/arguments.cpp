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

#include <cstring>
#include <stdexcept>

#include <cloudsim/arguments.hpp>
#include <cloudsim/utility.hpp>

using namespace cloudsim;

arguments::arguments(const int & argc, const char * argv[])
{
    for (auto i = 1; i < argc; i++)
    {
        if (utility::string::starts_with(argv[i], "--"))
        {
            std::string arg = std::string(argv[i]).substr(2, strlen(argv[i]));
            
            auto j = arg.find("=");
            
            if (j == std::string::npos)
            {
                m_args[arg] = "";
            }
            else
            {
                m_args[arg.substr(0, j)] = arg.substr(j + 1, arg.length());
            }
        }
    }
}

arguments::arguments(const std::map<std::string, std::string> & args)
    : m_args(args)
{
    // ...
}

const std::map<std::string, std::string> & arguments::args() const
{
    return m_args;
}

bool arguments::has(const std::string & key) const
{
    return m_args.count(key) > 0;
}

std::string arguments::get_string(
    const std::string & key, const std::string & default_value
    ) const
{
    auto it = m_args.find(key);
    
    if (it == m_args.end() || it->second.empty())
    {
        return default_value;
    }
    
    return it->second;
}

std::int64_t arguments::get_number(
    const std::string & key, const std::int64_t & default_value,
    const std::int64_t & minimum, const std::int64_t & maximum
    ) const
{
    auto it = m_args.find(key);
    
    if (it == m_args.end() || it->second.empty())
    {
        return default_value;
    }
    
    std::int64_t ret = 0;
    
    try
    {
        std::size_t pos = 0;
        
        ret = std::stoll(it->second, &pos);
        
        if (pos != it->second.size())
        {
            throw std::invalid_argument(it->second);
        }
    }
    catch (std::exception & e)
    {
        throw std::invalid_argument(
            "--" + key + " expects a number, got " + it->second
        );
    }
    
    if (ret < minimum || ret > maximum)
    {
        throw std::invalid_argument(
            "--" + key + " must be between " + std::to_string(minimum) +
            " and " + std::to_string(maximum) + ", got " + it->second
        );
    }
    
    return ret;
}
