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

#ifndef CLOUDSIM_ARGUMENTS_HPP
#define CLOUDSIM_ARGUMENTS_HPP

#include <cstdint>
#include <map>
#include <string>

namespace cloudsim {

    /**
     * Implements the --key=value command line arguments.
     */
    class arguments
    {
        public:
        
            /**
             * Constructor
             * @param argc The number of arguments.
             * @param argv The arguments.
             */
            arguments(const int & argc, const char * argv[]);
        
            /**
             * Constructor
             * @param args The arguments.
             */
            explicit arguments(const std::map<std::string, std::string> &);
        
            /**
             * The arguments, a bare flag maps to an empty value.
             */
            const std::map<std::string, std::string> & args() const;
        
            /**
             * If true the argument was given.
             * @param key The key.
             */
            bool has(const std::string &) const;
        
            /**
             * A string argument.
             * @param key The key.
             * @param default_value The default value.
             */
            std::string get_string(
                const std::string & key, const std::string & default_value
            ) const;
        
            /**
             * A number argument, throws std::invalid_argument when the
             * value is not a number or lies outside [minimum, maximum].
             * @param key The key.
             * @param default_value The default value.
             * @param minimum The minimum.
             * @param maximum The maximum.
             */
            std::int64_t get_number(
                const std::string & key, const std::int64_t & default_value,
                const std::int64_t & minimum, const std::int64_t & maximum
            ) const;
        
        private:
        
            /**
             * The arguments.
             */
            std::map<std::string, std::string> m_args;
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_ARGUMENTS_HPP
