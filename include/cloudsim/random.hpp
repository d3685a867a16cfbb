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

#ifndef CLOUDSIM_RANDOM_HPP
#define CLOUDSIM_RANDOM_HPP

#include <cstdint>
#include <random>

namespace cloudsim {

    /**
     * Implements random functionality.
     */
    class random
    {
        public:
        
            /**
             * Generates a random std::uint16_t in the given range.
             * @param low The low range.
             * @param high The high range.
             */
            static std::uint16_t uint16_random_range(
                const std::uint16_t & low, const std::uint16_t & high
                )
            {
                std::uniform_int_distribution<std::uint32_t> dist(low, high);
                
                return static_cast<std::uint16_t> (dist(generator()));
            }
        
            /**
             * Generates a random std::uint32_t in the given range.
             * @param low The low range.
             * @param high The high range.
             */
            static std::uint32_t uint32_random_range(
                const std::uint32_t & low, const std::uint32_t & high
                )
            {
                std::uniform_int_distribution<std::uint32_t> dist(low, high);
                
                return dist(generator());
            }
        
            /**
             * Generates a random double in the range [low, high].
             * @param low The low range.
             * @param high The high range.
             */
            static double real_random_range(
                const double & low, const double & high
                )
            {
                std::uniform_real_distribution<double> dist(low, high);
                
                return dist(generator());
            }
        
        private:
        
            /**
             * The (per thread) generator.
             */
            static std::mt19937_64 & generator()
            {
                static thread_local std::random_device rd;
                static thread_local std::mt19937_64 gen(rd());
                
                return gen;
            }
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_RANDOM_HPP
