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

#ifndef CLOUDSIM_UDP_PROBE_HPP
#define CLOUDSIM_UDP_PROBE_HPP

#include <cstdint>
#include <string>

#include <cloudsim/error.hpp>

namespace cloudsim {

    /**
     * Implements the controller side one shot UDP liveness probe.
     */
    class udp_probe
    {
        public:
        
            /**
             * Sends PING and waits for a reply containing ALIVE.
             * @param host The host.
             * @param port The UDP port (0 fails immediately).
             * @param timeout The timeout in milliseconds.
             */
            static error_code_t probe(
                const std::string & host, const std::uint16_t & port,
                const std::uint32_t & timeout
            );
        
        private:
        
            // ...
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_UDP_PROBE_HPP
