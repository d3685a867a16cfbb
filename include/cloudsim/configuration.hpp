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

#ifndef CLOUDSIM_CONFIGURATION_HPP
#define CLOUDSIM_CONFIGURATION_HPP

#include <cstdint>
#include <map>
#include <string>

namespace cloudsim {

    /**
     * The configuration.
     */
    class configuration
    {
        public:
        
            /**
             * The version.
             */
            enum { version = 1 };
        
            /**
             * Constructor
             */
            configuration();
        
            /**
             * Loads from a JSON file.
             * @param path The path.
             */
            bool load(const std::string &);
        
            /**
             * Applies the arguments (keys match the JSON keys, for example
             * "controller.port").
             * @param val The arguments.
             */
            bool set_args(const std::map<std::string, std::string> &);
        
            /**
             * The arguments.
             */
            const std::map<std::string, std::string> & args() const;
        
            /**
             * Sets the controller host.
             * @param val The value.
             */
            void set_controller_host(const std::string &);
        
            /**
             * The controller host.
             */
            const std::string & controller_host() const;
        
            /**
             * Sets the controller tcp port.
             * @param val The value.
             */
            void set_controller_port(const std::uint16_t &);
        
            /**
             * The controller tcp port.
             */
            const std::uint16_t & controller_port() const;
        
            /**
             * Sets the number of controller threads.
             * @param val The value.
             */
            void set_controller_threads(const std::size_t &);
        
            /**
             * The number of controller threads.
             */
            const std::size_t & controller_threads() const;
        
            /**
             * Sets the maximum number of concurrent connections.
             * @param val The value.
             */
            void set_controller_connections_maximum(const std::size_t &);
        
            /**
             * The maximum number of concurrent connections.
             */
            const std::size_t & controller_connections_maximum() const;
        
            /**
             * Sets the heartbeat interval in milliseconds.
             * @param val The value.
             */
            void set_heartbeat_interval_ms(const std::uint32_t &);
        
            /**
             * The heartbeat interval in milliseconds.
             */
            const std::uint32_t & heartbeat_interval_ms() const;
        
            /**
             * Sets the heartbeat timeout in milliseconds.
             * @param val The value.
             */
            void set_heartbeat_timeout_ms(const std::uint32_t &);
        
            /**
             * The heartbeat timeout in milliseconds.
             */
            const std::uint32_t & heartbeat_timeout_ms() const;
        
            /**
             * Sets the liveness check interval in milliseconds.
             * @param val The value.
             */
            void set_liveness_check_interval_ms(const std::uint32_t &);
        
            /**
             * The liveness check interval in milliseconds.
             */
            const std::uint32_t & liveness_check_interval_ms() const;
        
            /**
             * Sets the probe timeout in milliseconds.
             * @param val The value.
             */
            void set_probe_timeout_ms(const std::uint32_t &);
        
            /**
             * The probe timeout in milliseconds.
             */
            const std::uint32_t & probe_timeout_ms() const;
        
            /**
             * Sets the per target transfer deadline in milliseconds.
             * @param val The value.
             */
            void set_transfer_deadline_ms(const std::uint32_t &);
        
            /**
             * The per target transfer deadline in milliseconds.
             */
            const std::uint32_t & transfer_deadline_ms() const;
        
            /**
             * Sets the tcp request timeout in milliseconds.
             * @param val The value.
             */
            void set_request_timeout_ms(const std::uint32_t &);
        
            /**
             * The tcp request timeout in milliseconds.
             */
            const std::uint32_t & request_timeout_ms() const;
        
            /**
             * Sets the simulated link bitrate.
             * @param val The value.
             */
            void set_simulated_link_bps(const std::uint64_t &);
        
            /**
             * The simulated link bitrate.
             */
            const std::uint64_t & simulated_link_bps() const;
        
            /**
             * Sets the liveness responder port range.
             * @param low The low range.
             * @param high The high range.
             */
            void set_udp_port_range(
                const std::uint16_t &, const std::uint16_t &
            );
        
            /**
             * The liveness responder port range minimum.
             */
            const std::uint16_t & udp_port_minimum() const;
        
            /**
             * The liveness responder port range maximum.
             */
            const std::uint16_t & udp_port_maximum() const;
        
        private:
        
            /**
             * Applies a single key/value pair.
             * @param key The key.
             * @param value The value.
             */
            void apply(const std::string &, const std::string &);
        
            /**
             * The arguments.
             */
            std::map<std::string, std::string> m_args;
        
            /**
             * The controller host.
             */
            std::string m_controller_host;
        
            /**
             * The controller tcp port.
             */
            std::uint16_t m_controller_port;
        
            /**
             * The number of controller threads.
             */
            std::size_t m_controller_threads;
        
            /**
             * The maximum number of concurrent connections.
             */
            std::size_t m_controller_connections_maximum;
        
            /**
             * The heartbeat interval in milliseconds.
             */
            std::uint32_t m_heartbeat_interval_ms;
        
            /**
             * The heartbeat timeout in milliseconds.
             */
            std::uint32_t m_heartbeat_timeout_ms;
        
            /**
             * The liveness check interval in milliseconds.
             */
            std::uint32_t m_liveness_check_interval_ms;
        
            /**
             * The probe timeout in milliseconds.
             */
            std::uint32_t m_probe_timeout_ms;
        
            /**
             * The per target transfer deadline in milliseconds.
             */
            std::uint32_t m_transfer_deadline_ms;
        
            /**
             * The tcp request timeout in milliseconds.
             */
            std::uint32_t m_request_timeout_ms;
        
            /**
             * The simulated link bitrate.
             */
            std::uint64_t m_simulated_link_bps;
        
            /**
             * The liveness responder port range.
             */
            std::uint16_t m_udp_port_minimum;
            std::uint16_t m_udp_port_maximum;
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_CONFIGURATION_HPP
