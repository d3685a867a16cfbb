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

#ifndef CLOUDSIM_RPC_CLIENT_HPP
#define CLOUDSIM_RPC_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include <cloudsim/error.hpp>
#include <cloudsim/message.hpp>

namespace cloudsim {

    class tcp_transport;
    
    /**
     * Implements a request/response client, one request and one response
     * over a fresh TCP connection.
     */
    class rpc_client
        : public std::enable_shared_from_this<rpc_client>
    {
        public:
        
            /**
             * Constructor
             * @param ios The boost::asio::io_service.
             * @param host The remote host.
             * @param port The remote port.
             */
            rpc_client(
                boost::asio::io_service & ios, const std::string & host,
                const std::uint16_t & port
            );
        
            /**
             * Sets the timeout covering connect, write and read.
             * @param val The value in milliseconds.
             */
            void set_timeout(const std::uint32_t & val);
        
            /**
             * Sends the request, the completion handler is called exactly
             * once.
             * @param request The message.
             * @param f The completion handler.
             */
            void start(
                message & request,
                const std::function<
                void (const error_code_t &, const message &)> & f
            );
        
            /**
             * Performs a blocking call on a private io_service.
             * @param host The remote host.
             * @param port The remote port.
             * @param timeout The timeout in milliseconds.
             * @param request The request.
             * @param response The response.
             */
            static error_code_t call(
                const std::string & host, const std::uint16_t & port,
                const std::uint32_t & timeout, message & request,
                message & response
            );
        
        private:
        
            /**
             * Completes the call (runs in the strand).
             * @param ec The error_code_t.
             * @param response The response.
             */
            void complete(const error_code_t & ec, const message & response);
        
            /**
             * The remote host.
             */
            std::string m_host;
        
            /**
             * The remote port.
             */
            std::uint16_t m_port;
        
            /**
             * The timeout in milliseconds.
             */
            std::uint32_t m_timeout;
        
            /**
             * If true the completion handler was called.
             */
            bool m_finished;
        
            /**
             * The completion handler.
             */
            std::function<
                void (const error_code_t &, const message &)
            > m_on_complete;
        
        protected:
        
            /**
             * The boost::asio::io_service.
             */
            boost::asio::io_service & io_service_;
        
            /**
             * The boost::asio::io_service::strand.
             */
            boost::asio::io_service::strand strand_;
        
            /**
             * The timeout timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > timeout_timer_;
        
            /**
             * The tcp_transport.
             */
            std::shared_ptr<tcp_transport> transport_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_RPC_CLIENT_HPP
