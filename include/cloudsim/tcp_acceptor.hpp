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

#ifndef CLOUDSIM_TCP_ACCEPTOR_HPP
#define CLOUDSIM_TCP_ACCEPTOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio.hpp>

namespace cloudsim {

    class tcp_transport;
    
    /**
     * Implements a TCP acceptor that answers one request per connection.
     */
    class tcp_acceptor
        : public std::enable_shared_from_this<tcp_acceptor>
    {
        public:
        
            /**
             * Constructor
             * @param ios The boost::asio::io_service.
             * @param connections_maximum The maximum number of concurrent
             * connections, excess connections are closed at accept.
             */
            explicit tcp_acceptor(
                boost::asio::io_service & ios,
                const std::size_t & connections_maximum
            );
        
            /**
             * Opens the acceptor.
             * @param host The listen address (empty means any).
             * @param port The port (0 picks an ephemeral port).
             */
            void open(const std::string & host, const std::uint16_t & port);
        
            /**
             * Closes the acceptor.
             */
            void close();
        
            /**
             * The local endpoint.
             */
            const boost::asio::ip::tcp::endpoint local_endpoint() const;
        
            /**
             * Sets the accept handler.
             * @param f The std::function.
             */
            void set_on_accept(
                const std::function<
                void (const boost::asio::ip::tcp::endpoint &)> &
            );
        
            /**
             * Sets the request handler, it returns the response bytes.
             * @param f The std::function.
             */
            void set_on_request(
                const std::function<
                std::string (const char *, const std::size_t &)> &
            );
        
            /**
             * The number of connected tcp_transport's.
             */
            std::size_t connections() const;
        
        private:
        
            void do_accept();
        
            void do_tick(const std::uint32_t & seconds);
        
            /**
             * The maximum number of concurrent connections.
             */
            std::size_t m_connections_maximum;
        
            /**
             * The accept handler.
             */
            std::function<
                void (const boost::asio::ip::tcp::endpoint &)
            > m_on_accept;
        
            /**
             * The request handler.
             */
            std::function<
                std::string (const char *, const std::size_t &)
            > m_on_request;
        
            /**
             * The tcp_transport's.
             */
            std::vector< std::weak_ptr<tcp_transport> > m_tcp_transports;
        
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
             * The boost::asio::ip::tcp::acceptor.
             */
            boost::asio::ip::tcp::acceptor acceptor_;
        
            /**
             * The transports timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > transports_timer_;
        
            /**
             * The tcp transports mutex.
             */
            mutable std::recursive_mutex tcp_transports_mutex_;
    };

} // namespace cloudsim

#endif // CLOUDSIM_TCP_ACCEPTOR_HPP
