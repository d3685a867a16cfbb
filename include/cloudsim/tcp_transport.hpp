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

#ifndef CLOUDSIM_TCP_TRANSPORT_HPP
#define CLOUDSIM_TCP_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

namespace cloudsim {

    /**
     * Implements a tcp transport that carries one JSON message per read
     * callback.
     */
    class tcp_transport
        : public std::enable_shared_from_this<tcp_transport>
    {
        public:
        
            /**
             * The states.
             */
            typedef enum
            {
                state_disconnected,
                state_connecting,
                state_connected,
            } state_t;

            /**
             * Constructor
             * @param ios The boost::asio::io_service.
             */
            explicit tcp_transport(boost::asio::io_service &);
        
            /**
             * Destructor
             */
            ~tcp_transport();

            /**
             * Starts the transport (outgoing).
             * @param hostname The hostname.
             * @param port The port.
             * @param f The completion handler.
             */
            void start(
                const std::string & hostname, const std::uint16_t & port,
                const std::function<void (boost::system::error_code,
                std::shared_ptr<tcp_transport>)> &
            );
        
            /**
             * Starts the transport (incoming).
             */
            void start();
        
            /**
             * Stops the transport.
             */
            void stop();
        
            /**
             * Sets the on read handler.
             * @param f the std::function.
             */
            void set_on_read(
                const std::function<void (std::shared_ptr<tcp_transport>,
                const char *, const std::size_t &)> &
            );
        
            /**
             * Performs a write operation.
             * @param buf The buffer.
             * @param len The length.
             */
            void write(const char *, const std::size_t &);
        
            /**
             * The state.
             */
            state_t state() const;
        
            /**
             * The socket.
             */
            boost::asio::ip::tcp::socket & socket();
        
            /**
             * If true the connection will close as soon as it's write queue
             * is exhausted.
             * @param flag The flag.
             */
            void set_close_after_writes(const bool &);
        
            /**
             * Sets the read timeout in seconds.
             * @param val The value.
             */
            void set_read_timeout(const std::uint32_t &);
        
            /**
             * Sets the write timeout in seconds.
             * @param val The value.
             */
            void set_write_timeout(const std::uint32_t &);
        
        private:
        
            /**
             * do_connect
             */
            void do_connect(boost::asio::ip::tcp::resolver::iterator);
        
            /**
             * do_read
             */
            void do_read();
        
            /**
             * do_write
             */
            void do_write(const char * buf, const std::size_t & len);
        
            /**
             * Delivers the read queue to the read handler.
             */
            void deliver();
        
            /**
             * Closes the socket.
             */
            void do_close();
        
            /**
             * The state.
             */
            std::atomic<state_t> m_state;
        
            /**
             * The boost::asio::ip::tcp::socket.
             */
            boost::asio::ip::tcp::socket m_socket;
        
            /**
             * If true the connection will close as soon as it's write queue
             * is exhausted.
             */
            bool m_close_after_writes;
        
            /**
             * The read timeout.
             */
            std::uint32_t m_read_timeout;
        
            /**
             * The write timeout.
             */
            std::uint32_t m_write_timeout;
        
            /**
             * The completion handler.
             */
            std::function<
                void (boost::system::error_code, std::shared_ptr<tcp_transport>)
            > m_on_complete;
        
            /**
             * The read handler.
             */
            std::function<
                void (std::shared_ptr<tcp_transport>, const char *,
                const std::size_t &)
            > m_on_read;
            
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
             * The connect timeout timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > connect_timeout_timer_;
        
            /**
             * The read timeout timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > read_timeout_timer_;
        
            /**
             * The write timeout timer.
             */
            boost::asio::basic_waitable_timer<
                std::chrono::steady_clock
            > write_timeout_timer_;
        
            /**
             * The write queue.
             */
            std::deque< std::vector<char> > write_queue_;
        
            /**
             * The read buffer.
             */
            char read_buffer_[8192];
        
            /**
             * The read queue.
             */
            std::string read_queue_;
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_TCP_TRANSPORT_HPP
