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

#ifndef CLOUDSIM_UDP_RESPONDER_HPP
#define CLOUDSIM_UDP_RESPONDER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio.hpp>

namespace cloudsim {

    /**
     * Implements the node side UDP liveness responder.
     */
    class udp_responder
        : public std::enable_shared_from_this<udp_responder>
    {
        public:
        
            /**
             * Constructor
             * @param ios The boost::asio::io_service.
             * @param node_id The node id echoed in replies.
             */
            udp_responder(
                boost::asio::io_service & ios, const std::string & node_id
            );
        
            /**
             * Opens the socket.
             * @param port The port, 0 picks a random port in
             * [port_minimum, port_maximum].
             * @param port_minimum The lowest random port.
             * @param port_maximum The highest random port.
             */
            void open(
                const std::uint16_t & port,
                const std::uint16_t & port_minimum,
                const std::uint16_t & port_maximum
            );
        
            /**
             * Closes the socket.
             */
            void close();
        
            /**
             * The bound port.
             */
            const std::uint16_t & port() const;
        
        private:
        
            void do_receive();
        
            /**
             * Handles a datagram.
             * @param ep The boost::asio::ip::udp::endpoint.
             * @param buf The buffer.
             * @param len The length.
             */
            void handle_datagram(
                const boost::asio::ip::udp::endpoint & ep, const char * buf,
                const std::size_t & len
            );
        
            /**
             * The node id.
             */
            std::string m_node_id;
        
            /**
             * The bound port.
             */
            std::uint16_t m_port;
        
        protected:
        
            /**
             * The boost::asio::io_service::strand.
             */
            boost::asio::io_service::strand strand_;
        
            /**
             * The socket.
             */
            boost::asio::ip::udp::socket socket_;
        
            /**
             * The remote endpoint.
             */
            boost::asio::ip::udp::endpoint remote_endpoint_;
        
            /**
             * The receive buffer.
             */
            char receive_buffer_[1024];
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_UDP_RESPONDER_HPP
