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

#include <stdexcept>

#include <cloudsim/logger.hpp>
#include <cloudsim/message.hpp>
#include <cloudsim/protocol.hpp>
#include <cloudsim/random.hpp>
#include <cloudsim/udp_responder.hpp>

using namespace cloudsim;

udp_responder::udp_responder(
    boost::asio::io_service & ios, const std::string & node_id
    )
    : m_node_id(node_id)
    , m_port(0)
    , strand_(ios)
    , socket_(ios)
{
    // ...
}

void udp_responder::open(
    const std::uint16_t & port, const std::uint16_t & port_minimum,
    const std::uint16_t & port_maximum
    )
{
    if (socket_.is_open())
    {
        throw std::runtime_error("udp responder is already open");
    }
    
    boost::system::error_code ec;
    
    /**
     * A random port is retried a few times before giving up.
     */
    auto attempts = port == 0 ? 8 : 1;
    
    for (auto i = 0; i < attempts; i++)
    {
        std::uint16_t p =
            port == 0 ?
            random::uint16_random_range(port_minimum, port_maximum) : port
        ;
        
        /**
         * Allocate the ipv4 endpoint.
         */
        boost::asio::ip::udp::endpoint endpoint(
            boost::asio::ip::address_v4::any(), p
        );
        
        /**
         * Open the ipv4 socket.
         */
        socket_.open(endpoint.protocol(), ec);
        
        if (ec)
        {
            throw std::runtime_error(ec.message());
        }
        
        /**
         * Bind the ipv4 socket.
         */
        socket_.bind(endpoint, ec);
        
        if (ec)
        {
            log_debug(
                "UDP responder bind to port " << p << " failed, message = " <<
                ec.message() << "."
            );
            
            boost::system::error_code ignored_ec;
            
            socket_.close(ignored_ec);
        }
        else
        {
            m_port = socket_.local_endpoint().port();
            
            break;
        }
    }
    
    if (socket_.is_open() == false)
    {
        throw std::runtime_error(
            "udp responder bind failed, what = " + ec.message()
        );
    }
    
    log_info("UDP responder listening on port " << m_port << ".");
    
    do_receive();
}

void udp_responder::close()
{
    auto self(shared_from_this());
    
    strand_.post([this, self]()
    {
        if (socket_.is_open())
        {
            boost::system::error_code ignored_ec;
            
            socket_.close(ignored_ec);
        }
    });
}

const std::uint16_t & udp_responder::port() const
{
    return m_port;
}

void udp_responder::do_receive()
{
    auto self(shared_from_this());
    
    socket_.async_receive_from(
        boost::asio::buffer(receive_buffer_), remote_endpoint_, strand_.wrap(
        [this, self](boost::system::error_code ec, std::size_t len)
    {
        if (ec)
        {
            if (ec == boost::asio::error::operation_aborted)
            {
                return;
            }
            
            log_debug("UDP responder receive failed, message = " << ec.message());
        }
        else
        {
            handle_datagram(remote_endpoint_, receive_buffer_, len);
        }
        
        if (socket_.is_open())
        {
            do_receive();
        }
    }));
}

void udp_responder::handle_datagram(
    const boost::asio::ip::udp::endpoint & ep, const char * buf,
    const std::size_t & len
    )
{
    std::string request(buf, len);
    
    if (request != protocol::probe_request)
    {
        log_debug("UDP responder ignoring datagram from " << ep << ".");
        
        return;
    }
    
    message response = message::create_status(protocol::probe_alive);
    
    response.put_string("node_id", m_node_id);
    
    if (response.encode())
    {
        boost::system::error_code ec;
        
        /**
         * Perform a blocking send_to.
         */
        socket_.send_to(
            boost::asio::buffer(response.data(), response.size()), ep, 0, ec
        );
        
        if (ec)
        {
            log_debug("UDP responder send failed " << ec.message() << ".");
        }
    }
}
