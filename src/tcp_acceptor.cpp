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

#include <cloudsim/constants.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/tcp_acceptor.hpp>
#include <cloudsim/tcp_transport.hpp>

using namespace cloudsim;

tcp_acceptor::tcp_acceptor(
    boost::asio::io_service & ios, const std::size_t & connections_maximum
    )
    : m_connections_maximum(connections_maximum)
    , io_service_(ios)
    , strand_(ios)
    , acceptor_(ios)
    , transports_timer_(ios)
{
    // ...
}

void tcp_acceptor::open(const std::string & host, const std::uint16_t & port)
{
    if (acceptor_.is_open())
    {
        throw std::runtime_error("acceptor is already open");
    }
    
    boost::system::error_code ec;
    
    auto addr = boost::asio::ip::address_v4::any();
    
    if (host.size() > 0)
    {
        addr = boost::asio::ip::address_v4::from_string(host, ec);
        
        if (ec)
        {
            throw std::runtime_error(
                "invalid listen address " + host + ", what = " + ec.message()
            );
        }
    }
    
    /**
     * Allocate the endpoint.
     */
    boost::asio::ip::tcp::endpoint endpoint(addr, port);
    
    /**
     * Open the socket.
     */
    acceptor_.open(boost::asio::ip::tcp::v4(), ec);
    
    if (ec)
    {
        throw std::runtime_error(ec.message());
    }
    
    /**
     * Set option SO_REUSEADDR.
     */
    acceptor_.set_option(
        boost::asio::ip::tcp::acceptor::reuse_address(true)
    );
    
    /**
     * Bind the socket.
     */
    acceptor_.bind(endpoint, ec);
   
    if (ec)
    {
        acceptor_.close();
        
        throw std::runtime_error("bind failed, what = " + ec.message());
    }
    
    /**
     * Listen
     */
    acceptor_.listen(boost::asio::socket_base::max_connections, ec);
    
    if (ec)
    {
        acceptor_.close();
        
        throw std::runtime_error("listen failed, what = " + ec.message());
    }
    
    log_info("TCP acceptor listening on " << acceptor_.local_endpoint() << ".");
    
    /**
     * Accept
     */
    do_accept();
    
    /**
     * Start the tick timer.
     */
    do_tick(1);
}

void tcp_acceptor::close()
{
    auto self(shared_from_this());
    
    io_service_.post(strand_.wrap(
        [this, self]()
    {
        boost::system::error_code ignored_ec;
        
        acceptor_.close(ignored_ec);
        
        transports_timer_.cancel();
        
        std::lock_guard<std::recursive_mutex> l(tcp_transports_mutex_);
        
        for (auto & i : m_tcp_transports)
        {
            if (auto t = i.lock())
            {
                t->stop();
            }
        }
        
        m_tcp_transports.clear();
    }));
}

const boost::asio::ip::tcp::endpoint tcp_acceptor::local_endpoint() const
{
    return acceptor_.local_endpoint();
}

void tcp_acceptor::set_on_accept(
    const std::function<void (const boost::asio::ip::tcp::endpoint &)> & f
    )
{
    m_on_accept = f;
}

void tcp_acceptor::set_on_request(
    const std::function<std::string (const char *, const std::size_t &)> & f
    )
{
    m_on_request = f;
}

std::size_t tcp_acceptor::connections() const
{
    std::lock_guard<std::recursive_mutex> l(tcp_transports_mutex_);
    
    std::size_t ret = 0;
    
    for (auto & i : m_tcp_transports)
    {
        if (auto t = i.lock())
        {
            if (t->state() == tcp_transport::state_connected)
            {
                ++ret;
            }
        }
    }
    
    return ret;
}

void tcp_acceptor::do_accept()
{
    auto self(shared_from_this());
    
    auto t = std::make_shared<tcp_transport>(io_service_);
    
    acceptor_.async_accept(t->socket(), strand_.wrap(
        [this, self, t](boost::system::error_code ec)
    {
        if (ec)
        {
            if (ec == boost::asio::error::operation_aborted)
            {
                return;
            }
            
            log_debug("TCP acceptor accept failed, message = " << ec.message());
        }
        else
        {
            try
            {
                boost::asio::ip::tcp::endpoint remote_endpoint =
                    t->socket().remote_endpoint()
                ;
                
                if (connections() >= m_connections_maximum)
                {
                    log_warn(
                        "TCP acceptor dropping connection from " <<
                        remote_endpoint << ", " << m_connections_maximum <<
                        " connections in progress."
                    );
                    
                    boost::system::error_code ignored_ec;
                    
                    t->socket().close(ignored_ec);
                }
                else
                {
                    log_debug(
                        "Accepting tcp connection from " << remote_endpoint
                    );
                    
                    if (m_on_accept)
                    {
                        m_on_accept(remote_endpoint);
                    }
                    
                    t->set_read_timeout(constants::tcp_read_timeout);
                    t->set_write_timeout(constants::tcp_read_timeout);
                    
                    t->set_on_read(
                        [this](std::shared_ptr<tcp_transport> transport,
                        const char * buf, const std::size_t & len)
                    {
                        std::string response;
                        
                        if (m_on_request)
                        {
                            response = m_on_request(buf, len);
                        }
                        
                        transport->set_close_after_writes(true);
                        
                        if (response.size() > 0)
                        {
                            transport->write(response.data(), response.size());
                        }
                        else
                        {
                            transport->stop();
                        }
                    });
                    
                    std::lock_guard<std::recursive_mutex> l(
                        tcp_transports_mutex_
                    );
                    
                    m_tcp_transports.push_back(t);
                    
                    t->start();
                }
            }
            catch (std::exception & e)
            {
                log_debug("TCP acceptor remote_endpoint, what = " << e.what());
            }
        }
        
        if (acceptor_.is_open())
        {
            do_accept();
        }
    }));
}

void tcp_acceptor::do_tick(const std::uint32_t & seconds)
{
    auto self(shared_from_this());
    
    transports_timer_.expires_from_now(std::chrono::seconds(seconds));
    transports_timer_.async_wait(strand_.wrap(
        [this, self, seconds](boost::system::error_code ec)
    {
        if (ec)
        {
            // ...
        }
        else
        {
            std::lock_guard<std::recursive_mutex> l(tcp_transports_mutex_);
            
            auto it = m_tcp_transports.begin();
            
            while (it != m_tcp_transports.end())
            {
                if (auto t = it->lock())
                {
                     ++it;
                }
                else
                {
                   it = m_tcp_transports.erase(it);
                }
            }
            
            do_tick(seconds);
        }
    }));
}
