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

#include <sstream>

#include <cloudsim/logger.hpp>
#include <cloudsim/protocol.hpp>
#include <cloudsim/tcp_transport.hpp>
#include <cloudsim/utility.hpp>

using namespace cloudsim;

tcp_transport::tcp_transport(boost::asio::io_service & ios)
    : m_state(state_disconnected)
    , m_socket(ios)
    , m_close_after_writes(false)
    , m_read_timeout(0)
    , m_write_timeout(0)
    , io_service_(ios)
    , strand_(ios)
    , connect_timeout_timer_(ios)
    , read_timeout_timer_(ios)
    , write_timeout_timer_(ios)
{
    // ...
}

tcp_transport::~tcp_transport()
{
    // ...
}
        
void tcp_transport::start(
    const std::string & hostname, const std::uint16_t & port,
    const std::function<void (boost::system::error_code,
    std::shared_ptr<tcp_transport>)> & f
    )
{
    /**
     * Set the completion handler.
     */
    m_on_complete = f;

    auto self(shared_from_this());
    
    connect_timeout_timer_.expires_from_now(std::chrono::seconds(3));
    connect_timeout_timer_.async_wait(strand_.wrap(
        [this, self](boost::system::error_code ec)
    {
        if (ec)
        {
            // ...
        }
        else if (m_state == state_connecting)
        {
            log_debug(
                "TCP transport connect operation timed out after 3 "
                "seconds, closing."
            );
            
            do_close();
        }
    }));
    
    try
    {
        boost::asio::ip::tcp::resolver resolver(io_service_);
        boost::asio::ip::tcp::resolver::query query(
            hostname, std::to_string(port)
        );
        do_connect(resolver.resolve(query));
    }
    catch (std::exception & e)
    {
        log_debug("TCP transport resolve failed, what = " << e.what());
        
        connect_timeout_timer_.cancel();
        
        io_service_.post(strand_.wrap(
            [this, self]()
        {
            if (m_on_complete)
            {
                m_on_complete(boost::asio::error::host_not_found, self);
            }
        }));
    }
}

void tcp_transport::start()
{
    auto self(shared_from_this());
    
    io_service_.post(strand_.wrap(
        [this, self]()
    {    
        m_state = state_connected;
        
        do_read();
    }));
}
        
void tcp_transport::stop()
{
    auto self(shared_from_this());
    
    io_service_.post(strand_.wrap(
        [this, self]()
    {
        do_close();
    }));
}

void tcp_transport::set_on_read(
    const std::function<void (std::shared_ptr<tcp_transport>, const char *,
    const std::size_t &)> & f
    )
{
    m_on_read = f;
}

void tcp_transport::write(const char * buf, const std::size_t & len)
{
    auto self(shared_from_this());
    
    std::vector<char> buffer(buf, buf + len);
    
    strand_.post(
        [this, self, buffer]()
    {
        bool write_in_progress = !write_queue_.empty();
        
        write_queue_.push_back(buffer);
      
        /**
         * Writes queued before the connection completes are sent by
         * do_connect.
         */
        if (!write_in_progress && m_state == state_connected)
        {
            do_write(&write_queue_.front()[0], write_queue_.front().size());
        }
    });
}

tcp_transport::state_t tcp_transport::state() const
{
    return m_state;
}

boost::asio::ip::tcp::socket & tcp_transport::socket()
{
    return m_socket;
}

void tcp_transport::set_close_after_writes(const bool & flag)
{
    m_close_after_writes = flag;
}

void tcp_transport::set_read_timeout(const std::uint32_t & val)
{
    m_read_timeout = val;
}

void tcp_transport::set_write_timeout(const std::uint32_t & val)
{
    m_write_timeout = val;
}

void tcp_transport::do_connect(
    boost::asio::ip::tcp::resolver::iterator endpoint_iterator
    )
{
    auto self(shared_from_this());
    
    m_state = state_connecting;
    
    boost::asio::async_connect(m_socket, endpoint_iterator, strand_.wrap(
        [this, self](boost::system::error_code ec,
        boost::asio::ip::tcp::resolver::iterator)
    {
        connect_timeout_timer_.cancel();
        
        if (ec)
        {
            do_close();
            
            if (m_on_complete)
            {
                m_on_complete(ec, self);
            }
        }
        else
        {
            m_state = state_connected;
            
            if (m_on_complete)
            {
                m_on_complete(ec, self);
            }
    
            if (!write_queue_.empty())
            {
                do_write(
                    &write_queue_.front()[0], write_queue_.front().size()
                );
            }
            
            do_read();
        }
    }));
}

void tcp_transport::do_read()
{
    if (m_state == state_connected)
    {
        auto self(shared_from_this());

        if (m_read_timeout > 0)
        {
            read_timeout_timer_.expires_from_now(
                std::chrono::seconds(m_read_timeout)
            );
            read_timeout_timer_.async_wait(strand_.wrap(
                [this, self](boost::system::error_code ec)
            {
                if (ec)
                {
                    // ...
                }
                else
                {
                    log_debug("TCP transport receive timed out, closing.");
                    
                    do_close();
                }
            }));
        }
        
        m_socket.async_read_some(boost::asio::buffer(read_buffer_),
            strand_.wrap([this, self](boost::system::error_code ec,
            std::size_t len)
        {
            read_timeout_timer_.cancel();
            
            if (ec)
            {
                /**
                 * The peer half closed after sending, hand over what we
                 * have.
                 */
                if (ec == boost::asio::error::eof && !read_queue_.empty())
                {
                    deliver();
                    
                    /**
                     * Runs after any write the read handler queued.
                     */
                    strand_.post([this, self]()
                    {
                        if (write_queue_.empty() || m_state != state_connected)
                        {
                            do_close();
                        }
                        else
                        {
                            m_close_after_writes = true;
                        }
                    });
                }
                else if (write_queue_.empty() || m_state != state_connected)
                {
                    /**
                     * Pending writes close the socket once drained.
                     */
                    do_close();
                }
                else
                {
                    m_close_after_writes = true;
                }
            }
            else
            {
                /**
                 * Append to the read queue.
                 */
                read_queue_.append(read_buffer_, len);
                
                if (read_queue_.size() > protocol::message_length_maximum)
                {
                    log_debug(
                        "TCP transport read queue exceeded " <<
                        protocol::message_length_maximum << " bytes, closing."
                    );
                    
                    read_queue_.clear();
                    
                    do_close();
                    
                    return;
                }
                
                /**
                 * Check if we have received a full message.
                 */
                if (utility::is_complete_json(read_queue_))
                {
                    deliver();
                }
                
                do_read();
            }
        }));
    }
}

void tcp_transport::do_write(const char * buf, const std::size_t & len)
{
    auto self(shared_from_this());

    if (m_write_timeout > 0)
    {
        write_timeout_timer_.expires_from_now(
            std::chrono::seconds(m_write_timeout)
        );
        write_timeout_timer_.async_wait(strand_.wrap(
            [this, self](boost::system::error_code ec)
        {
            if (ec)
            {
                // ...
            }
            else
            {
                log_debug("TCP transport write timed out, closing.");
                
                do_close();
            }
        }));
    }
    
    boost::asio::async_write(m_socket, boost::asio::buffer(buf, len),
        strand_.wrap([this, self](boost::system::error_code ec, std::size_t)
    {
        write_timeout_timer_.cancel();
        
        if (ec || write_queue_.empty())
        {
            do_close();
        }
        else
        {
            write_queue_.pop_front();
            
            if (write_queue_.empty())
            {
                if (m_close_after_writes)
                {
                    log_none("TCP transport write queue is empty, closing.");
                    
                    do_close();
                }
            }
            else
            {
                do_write(
                    &write_queue_.front()[0], write_queue_.front().size()
                );
            }
        }
    }));
}

void tcp_transport::deliver()
{
    std::string buffer;
    
    buffer.swap(read_queue_);
    
    /**
     * Callback
     */
    if (m_on_read)
    {
        m_on_read(shared_from_this(), buffer.data(), buffer.size());
    }
}

void tcp_transport::do_close()
{
    connect_timeout_timer_.cancel();
    read_timeout_timer_.cancel();
    write_timeout_timer_.cancel();
    
    if (m_socket.is_open())
    {
        boost::system::error_code ignored_ec;
        
        m_socket.shutdown(
            boost::asio::ip::tcp::socket::shutdown_both, ignored_ec
        );
        m_socket.close(ignored_ec);
    }
    
    m_state = state_disconnected;
    
    write_queue_.clear();
}
