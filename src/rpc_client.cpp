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

#include <cloudsim/constants.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/rpc_client.hpp>
#include <cloudsim/tcp_transport.hpp>

using namespace cloudsim;

rpc_client::rpc_client(
    boost::asio::io_service & ios, const std::string & host,
    const std::uint16_t & port
    )
    : m_host(host)
    , m_port(port)
    , m_timeout(constants::tcp_request_timeout_ms)
    , m_finished(false)
    , io_service_(ios)
    , strand_(ios)
    , timeout_timer_(ios)
{
    // ...
}

void rpc_client::set_timeout(const std::uint32_t & val)
{
    m_timeout = val;
}

void rpc_client::start(
    message & request,
    const std::function<void (const error_code_t &, const message &)> & f
    )
{
    m_on_complete = f;
    
    auto self(shared_from_this());
    
    if (request.encode() == false)
    {
        io_service_.post(strand_.wrap(
            [this, self]()
        {
            complete(error_code_malformed_message, message());
        }));
        
        return;
    }
    
    /**
     * The transport only holds a weak reference, the timeout timer keeps
     * us alive until completion.
     */
    std::weak_ptr<rpc_client> weak_self(self);
    
    transport_ = std::make_shared<tcp_transport>(io_service_);
    
    transport_->set_on_read(
        [weak_self](std::shared_ptr<tcp_transport> t, const char * buf,
        const std::size_t & len)
    {
        if (auto c = weak_self.lock())
        {
            message response(buf, len);
            
            auto ec =
                response.decode() ? error_code_none :
                error_code_malformed_message
            ;
            
            c->io_service_.post(c->strand_.wrap(
                [c, ec, response]()
            {
                c->complete(ec, response);
            }));
        }
    });
    
    /**
     * Queued until the connection completes.
     */
    transport_->write(request.data(), request.size());
    
    transport_->start(m_host, m_port,
        [weak_self](boost::system::error_code ec,
        std::shared_ptr<tcp_transport> t)
    {
        if (ec)
        {
            if (auto c = weak_self.lock())
            {
                log_debug(
                    "RPC client connect to " << c->m_host << ":" <<
                    c->m_port << " failed, message = " << ec.message() << "."
                );
                
                c->io_service_.post(c->strand_.wrap(
                    [c]()
                {
                    c->complete(error_code_transport, message());
                }));
            }
        }
    });
    
    timeout_timer_.expires_from_now(std::chrono::milliseconds(m_timeout));
    timeout_timer_.async_wait(strand_.wrap(
        [this, self](boost::system::error_code ec)
    {
        if (ec)
        {
            // ...
        }
        else
        {
            log_debug(
                "RPC client request to " << m_host << ":" << m_port <<
                " timed out after " << m_timeout << "ms."
            );
            
            complete(error_code_transport, message());
        }
    }));
}

error_code_t rpc_client::call(
    const std::string & host, const std::uint16_t & port,
    const std::uint32_t & timeout, message & request, message & response
    )
{
    error_code_t ret = error_code_transport;
    
    boost::asio::io_service ios;
    
    auto c = std::make_shared<rpc_client>(ios, host, port);
    
    c->set_timeout(timeout);
    
    c->start(request,
        [&ret, &response](const error_code_t & ec, const message & msg)
    {
        ret = ec;
        response = msg;
    });
    
    ios.run();
    
    return ret;
}

void rpc_client::complete(const error_code_t & ec, const message & response)
{
    if (m_finished)
    {
        return;
    }
    
    m_finished = true;
    
    timeout_timer_.cancel();
    
    if (transport_)
    {
        transport_->stop();
    }
    
    if (m_on_complete)
    {
        m_on_complete(ec, response);
    }
    
    m_on_complete = std::function<
        void (const error_code_t &, const message &)
    > ();
}
