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

#include <chrono>

#include <boost/asio.hpp>

#include <cloudsim/logger.hpp>
#include <cloudsim/protocol.hpp>
#include <cloudsim/udp_probe.hpp>

using namespace cloudsim;

error_code_t udp_probe::probe(
    const std::string & host, const std::uint16_t & port,
    const std::uint32_t & timeout
    )
{
    if (port == 0)
    {
        return error_code_probe_timeout;
    }
    
    error_code_t ret = error_code_probe_timeout;
    
    try
    {
        boost::asio::io_service ios;
        
        boost::asio::ip::udp::resolver resolver(ios);
        boost::asio::ip::udp::resolver::query query(
            boost::asio::ip::udp::v4(), host, std::to_string(port)
        );
        
        boost::asio::ip::udp::endpoint endpoint = *resolver.resolve(query);
        
        boost::asio::ip::udp::socket socket(ios);
        
        socket.open(boost::asio::ip::udp::v4());
        
        std::string request = protocol::probe_request;
        
        socket.send_to(boost::asio::buffer(request), endpoint);
        
        boost::asio::basic_waitable_timer<
            std::chrono::steady_clock
        > timer(ios);
        
        char buf[1024];
        
        boost::asio::ip::udp::endpoint remote_endpoint;
        
        socket.async_receive_from(boost::asio::buffer(buf), remote_endpoint,
            [&](boost::system::error_code ec, std::size_t len)
        {
            timer.cancel();
            
            if (ec)
            {
                log_debug(
                    "UDP probe to " << endpoint << " failed, message = " <<
                    ec.message() << "."
                );
            }
            else if (
                std::string(buf, len).find(protocol::probe_alive) !=
                std::string::npos
                )
            {
                ret = error_code_none;
            }
        });
        
        timer.expires_from_now(std::chrono::milliseconds(timeout));
        timer.async_wait([&](boost::system::error_code ec)
        {
            if (ec)
            {
                // ...
            }
            else
            {
                boost::system::error_code ignored_ec;
                
                socket.close(ignored_ec);
            }
        });
        
        ios.run();
    }
    catch (std::exception & e)
    {
        log_debug("UDP probe to " << host << " failed, what = " << e.what());
        
        ret = error_code_transport;
    }
    
    return ret;
}
