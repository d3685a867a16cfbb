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
#include <csignal>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <cloudsim/arguments.hpp>
#include <cloudsim/configuration.hpp>
#include <cloudsim/controller.hpp>
#include <cloudsim/logger.hpp>
#include <cloudsim/node_agent.hpp>
#include <cloudsim/orchestrator.hpp>

using namespace cloudsim;

static void usage()
{
    std::cout <<
        "Cloud storage simulation.\n\n"
        "Modes:\n"
        "  --network     Start as network controller\n"
        "  --node        Start as storage node\n"
        "  --transfer    Initiate a simulated file transfer\n"
        "  --stats       Print controller stats and registered nodes\n\n"
        "Options (--key=value):\n"
        "  --config        JSON configuration file\n"
        "  --port          Controller TCP port (default 8080)\n"
        "  --host          Controller host (default 127.0.0.1)\n"
        "  --network-port  Controller port for --node\n"
        "  --node-id       Node id (required for --node)\n"
        "  --udp-port      Node UDP port (default random)\n"
        "  --cpu           Node CPU cores (default 4)\n"
        "  --memory        Node memory in GB (default 8)\n"
        "  --storage       Node storage in GB (default 100)\n"
        "  --bandwidth     Node bandwidth in Mbps (default 1000)\n"
        "  --file-name     Transfer file name (default file.bin)\n"
        "  --size-mb       Transfer size in MB (default 10)\n"
        "  --replication   Transfer replication factor (default 2)\n\n"
        "Examples:\n"
        "  cloudsim --network --port=8080\n"
        "  cloudsim --node --node-id=node1 --host=127.0.0.1 "
        "--network-port=8080\n"
        "  cloudsim --transfer --file-name=file.bin --size-mb=10 "
        "--replication=2\n"
    ;
}

static void wait_for_termination()
{
    boost::asio::io_service ios;
    boost::asio::signal_set signals(ios, SIGINT, SIGTERM);
    signals.async_wait(std::bind(&boost::asio::io_service::stop, &ios));
    ios.run();
}

static int run_network(configuration & config)
{
    controller c(config);
    
    /**
     * Start the controller.
     */
    c.start();
    
    std::cout << "[Controller] Listening on TCP " << c.port() << std::endl;
    
    /**
     * Wait for termination.
     */
    wait_for_termination();
    
    /**
     * Stop the controller.
     */
    c.stop();
    
    return 0;
}

static int run_node(configuration & config, const arguments & args)
{
    static const std::int64_t gib = 1024 * 1024 * 1024;
    static const std::int64_t mbps = 1000 * 1000;
    
    auto maximum = std::numeric_limits<std::int64_t>::max();
    
    node_record record;
    
    record.node_id = args.get_string("node-id", "");
    
    if (record.node_id.empty())
    {
        std::cerr << "Error: --node-id is required for --node mode" << std::endl;
        
        return 1;
    }
    
    record.host = "127.0.0.1";
    record.udp_port = static_cast<std::uint16_t> (
        args.get_number("udp-port", 0, 0,
        std::numeric_limits<std::uint16_t>::max())
    );
    record.capacity.cpu_cores = args.get_number("cpu", 4, 0, maximum);
    record.capacity.memory_gb = args.get_number("memory", 8, 0, maximum);
    record.capacity.storage_bytes =
        args.get_number("storage", 100, 0, maximum / gib) * gib
    ;
    record.capacity.bandwidth_bps =
        args.get_number("bandwidth", 1000, 0, maximum / mbps) * mbps
    ;
    
    node_agent n(config, record);
    
    /**
     * Start the node agent.
     */
    n.start();
    
    std::cout <<
        "[Node " << record.node_id << "] started (udp=" <<
        n.record().udp_port << ")" << std::endl
    ;
    
    /**
     * Wait for termination.
     */
    wait_for_termination();
    
    /**
     * Stop the node agent.
     */
    n.stop();
    
    return 0;
}

static int run_transfer(configuration & config, const arguments & args)
{
    static const std::int64_t mib = 1024 * 1024;
    
    auto file_name = args.get_string("file-name", "file.bin");
    auto size_mb = args.get_number(
        "size-mb", 10, 0, std::numeric_limits<std::int64_t>::max() / mib
    );
    auto replication = args.get_number(
        "replication", 2, 1, std::numeric_limits<std::int32_t>::max()
    );
    
    orchestrator o(config);
    
    std::shared_ptr<file_transfer> transfer;
    
    auto ec = o.initiate_transfer(
        file_name, static_cast<std::uint64_t> (size_mb * mib),
        static_cast<std::int32_t> (replication), transfer
    );
    
    if (ec != error_code_none)
    {
        std::cout << "[Orchestrator] " << error_string(ec) << std::endl;
        
        return 1;
    }
    
    std::cout <<
        "[Orchestrator] Transferring " << transfer->file_id() << " (" <<
        transfer->chunk_count() << " chunks) to" 
    ;
    
    for (auto & i : transfer->target_nodes())
    {
        std::cout << " " << i;
    }
    
    std::cout << std::endl;
    
    /**
     * The deadline plus some slack.
     */
    o.wait(
        transfer, std::chrono::milliseconds(
        config.transfer_deadline_ms() + 10000)
    );
    
    o.stop();
    
    std::cout <<
        "[Orchestrator] Status: " <<
        transfer_status_string(transfer->status()) << std::endl
    ;
    
    return transfer->status() == transfer_status_completed ? 0 : 1;
}

static int run_stats(configuration & config)
{
    orchestrator o(config);
    
    network_stats stats;
    
    std::vector<node_record> nodes;
    
    if (o.stats(stats) == false || o.list_nodes(nodes) == false)
    {
        std::cout << "[Stats] Controller did not respond OK" << std::endl;
        
        return 1;
    }
    
    std::cout <<
        "[Stats] Controller Stats\n"
        "  total_nodes: " << stats.total_nodes << "\n"
        "  active_nodes: " << stats.active_nodes << "\n"
        "  total_connections: " << stats.total_connections << "\n"
        "  total_data_transferred: " << stats.total_data_transferred << "\n"
        "  total_storage_capacity: " << stats.total_storage_capacity << "\n"
        "  total_bandwidth_capacity: " << stats.total_bandwidth_capacity <<
        "\n[Stats] Registered Nodes" << std::endl
    ;
    
    for (auto & i : nodes)
    {
        std::cout <<
            "  - " << i.node_id << ": active=" <<
            (i.active ? "true" : "false") << ", host=" << i.host <<
            " udp=" << i.udp_port << "\n    capacity: cpu=" <<
            i.capacity.cpu_cores << " mem=" << i.capacity.memory_gb <<
            "GB storage=" << i.capacity.storage_bytes << "B bw=" <<
            i.capacity.bandwidth_bps << "bps" << std::endl
        ;
    }
    
    return 0;
}

int main(int argc, const char * argv[])
{
    int ret = 0;
    
    arguments args(argc, argv);
    
    auto network = args.has("network");
    auto node = args.has("node");
    auto transfer = args.has("transfer");
    auto stats = args.has("stats");
    
    if (args.has("help") || (!network && !node && !transfer && !stats))
    {
        usage();
        
        return 0;
    }
    
    try
    {
        configuration config;
        
        if (args.has("config"))
        {
            auto path = args.get_string("config", "");
            
            if (config.load(path) == false)
            {
                std::cerr << "Error: failed to load " << path << std::endl;
                
                return 1;
            }
        }
        
        /**
         * Map the command line names onto configuration keys.
         */
        std::map<std::string, std::string> config_args = args.args();
        
        if (args.has("host"))
        {
            config_args["controller.host"] = args.get_string("host", "");
        }
        
        if (node && args.has("network-port"))
        {
            config_args["controller.port"] =
                args.get_string("network-port", "")
            ;
        }
        else if (args.has("port"))
        {
            config_args["controller.port"] = args.get_string("port", "");
        }
        
        if (config.set_args(config_args) == false)
        {
            return 1;
        }
        
        if (network)
        {
            /**
             * The controller listens on all interfaces unless told
             * otherwise.
             */
            if (args.has("controller.host") == false)
            {
                config.set_controller_host("0.0.0.0");
            }
            
            ret = run_network(config);
        }
        else if (node)
        {
            ret = run_node(config, args);
        }
        else if (transfer)
        {
            ret = run_transfer(config, args);
        }
        else
        {
            ret = run_stats(config);
        }
    }
    catch (std::exception & e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        
        ret = 1;
    }
    
    return ret;
}
