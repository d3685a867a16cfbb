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

#ifndef CLOUDSIM_MESSAGE_HPP
#define CLOUDSIM_MESSAGE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include <cloudsim/node_record.hpp>
#include <cloudsim/protocol.hpp>

namespace cloudsim {

    /**
     * Implements a message (a single JSON object exchanged per
     * connection).
     */
    class message
    {
        public:
        
            /**
             * Constructor
             */
            message();
        
            /**
             * Constructor
             * @param action The action.
             */
            explicit message(const protocol::action_t &);
        
            /**
             * Constructor
             * @param buf The buffer.
             * @param len The length.
             */
            message(const char *, const std::size_t &);
        
            /**
             * Encodes
             */
            bool encode();
        
            /**
             * Decodes
             */
            bool decode();
        
            /**
             * The encoded data.
             */
            const char * data() const;
        
            /**
             * The size of the encoded data.
             */
            std::size_t size() const;
        
            /**
             * The encoded data as a string.
             */
            const std::string & str() const;
        
            /**
             * The action (set by the constructor or by decode).
             */
            const protocol::action_t & action() const;
        
            /**
             * The action string as received.
             */
            const std::string & action_name() const;
        
            /**
             * The property tree.
             */
            boost::property_tree::ptree & ptree();
        
            /**
             * The property tree.
             */
            const boost::property_tree::ptree & ptree() const;
        
            /**
             * Puts a (quoted) string value.
             * @param key The key.
             * @param val The value.
             */
            void put_string(const std::string &, const std::string &);
        
            /**
             * The status of a decoded response.
             */
            std::string status() const;
        
            /**
             * The message field of a decoded error response.
             */
            std::string error_message() const;
        
            /**
             * The node_id field of a decoded request.
             */
            std::string node_id() const;
        
            /**
             * Reads the nodes array of a decoded LIST_NODES response.
             * @param nodes_out The nodes (out).
             */
            bool nodes(std::vector<node_record> &) const;
        
            /**
             * Reads the stats object of a decoded STATS response.
             * @param stats_out The network_stats (out).
             */
            bool stats(network_stats &) const;
        
            /**
             * Creates a status only response.
             * @param status The status.
             */
            static message create_status(const std::string &);
        
            /**
             * Creates an error response.
             * @param what The message.
             */
            static message create_error(const std::string &);
        
            /**
             * Creates a REGISTER request.
             * @param record The node_record.
             */
            static message create_register(const node_record &);
        
            /**
             * Creates a request that only carries a node_id.
             * @param action The action.
             * @param node_id The node id.
             */
            static message create_node_request(
                const protocol::action_t &, const std::string &
            );
        
            /**
             * Creates a LIST_NODES response.
             * @param nodes The nodes.
             */
            static message create_node_list(const std::vector<node_record> &);
        
            /**
             * Creates a STATS response.
             * @param stats The network_stats.
             */
            static message create_stats(const network_stats &);
        
        private:
        
            /**
             * The action.
             */
            protocol::action_t m_action;
        
            /**
             * The action string.
             */
            std::string m_action_name;
        
            /**
             * The property tree.
             */
            boost::property_tree::ptree m_ptree;
        
            /**
             * The encoded data.
             */
            std::string m_data;
        
        protected:
        
            // ...
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_MESSAGE_HPP
