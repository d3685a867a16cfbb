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

#ifndef CLOUDSIM_JSON_PARSER_HPP
#define CLOUDSIM_JSON_PARSER_HPP

#include <algorithm>
#include <ostream>
#include <string>

#include <boost/next_prior.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/type_traits/make_unsigned.hpp>

namespace cloudsim {

    /** 
     * Implements a typed JSON writer for boost::property_tree::ptree.
     * Leaf values are written verbatim so numbers and booleans stay
     * unquoted, strings must be put with the translator which quotes and
     * escapes them.
     */
    class json_parser
    {
        public:
        
            template <typename T>
            struct translator
            {
                typedef T internal_type;
                typedef T external_type;

                boost::optional<T> get_value(const T & v)
                {
                    if (v.size() < 2)
                    {
                        return boost::optional<T> ();
                    }
                    
                    return v.substr(1, v.size() - 2);
                }
                
                boost::optional<T> put_value(const T & v)
                {
                    return '"' + create_escapes(v) + '"';
                }
            };

            template<class Ptree>
            static void write_json(
                std::basic_ostream<typename Ptree::key_type::value_type> &
                stream, const Ptree & pt, bool pretty = false
                )
            {
                write_json_internal(
                    stream, pt, std::string(), pretty
                );
            }
        
            template<class Ch>
            static std::basic_string<Ch> create_escapes(
                const std::basic_string<Ch> & s
                )
            {
                std::basic_string<Ch> result;
                
                auto b = s.begin();
                auto e = s.end();
                
                while (b != e)
                {
                    typedef typename boost::make_unsigned<Ch>::type UCh;
                    
                    auto c = static_cast<UCh> (*b);
                    
                    if (*b == Ch('"'))
                    {
                        result += Ch('\\'), result += Ch('"');
                    }
                    else if (*b == Ch('\\'))
                    {
                        result += Ch('\\'), result += Ch('\\');
                    }
                    else if (*b == Ch('\b'))
                    {
                        result += Ch('\\'), result += Ch('b');
                    }
                    else if (*b == Ch('\f'))
                    {
                        result += Ch('\\'), result += Ch('f');
                    }
                    else if (*b == Ch('\n'))
                    {
                        result += Ch('\\'), result += Ch('n');
                    }
                    else if (*b == Ch('\r'))
                    {
                        result += Ch('\\'), result += Ch('r');
                    }
                    else if (*b == Ch('\t'))
                    {
                        result += Ch('\\'), result += Ch('t');
                    }
                    else if (c < 0x20)
                    {
                        const char * hexdigits = "0123456789ABCDEF";
                        
                        unsigned long u = static_cast<unsigned long> (c);
                        
                        result += Ch('\\'); result += Ch('u');
                        result += Ch('0'); result += Ch('0');
                        result += Ch(hexdigits[u / 16]);
                        result += Ch(hexdigits[u % 16]);
                    }
                    else
                    {
                        result += *b;
                    }
                    ++b;
                }
                return result;
            }
        
        private:
        
            // ...
        
        protected:

            template<class Ptree>
            static void write_json_helper(
                std::basic_ostream<typename Ptree::key_type::value_type> &
                stream, const Ptree & pt, int indent, bool pretty
                )
            {
                typedef typename Ptree::key_type::value_type Ch;
                typedef typename std::basic_string<Ch> Str;

                if (pt.empty())
                {
                    auto data = pt.template get_value<Str>();
                    
                    /**
                     * A childless node without data is an empty array.
                     */
                    if (data.empty())
                    {
                        stream << Ch('[') << Ch(']');
                    }
                    else
                    {
                        stream << data;
                    }
                }
                else if (pt.count(Str()) == pt.size())
                {
                    stream << Ch('[');
                    
                    if (pretty)
                    {
                        stream << Ch('\n');
                    }
                    
                    auto it = pt.begin();
                    
                    for (; it != pt.end(); ++it)
                    {
                        if (pretty)
                        {
                            stream << Str(4 * (indent + 1), Ch(' '));
                        }
                        
                        write_json_helper(
                            stream, it->second, indent + 1, pretty
                        );
                        
                        if (boost::next(it) != pt.end())
                        {
                            stream << Ch(',');
                        }
                        
                        if (pretty)
                        {
                            stream << Ch('\n');
                        }
                    }
                    
                    if (pretty)
                    {
                        stream << Str(4 * indent, Ch(' '));
                    }
                    
                    stream << Ch(']');
                }
                else
                {
                    stream << Ch('{');
                    
                    if (pretty)
                    {
                        stream << Ch('\n');
                    }
                    
                    typename Ptree::const_iterator it = pt.begin();
                    
                    for (; it != pt.end(); ++it)
                    {
                        if (pretty)
                        {
                            stream << Str(4 * (indent + 1), Ch(' '));
                        }
                        
                        stream << Ch('"') <<
                            create_escapes(it->first) << Ch('"') << Ch(':')
                        ;
                        
                        if (pretty)
                        {
                            stream << Ch(' ');
                        }
                        
                        write_json_helper(
                            stream, it->second, indent + 1, pretty
                        );
                        
                        if (boost::next(it) != pt.end())
                        {
                            stream << Ch(',');
                        }
                        
                        if (pretty)
                        {
                            stream << Ch('\n');
                        }
                    }
                    
                    if (pretty)
                    {
                        stream << Str(4 * indent, Ch(' '));
                    }
                    
                    stream << Ch('}');
                }
            }

            template<class Ptree>
            static bool verify_json(const Ptree & pt, int depth)
            {
                typedef typename Ptree::key_type::value_type Ch;
                typedef typename std::basic_string<Ch> Str;

                if (depth == 0 && !pt.template get_value<Str>().empty())
                {
                    return false;
                }
                
                if (!pt.template get_value<Str>().empty() && !pt.empty())
                {
                    return false;
                }
                
                typename Ptree::const_iterator it = pt.begin();
                
                for (; it != pt.end(); ++it)
                {
                    if (!verify_json(it->second, depth + 1))
                    {
                        return false;
                    }
                }
                
                return true;
            }

            template<class Ptree>
            static void write_json_internal(
                std::basic_ostream<typename Ptree::key_type::value_type> &
                stream, const Ptree & pt, const std::string & filename,
                bool pretty
                )
            {
                if (verify_json(pt, 0) == false)
                {
                    BOOST_PROPERTY_TREE_THROW(
                        boost::property_tree::json_parser::json_parser_error(
                        "ptree contains data that cannot be represented "
                        "in JSON format", filename, 0)
                    );
                }
                
                write_json_helper(stream, pt, 0, pretty);
                
                if (stream.good() == false)
                {
                    BOOST_PROPERTY_TREE_THROW(
                        boost::property_tree::json_parser::json_parser_error(
                        "write error", filename, 0)
                    );
                }
            }
    };
    
} // namespace cloudsim

#endif // CLOUDSIM_JSON_PARSER_HPP
