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

#ifndef CLOUDSIM_LOGGER_HPP
#define CLOUDSIM_LOGGER_HPP

#include <chrono>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace cloudsim {

    /**
     * Implements a logger.
     */
    class logger
    {
        public:

            /**
             * @param severity_none
             * @param severity_debug
             * @param severity_error
             * @param severity_info
             * @param severity_warning
             */
            typedef enum severity
            {
                severity_none,
                severity_debug,
                severity_error,
                severity_info,
                severity_warning,
            } severity_t;

            /**
             * Singleton accessor.
             */
            static logger & instance()
            {
                static logger g_logger;

                return g_logger;
            }

            /**
             * operator <<
             */
            template <class T>
            logger & operator << (T const & val)
            {
                std::stringstream ss;

                ss << val;

                log(ss);

                ss.str(std::string());

                return logger::instance();
            }

            /**
             * Perform the actual logging.
             * @param val
             */
            void log(std::stringstream & val)
            {
                std::lock_guard<std::recursive_mutex> lock(mutex_);

                if (m_enabled)
                {
                    std::cerr << val.str() << std::endl;
                }
            }

            /**
             * Enables or disables output (tests silence the logger).
             * @param val The value.
             */
            void set_enabled(const bool & val)
            {
                std::lock_guard<std::recursive_mutex> lock(mutex_);

                m_enabled = val;
            }

        private:

            /**
             * Constructor
             */
            logger()
                : m_enabled(true)
            {
                // ...
            }

            /**
             * If false nothing is written.
             */
            bool m_enabled;

        protected:

            /**
             * The mutex.
             */
            std::recursive_mutex mutex_;
    };

    #define log_xx(severity, strm) \
    { \
        std::time_t time_now = std::chrono::system_clock::to_time_t( \
            std::chrono::system_clock::now()); \
        std::string time_str = std::ctime(&time_now); \
        time_str.pop_back(), time_str.pop_back(); \
        time_str.pop_back(), time_str.pop_back(); \
        time_str.pop_back(), time_str.pop_back(); \
        std::stringstream __ss; \
        switch (severity) \
        { \
            case cloudsim::logger::severity_debug: \
                __ss << time_str << " cloudsim[DEBUG] - "; \
            break; \
            case cloudsim::logger::severity_error: \
                __ss << time_str << " cloudsim[ERROR] - "; \
            break; \
            case cloudsim::logger::severity_info: \
                __ss << time_str << " cloudsim[INFO] - "; \
            break; \
            case cloudsim::logger::severity_warning: \
                __ss << time_str << " cloudsim[WARNING] - "; \
            break; \
            default: \
                __ss << time_str << " cloudsim[UNKNOWN] - "; \
        } \
        __ss << __FUNCTION__ << ": "; \
        __ss << strm; \
        cloudsim::logger::instance() << __ss.str(); \
        __ss.str(std::string()); \
    } \

#define log_none(strm) /** */
#if (defined NDEBUG && !defined DEBUG)
#define log_debug(strm) log_none(strm)
#else
#define log_debug(strm) log_xx(cloudsim::logger::severity_debug, strm)
#endif
#define log_error(strm) log_xx(cloudsim::logger::severity_error, strm)
#define log_info(strm) log_xx(cloudsim::logger::severity_info, strm)
#define log_warn(strm) log_xx(cloudsim::logger::severity_warning, strm)

} // namespace cloudsim

#endif // CLOUDSIM_LOGGER_HPP
