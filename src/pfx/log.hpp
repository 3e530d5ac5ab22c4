/*
 * Copyright 2015-2016 Nicholas Andrews
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#ifndef __PFX_LOG_HPP__
#define __PFX_LOG_HPP__

#include <string>

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>

namespace logging = boost::log;

#define INFO info
#define WARNING warning
#define FATAL fatal

#define LOG(logger) \
  BOOST_LOG_TRIVIAL(logger) << "(" << __FILE__ << ", " << __LINE__ << ") "

#define DLOG(logger) \
  BOOST_LOG_TRIVIAL(logger) << "(" << __FILE__ << ", " << __LINE__ << ") "

#define VLOG(level) \
  BOOST_LOG_TRIVIAL(debug) << "(" << __FILE__ << ", " << __LINE__ << ") "

#define CHECK(cond) \
  if (!(cond)) BOOST_LOG_TRIVIAL(fatal) << "(" << __FILE__ << ", " << __LINE__ << ") "

namespace pfx {

    inline void set_log_level(logging::trivial::severity_level level) {
        logging::core::get()->set_filter(
            logging::trivial::severity >= level);
    }

    // Accepts trace, debug, info, warning, error or fatal.
    inline bool set_log_level(const std::string& name) {
        logging::trivial::severity_level level;
        if (!logging::trivial::from_string(name.c_str(), name.size(), level)) {
            return false;
        }
        set_log_level(level);
        return true;
    }
}

#endif
