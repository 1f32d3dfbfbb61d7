// Copyright 2019-present MongoDB Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <mongolink/logging.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/throw_exception.hpp>

#include <mongolink/InvalidConfigurationException.hpp>

namespace mongolink {

boost::log::trivial::severity_level parseVerbosity(const std::string& level) {
    if (level == "trace") {
        return boost::log::trivial::trace;
    }
    if (level == "debug") {
        return boost::log::trivial::debug;
    }
    if (level == "info") {
        return boost::log::trivial::info;
    }
    if (level == "warning") {
        return boost::log::trivial::warning;
    }
    if (level == "error") {
        return boost::log::trivial::error;
    }
    if (level == "fatal") {
        return boost::log::trivial::fatal;
    }

    BOOST_THROW_EXCEPTION(InvalidConfigurationException(
        "Invalid verbosity level '" + level +
        "'. Need one of trace/debug/info/warning/error/fatal"));
}

void setLogVerbosity(boost::log::trivial::severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

}  // namespace mongolink
