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

#ifndef HEADER_53C28660_151C_4BD8_B637_F3A473690A0C_INCLUDED
#define HEADER_53C28660_151C_4BD8_B637_F3A473690A0C_INCLUDED

#include <string>

#include <boost/log/trivial.hpp>

namespace mongolink {

/**
 * @param level one of trace/debug/info/warning/error/fatal
 * @throws InvalidConfigurationException for any other value
 */
boost::log::trivial::severity_level parseVerbosity(const std::string& level);

/**
 * Only emit Boost.Log records at `level` or above.
 */
void setLogVerbosity(boost::log::trivial::severity_level level);

}  // namespace mongolink

#endif  // HEADER_53C28660_151C_4BD8_B637_F3A473690A0C_INCLUDED
