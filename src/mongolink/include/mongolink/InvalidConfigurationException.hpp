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

#ifndef HEADER_C773751B_8BB7_47DC_B8CA_DDD1205E720A_INCLUDED
#define HEADER_C773751B_8BB7_47DC_B8CA_DDD1205E720A_INCLUDED

#include <stdexcept>

namespace mongolink {

/**
 * Throw this to indicate bad configuration.
 *
 * Always raised before any network activity takes place.
 */
class InvalidConfigurationException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace mongolink


#endif  // HEADER_C773751B_8BB7_47DC_B8CA_DDD1205E720A_INCLUDED
