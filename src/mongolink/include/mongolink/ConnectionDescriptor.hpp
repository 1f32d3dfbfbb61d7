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

#ifndef HEADER_B9D029BC_24C4_42ED_8EAD_1F2D5648F12C_INCLUDED
#define HEADER_B9D029BC_24C4_42ED_8EAD_1F2D5648F12C_INCLUDED

#include <string>

#include <mongolink/ConnectionOptions.hpp>

namespace mongolink {

/**
 * A connection target plus the resolved options to open it with.
 *
 * Computed once per connection attempt and handed to the driver as-is.
 */
struct ConnectionDescriptor {
    std::string target;
    ConnectionOptions options;

    /**
     * @return `target` with any password replaced by `[REDACTED]`. Use this for logging.
     */
    std::string redactedTarget() const;
};

}  // namespace mongolink

#endif  // HEADER_B9D029BC_24C4_42ED_8EAD_1F2D5648F12C_INCLUDED
