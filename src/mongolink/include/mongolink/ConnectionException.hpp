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

#ifndef HEADER_A8500A75_FDB6_4BE9_8074_761691671FFB_INCLUDED
#define HEADER_A8500A75_FDB6_4BE9_8074_761691671FFB_INCLUDED

#include <stdexcept>

namespace mongolink {

/**
 * The driver reported a successful connect but handed back no database handle.
 *
 * Errors raised by the driver itself are never wrapped in this type; they reach
 * the caller exactly as the driver threw them.
 */
class ConnectionException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace mongolink

#endif  // HEADER_A8500A75_FDB6_4BE9_8074_761691671FFB_INCLUDED
