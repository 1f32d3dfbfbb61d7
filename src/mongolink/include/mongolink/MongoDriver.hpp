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

#ifndef HEADER_15CC2797_F424_48C4_90F0_860AE4ECC400_INCLUDED
#define HEADER_15CC2797_F424_48C4_90F0_860AE4ECC400_INCLUDED

#include <memory>

#include <mongocxx/instance.hpp>

#include <mongolink/Driver.hpp>

namespace mongolink {

/**
 * `Driver` backed by the MongoDB C++ driver.
 *
 * Each connection is a `mongocxx::pool`. Every operation acquires its own client from
 * that pool, so handles may be used from several threads at once.
 */
class MongoDriver : public Driver {
public:
    /**
     * Database used when the connection target doesn't name one.
     */
    static constexpr auto kDefaultDatabase = "test";

    MongoDriver();

    /**
     * Builds the pool and pings the `admin` database once to verify the connection.
     */
    std::unique_ptr<DatabaseHandle> connect(const ConnectionDescriptor& descriptor) override;

private:
    mongocxx::instance& _instance;
};

}  // namespace mongolink

#endif  // HEADER_15CC2797_F424_48C4_90F0_860AE4ECC400_INCLUDED
