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

#ifndef HEADER_F10FE320_04DF_4898_B909_82DB81F8C46F_INCLUDED
#define HEADER_F10FE320_04DF_4898_B909_82DB81F8C46F_INCLUDED

#include <string>

#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/uri.hpp>

namespace mongolink::testing {

/**
 * For tests tagged `[standalone]` that need a running server.
 *
 * The server is taken from the `MONGO_CONNECTION_STRING` environment variable,
 * falling back to the driver's default of `mongodb://localhost:27017`.
 */
class MongoTestFixture {
public:
    static constexpr auto kTestDatabase = "mongolink_test";

    MongoTestFixture()
        : instance{mongocxx::instance::current()}, client{mongocxx::uri{connectionUri()}} {}

    void dropTestDatabase();

    static std::string connectionUri();

private:
    mongocxx::instance& instance;

protected:
    mongocxx::client client;
};

}  // namespace mongolink::testing

#endif  // HEADER_F10FE320_04DF_4898_B909_82DB81F8C46F_INCLUDED
