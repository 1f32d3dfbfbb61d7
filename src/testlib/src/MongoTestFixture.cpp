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

#include <testlib/MongoTestFixture.hpp>

#include <cstdlib>

#include <boost/log/trivial.hpp>

#include <mongocxx/uri.hpp>

namespace mongolink::testing {

std::string MongoTestFixture::connectionUri() {
    const char* connChar = std::getenv("MONGO_CONNECTION_STRING");

    if (connChar != nullptr) {
        return connChar;
    }

    auto& connStr = mongocxx::uri::k_default_uri;
    BOOST_LOG_TRIVIAL(info) << "MONGO_CONNECTION_STRING not set, using default value: " << connStr;
    return connStr;
}

void MongoTestFixture::dropTestDatabase() {
    client[kTestDatabase].drop();
}

}  // namespace mongolink::testing
