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

#ifndef HEADER_47B4873A_3B7A_4B61_8F2F_96F3CA99A1D2_INCLUDED
#define HEADER_47B4873A_3B7A_4B61_8F2F_96F3CA99A1D2_INCLUDED

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <mongocxx/options/pool.hpp>
#include <mongocxx/pool.hpp>

#include <mongolink/ConnectionOptions.hpp>

namespace mongolink::v1 {

/**
 * A pool factory takes in a connection target and its resolved options and makes a
 * `mongocxx::pool` from them.
 *
 * Options that libmongoc understands as URI query parameters (timeouts, pool size,
 * read/write concern, replica set, ...) are merged into the query string of the target,
 * replacing any value the target already has for the same (case-insensitive) key.
 * Their values are percent-encoded. Query parameters without a value are dropped.
 * TLS file options go into `mongocxx::options::tls`, and the logging hooks become an
 * APM command-started callback. Options with no libmongoc counterpart are ignored.
 */
class PoolFactory {
public:
    PoolFactory(std::string_view uri, ConnectionOptions options);
    ~PoolFactory();

    // Both `makeUri()` and `makeOptions()` are used internally. They are publicly exposed to
    // facilitate testing.
    std::string makeUri() const;
    mongocxx::options::pool makeOptions() const;

    /**
     * Same as `makeUri()` but with the password hidden. Safe to log.
     */
    std::string makeRedactedUri() const;

    std::unique_ptr<mongocxx::pool> makePool() const;

    /**
     * @return the value of a query parameter, as it appears in `makeUri()` (percent-encoded).
     *   Keys are matched regardless of case.
     */
    std::optional<std::string_view> getQueryOption(const std::string& option) const;

    /**
     * @return the database named in the target's path; empty if there is none.
     */
    std::string database() const;

private:
    struct Config;
    std::unique_ptr<Config> _config;
    ConnectionOptions _options;
};

}  // namespace mongolink::v1

#endif  // HEADER_47B4873A_3B7A_4B61_8F2F_96F3CA99A1D2_INCLUDED
