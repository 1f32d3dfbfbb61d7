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

#ifndef HEADER_720A1D96_57CB_4F95_AF36_8C5390B8BDB2_INCLUDED
#define HEADER_720A1D96_57CB_4F95_AF36_8C5390B8BDB2_INCLUDED

#include <future>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <mongolink/Connection.hpp>
#include <mongolink/ConnectionConfig.hpp>
#include <mongolink/ConnectionDescriptor.hpp>
#include <mongolink/Driver.hpp>

namespace mongolink {

/**
 * Turns a `ConnectionConfig` into an opened `Connection`.
 *
 * Example usage:
 *
 * ```c++
 * mongolink::MongoDriver driver;
 * auto builder = mongolink::ConnectionBuilder{driver};
 *
 * auto connection = builder.build(mongolink::loadConnectionConfig("connection.yml"));
 * connection->createCollection("orders", spec);
 * ```
 */
class ConnectionBuilder {
public:
    /**
     * @param driver must outlive this builder and every `Connection` it builds.
     */
    explicit ConnectionBuilder(Driver& driver) : _driver{driver} {}

    /**
     * Work out the connection target and the resolved options. Performs no I/O.
     *
     * When `config.url` is set it is the target, unmodified, and its `ssl`, `authSource`
     * and `replicaSet` query parameters override the configured options. Otherwise the
     * target is `mongodb://[user:password@]host:port/[database]`.
     *
     * @throws InvalidConfigurationException if `user` and `password` are set without `database`.
     */
    static ConnectionDescriptor resolve(const ConnectionConfig& config);

    /**
     * Resolve `config` and make exactly one connection attempt.
     *
     * @throws InvalidConfigurationException before any driver call.
     * @throws ConnectionException if the driver returns no database.
     * Anything the driver throws is propagated unchanged.
     */
    std::unique_ptr<Connection> build(const ConnectionConfig& config) const;

    /**
     * Like `build()` but the connection attempt happens on another thread.
     *
     * Configuration errors are still thrown from this call, not from the future. The
     * builder itself may go away before the future is ready; the driver may not.
     */
    std::future<std::unique_ptr<Connection>> buildAsync(const ConnectionConfig& config) const;

private:
    static std::unique_ptr<Connection> _connect(Driver& driver,
                                                const ConnectionDescriptor& descriptor);

    Driver& _driver;
};

/**
 * @return the percent-decoded query parameters of `url`. The last of repeated keys wins.
 */
std::map<std::string, std::string> parseQueryParameters(std::string_view url);

}  // namespace mongolink

#endif  // HEADER_720A1D96_57CB_4F95_AF36_8C5390B8BDB2_INCLUDED
