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

#ifndef HEADER_B6FB7B8A_BA97_4B87_B359_1724B66ADB75_INCLUDED
#define HEADER_B6FB7B8A_BA97_4B87_B359_1724B66ADB75_INCLUDED

#include <cstdint>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

#include <mongolink/ConnectionOptions.hpp>

namespace mongolink {

/**
 * Everything needed to open a connection.
 *
 * Either `url` is given, in which case it is used verbatim as the connection
 * target, or the discrete `host`/`port`/`user`/`password`/`database` fields are
 * assembled into one. Driver options live in `options` regardless of which
 * path is taken.
 *
 * Example YAML:
 *
 * ```yaml
 * host: localhost
 * port: 27017
 * user: app
 * password: secret
 * database: orders
 * poolSize: 20
 * readPreference: secondaryPreferred
 * ```
 */
struct ConnectionConfig {
    std::optional<std::string> url;
    std::optional<std::string> host;
    std::optional<int32_t> port;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> database;

    ConnectionOptions options;

    /**
     * @param node
     *   a flat YAML map. Unrecognized keys are ignored.
     * @throws InvalidConfigurationException
     *   if `node` is not a map or a recognized key holds a value of the wrong type.
     */
    static ConnectionConfig fromYaml(const YAML::Node& node);
};

/**
 * Read a `ConnectionConfig` from a YAML file.
 *
 * @throws InvalidConfigurationException if the file can't be read or parsed.
 */
ConnectionConfig loadConnectionConfig(const std::string& path);

}  // namespace mongolink

#endif  // HEADER_B6FB7B8A_BA97_4B87_B359_1724B66ADB75_INCLUDED
