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

#ifndef HEADER_E6C5EA35_56AD_4DF7_BED2_A9FA8AF3D3D2_INCLUDED
#define HEADER_E6C5EA35_56AD_4DF7_BED2_A9FA8AF3D3D2_INCLUDED

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <mongocxx/events/command_started_event.hpp>

namespace mongolink {

/**
 * Driver-level connection options.
 *
 * Every field maps 1:1 to a documented driver option. An unset field means
 * "use the driver default"; nothing here carries a default literal.
 *
 * The same record is used both for the options a caller configures and for the
 * resolved set handed to the driver once url-derived overrides are applied.
 */
struct ConnectionOptions {
    /**
     * Invoked for every `mongocxx::events::command_started_event` on the connection.
     */
    using CommandStartedCallback =
        std::function<void(const mongocxx::events::command_started_event&)>;

    // Identification and validation
    std::optional<std::string> appname;
    std::optional<bool> validateOptions;

    // Read and write concern
    std::optional<std::string> readPreference;
    std::optional<std::string> readConcern;
    std::optional<int32_t> maxStalenessSeconds;
    std::optional<std::string> w;
    std::optional<bool> j;
    std::optional<int32_t> wtimeout;

    // Logging hooks
    std::optional<std::string> loggerLevel;
    CommandStartedCallback logger;

    // BSON serialization behaviour
    std::optional<bool> promoteValues;
    std::optional<bool> promoteBuffers;
    std::optional<bool> promoteLongs;
    std::optional<bool> raw;
    std::optional<bool> ignoreUndefined;
    std::optional<bool> serializeFunctions;
    std::optional<bool> forceServerObjectId;

    // TLS
    std::optional<bool> ssl;
    std::optional<bool> sslValidate;
    std::optional<std::string> sslCA;
    std::optional<std::string> sslCert;
    std::optional<std::string> sslKey;
    std::optional<std::string> sslPass;
    std::optional<std::string> sslCRL;
    std::optional<std::string> ciphers;
    std::optional<std::string> ecdhCurve;
    std::optional<bool> checkServerIdentity;

    // Pooling, sockets and timeouts
    std::optional<int32_t> poolSize;
    std::optional<bool> autoReconnect;
    std::optional<int32_t> reconnectInterval;
    std::optional<int32_t> reconnectTries;
    std::optional<int32_t> bufferMaxEntries;
    std::optional<bool> noDelay;
    std::optional<bool> keepAlive;
    std::optional<int32_t> keepAliveInitialDelay;
    std::optional<int32_t> connectTimeoutMS;
    std::optional<int32_t> socketTimeoutMS;
    std::optional<int32_t> family;

    // Replication and topology
    std::optional<bool> ha;
    std::optional<int32_t> haInterval;
    std::optional<std::string> replicaSet;
    std::optional<int32_t> secondaryAcceptableLatencyMS;
    std::optional<int32_t> acceptableLatencyMS;
    std::optional<bool> connectWithNoPrimary;

    // Authentication
    std::optional<std::string> authSource;
};

}  // namespace mongolink

#endif  // HEADER_E6C5EA35_56AD_4DF7_BED2_A9FA8AF3D3D2_INCLUDED
