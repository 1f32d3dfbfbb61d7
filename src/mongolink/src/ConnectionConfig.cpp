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

#include <mongolink/ConnectionConfig.hpp>

#include <sstream>

#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <mongolink/InvalidConfigurationException.hpp>
#include <mongolink/logging.hpp>
#include <mongolink/yamlToBson.hpp>

namespace mongolink {
namespace {

template <typename T>
void assign(const YAML::Node& node, const char* key, std::optional<T>& out) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::BadConversion& x) {
        std::ostringstream ss;
        ss << "Invalid value for connection option '" << key << "': " << x.what();
        BOOST_THROW_EXCEPTION(InvalidConfigurationException(ss.str()));
    }
}

void assignOptions(const YAML::Node& node, ConnectionOptions& options) {
    assign(node, "appname", options.appname);
    assign(node, "validateOptions", options.validateOptions);

    assign(node, "readPreference", options.readPreference);
    assign(node, "readConcern", options.readConcern);
    assign(node, "maxStalenessSeconds", options.maxStalenessSeconds);
    assign(node, "w", options.w);
    assign(node, "j", options.j);
    assign(node, "wtimeout", options.wtimeout);

    assign(node, "loggerLevel", options.loggerLevel);
    if (options.loggerLevel) {
        // Reject unknown levels here rather than at connect time.
        parseVerbosity(*options.loggerLevel);
    }

    assign(node, "promoteValues", options.promoteValues);
    assign(node, "promoteBuffers", options.promoteBuffers);
    assign(node, "promoteLongs", options.promoteLongs);
    assign(node, "raw", options.raw);
    assign(node, "ignoreUndefined", options.ignoreUndefined);
    assign(node, "serializeFunctions", options.serializeFunctions);
    assign(node, "forceServerObjectId", options.forceServerObjectId);

    assign(node, "ssl", options.ssl);
    assign(node, "sslValidate", options.sslValidate);
    assign(node, "sslCA", options.sslCA);
    assign(node, "sslCert", options.sslCert);
    assign(node, "sslKey", options.sslKey);
    assign(node, "sslPass", options.sslPass);
    assign(node, "sslCRL", options.sslCRL);
    assign(node, "ciphers", options.ciphers);
    assign(node, "ecdhCurve", options.ecdhCurve);
    assign(node, "checkServerIdentity", options.checkServerIdentity);

    assign(node, "poolSize", options.poolSize);

    // `auto_reconnect` is the legacy spelling; either one switches it on.
    std::optional<bool> autoReconnect;
    std::optional<bool> legacyAutoReconnect;
    assign(node, "autoReconnect", autoReconnect);
    assign(node, "auto_reconnect", legacyAutoReconnect);
    if (autoReconnect || legacyAutoReconnect) {
        options.autoReconnect = autoReconnect.value_or(false) || legacyAutoReconnect.value_or(false);
    }

    assign(node, "reconnectInterval", options.reconnectInterval);
    assign(node, "reconnectTries", options.reconnectTries);
    assign(node, "bufferMaxEntries", options.bufferMaxEntries);
    assign(node, "noDelay", options.noDelay);
    assign(node, "keepAlive", options.keepAlive);
    assign(node, "keepAliveInitialDelay", options.keepAliveInitialDelay);
    assign(node, "connectTimeoutMS", options.connectTimeoutMS);
    assign(node, "socketTimeoutMS", options.socketTimeoutMS);
    assign(node, "family", options.family);

    assign(node, "ha", options.ha);
    assign(node, "haInterval", options.haInterval);
    assign(node, "replicaSet", options.replicaSet);
    assign(node, "secondaryAcceptableLatencyMS", options.secondaryAcceptableLatencyMS);
    assign(node, "acceptableLatencyMS", options.acceptableLatencyMS);
    assign(node, "connectWithNoPrimary", options.connectWithNoPrimary);

    assign(node, "authSource", options.authSource);
}

}  // namespace

ConnectionConfig ConnectionConfig::fromYaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        std::ostringstream ss;
        ss << "Connection configuration must be a map, got " << nodeTypeName(node);
        BOOST_THROW_EXCEPTION(InvalidConfigurationException(ss.str()));
    }

    ConnectionConfig config;
    assign(node, "url", config.url);
    assign(node, "host", config.host);
    assign(node, "port", config.port);
    assign(node, "user", config.user);
    assign(node, "password", config.password);
    assign(node, "database", config.database);

    assignOptions(node, config.options);
    return config;
}

ConnectionConfig loadConnectionConfig(const std::string& path) {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path);
    } catch (const YAML::Exception& x) {
        std::ostringstream ss;
        ss << "Unable to load connection configuration from '" << path << "': " << x.what();
        BOOST_THROW_EXCEPTION(InvalidConfigurationException(ss.str()));
    }

    BOOST_LOG_TRIVIAL(debug) << "Loaded connection configuration from '" << path << "'";
    return ConnectionConfig::fromYaml(node);
}

}  // namespace mongolink
