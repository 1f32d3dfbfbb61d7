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

#include <mongolink/v1/PoolFactory.hpp>

#include <cctype>
#include <map>
#include <regex>
#include <sstream>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/log/trivial.hpp>

#include <mongocxx/options/apm.hpp>
#include <mongocxx/options/client.hpp>
#include <mongocxx/options/tls.hpp>
#include <mongocxx/uri.hpp>

#include <mongolink/logging.hpp>

namespace mongolink::v1 {

namespace {

void logIgnored(const char* option, bool isSet) {
    if (isSet) {
        BOOST_LOG_TRIVIAL(debug) << "Connection option '" << option
                                 << "' has no equivalent in the C driver, ignoring it";
    }
}

std::string percentEncode(const std::string& in) {
    static constexpr auto kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0xF];
        }
    }
    return out;
}

}  // namespace

/** @private */
struct PoolFactory::Config {
    Config(std::string_view rawUri) {
        const auto protocolRegex =
            std::regex("^(mongodb://|mongodb\\+srv://)?(([^:@/]*):([^@/]*)@)?");
        const auto hostRegex = std::regex("^,?(\\[[^\\]]+\\](:[0-9]*)?|[^:,/?\\[]+(:[0-9]*)?)");
        const auto dbRegex = std::regex("^/([^?]*)\\??");

        const std::string uri{rawUri};
        std::smatch matches;
        size_t i = 0;

        // Extract the protocol, and optionally the username and the password
        std::string rest = uri.substr(i);
        std::regex_search(rest, matches, protocolRegex);
        protocol = matches.length(1) ? matches.str(1) : std::string{"mongodb://"};
        if (matches.length(2)) {
            hasCredentials = true;
            username = matches.str(3);
            password = matches.str(4);
        }
        i += matches.length();

        // Extract each host specified in the uri
        for (rest = uri.substr(i); std::regex_search(rest, matches, hostRegex);
             rest = uri.substr(i)) {
            hosts.push_back(matches.str(1));
            i += matches.length();
        }

        // Extract the db name and optionally the query string prefix
        rest = uri.substr(i);
        if (std::regex_search(rest, matches, dbRegex)) {
            database = matches.str(1);
            i += matches.length();
        }

        // Extract each query parameter. Values are kept as written, still encoded.
        rest = uri.substr(i);
        std::vector<std::string> pairs;
        boost::algorithm::split(pairs, rest, boost::algorithm::is_any_of("&"));
        for (auto&& pair : pairs) {
            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                if (!pair.empty()) {
                    BOOST_LOG_TRIVIAL(warning)
                        << "Dropping query parameter '" << pair << "' without a value";
                }
                continue;
            }
            queryOptions[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }

    std::string makeUri(bool redact) const {
        std::ostringstream ss;

        ss << protocol;
        if (hasCredentials) {
            ss << username << ':' << (redact ? "[REDACTED]" : password) << '@';
        }

        for (size_t i = 0; i < hosts.size(); ++i) {
            if (i > 0) {
                ss << ',';
            }
            ss << hosts[i];
        }

        if (!database.empty() || !queryOptions.empty()) {
            ss << '/' << database;
        }

        if (!queryOptions.empty()) {
            ss << '?';
        }

        size_t i = 0;
        for (auto&& [key, value] : queryOptions) {
            if (i++ > 0) {
                ss << '&';
            }
            ss << key << '=' << value;
        }

        return ss.str();
    }

    /** `value` is raw; it is stored percent-encoded. */
    void set(const std::string& key, const std::string& value) {
        // Keep the key's existing spelling; libmongoc doesn't care about case.
        queryOptions[key] = percentEncode(value);
    }

    std::optional<std::string_view> get(const std::string& key) const {
        auto it = queryOptions.find(key);
        if (it == queryOptions.end())
            return std::nullopt;

        return std::make_optional<std::string_view>(it->second);
    }

    bool getFlag(const std::string& key, bool defaultValue = false) const {
        auto opt = get(key);
        if (!opt)
            return defaultValue;

        return boost::algorithm::iequals(*opt, "true");
    }

    /** Merge the query-string options; defined below. */
    void apply(const ConnectionOptions& options);

    std::string protocol;
    bool hasCredentials = false;
    std::string username;
    std::string password;
    std::vector<std::string> hosts;
    std::string database;
    std::map<std::string, std::string, boost::algorithm::is_iless> queryOptions;
};

PoolFactory::PoolFactory(std::string_view uri, ConnectionOptions options)
    : _config(std::make_unique<Config>(uri)), _options{std::move(options)} {
    _config->apply(_options);
}

PoolFactory::~PoolFactory() {}

void PoolFactory::Config::apply(const ConnectionOptions& options) {
    auto setString = [&](const char* key, const std::optional<std::string>& value) {
        if (value) {
            set(key, *value);
        }
    };
    auto setInt = [&](const char* key, const std::optional<int32_t>& value) {
        if (value) {
            set(key, std::to_string(*value));
        }
    };
    auto setFlag = [&](const char* key, const std::optional<bool>& value) {
        if (value) {
            set(key, *value ? "true" : "false");
        }
    };

    setString("appName", options.appname);
    setString("readPreference", options.readPreference);
    setString("readConcernLevel", options.readConcern);
    setInt("maxStalenessSeconds", options.maxStalenessSeconds);
    setString("w", options.w);
    setFlag("journal", options.j);
    setInt("wtimeoutMS", options.wtimeout);

    if (options.ssl) {
        // "ssl" is the deprecated alias of "tls"; having both invites a conflict.
        queryOptions.erase("ssl");
        setFlag("tls", options.ssl);
    }
    if (options.sslValidate && !*options.sslValidate) {
        set("tlsAllowInvalidCertificates", "true");
    }
    if (options.checkServerIdentity && !*options.checkServerIdentity) {
        set("tlsAllowInvalidHostnames", "true");
    }

    setInt("maxPoolSize", options.poolSize);
    setInt("connectTimeoutMS", options.connectTimeoutMS);
    setInt("socketTimeoutMS", options.socketTimeoutMS);

    setInt("heartbeatFrequencyMS", options.haInterval);
    setString("replicaSet", options.replicaSet);
    setInt("localThresholdMS",
           options.secondaryAcceptableLatencyMS ? options.secondaryAcceptableLatencyMS
                                                : options.acceptableLatencyMS);

    setString("authSource", options.authSource);

    logIgnored("validateOptions", options.validateOptions.has_value());
    logIgnored("promoteValues", options.promoteValues.has_value());
    logIgnored("promoteBuffers", options.promoteBuffers.has_value());
    logIgnored("promoteLongs", options.promoteLongs.has_value());
    logIgnored("raw", options.raw.has_value());
    logIgnored("ignoreUndefined", options.ignoreUndefined.has_value());
    logIgnored("serializeFunctions", options.serializeFunctions.has_value());
    logIgnored("forceServerObjectId", options.forceServerObjectId.has_value());
    logIgnored("ciphers", options.ciphers.has_value());
    logIgnored("ecdhCurve", options.ecdhCurve.has_value());
    logIgnored("autoReconnect", options.autoReconnect.has_value());
    logIgnored("reconnectInterval", options.reconnectInterval.has_value());
    logIgnored("reconnectTries", options.reconnectTries.has_value());
    logIgnored("bufferMaxEntries", options.bufferMaxEntries.has_value());
    logIgnored("noDelay", options.noDelay.has_value());
    logIgnored("keepAlive", options.keepAlive.has_value());
    logIgnored("keepAliveInitialDelay", options.keepAliveInitialDelay.has_value());
    logIgnored("family", options.family.has_value());
    logIgnored("ha", options.ha.has_value());
    logIgnored("connectWithNoPrimary", options.connectWithNoPrimary.has_value());
}

std::string PoolFactory::makeUri() const {
    return _config->makeUri(false);
}

std::string PoolFactory::makeRedactedUri() const {
    return _config->makeUri(true);
}

mongocxx::options::pool PoolFactory::makeOptions() const {
    mongocxx::options::client clientOpts;

    auto useTls = _config->getFlag("tls") || _config->getFlag("ssl");
    if (useTls) {
        mongocxx::options::tls tlsOptions;

        if (_options.sslValidate && !*_options.sslValidate) {
            BOOST_LOG_TRIVIAL(debug) << "Allowing invalid certificates for TLS";
            tlsOptions.allow_invalid_certificates(true);
        }
        if (_options.sslCA) {
            BOOST_LOG_TRIVIAL(debug) << "Using CA file '" << *_options.sslCA << "' for TLS";
            tlsOptions.ca_file(std::string{*_options.sslCA});
        }

        // libmongoc wants the certificate and its key in one PEM file.
        auto pemFile = _options.sslCert ? _options.sslCert : _options.sslKey;
        if (_options.sslCert && _options.sslKey && *_options.sslCert != *_options.sslKey) {
            BOOST_LOG_TRIVIAL(warning) << "Separate certificate and key files are not supported; "
                                       << "using '" << *_options.sslCert
                                       << "' as the combined PEM file";
        }
        if (pemFile) {
            BOOST_LOG_TRIVIAL(debug) << "Using PEM Key file '" << *pemFile << "' for TLS";
            tlsOptions.pem_file(std::string{*pemFile});
        }
        if (_options.sslPass) {
            tlsOptions.pem_password(std::string{*_options.sslPass});
        }
        if (_options.sslCRL) {
            tlsOptions.crl_file(std::string{*_options.sslCRL});
        }

        clientOpts.tls_opts(tlsOptions);
    }

    if (_options.logger || _options.loggerLevel) {
        auto hook = _options.logger;
        std::optional<boost::log::trivial::severity_level> severity;
        if (_options.loggerLevel) {
            severity = parseVerbosity(*_options.loggerLevel);
        }

        mongocxx::options::apm apmOptions;
        apmOptions.on_command_started(
            [hook, severity](const mongocxx::events::command_started_event& event) {
                if (severity) {
                    auto name = event.command_name();
                    auto db = event.database_name();
                    BOOST_LOG_SEV(::boost::log::trivial::logger::get(), *severity)
                        << "Command '" << std::string(name.data(), name.size())
                        << "' started on '" << std::string(db.data(), db.size()) << "'";
                }
                if (hook) {
                    hook(event);
                }
            });
        clientOpts.apm_opts(apmOptions);
    }

    // options::client converts implicitly into options::pool.
    return clientOpts;
}

std::unique_ptr<mongocxx::pool> PoolFactory::makePool() const {
    BOOST_LOG_TRIVIAL(info) << "Constructing pool with MongoURI '" << makeRedactedUri() << "'";

    auto uri = mongocxx::uri{makeUri()};
    return std::make_unique<mongocxx::pool>(uri, makeOptions());
}

std::optional<std::string_view> PoolFactory::getQueryOption(const std::string& option) const {
    return _config->get(option);
}

std::string PoolFactory::database() const {
    return _config->database;
}

}  // namespace mongolink::v1
