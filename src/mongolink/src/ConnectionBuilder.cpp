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

#include <mongolink/ConnectionBuilder.hpp>

#include <cctype>
#include <sstream>

#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <mongolink/ConnectionException.hpp>
#include <mongolink/InvalidConfigurationException.hpp>

namespace mongolink {
namespace {

constexpr auto kScheme = "mongodb://";

bool isSet(const std::optional<std::string>& value) {
    return value && !value->empty();
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() && hexValue(in[i + 1]) >= 0 &&
                   hexValue(in[i + 2]) >= 0) {
            out += static_cast<char>(hexValue(in[i + 1]) * 16 + hexValue(in[i + 2]));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

// Userinfo must not contain the delimiters of the connection string.
std::string percentEncodeUserInfo(const std::string& in) {
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

void applyUrlOverrides(const std::string& url, ConnectionOptions& options) {
    const auto query = parseQueryParameters(url);
    if (query.empty()) {
        return;
    }

    // Any non-empty value switches TLS on, "ssl=false" included.
    for (auto&& key : {"ssl", "tls"}) {
        auto it = query.find(key);
        if (it != query.end() && !it->second.empty()) {
            options.ssl = true;
        }
    }

    auto authSource = query.find("authSource");
    if (authSource != query.end() && !authSource->second.empty()) {
        options.authSource = authSource->second;
    }

    auto replicaSet = query.find("replicaSet");
    if (replicaSet != query.end() && !replicaSet->second.empty()) {
        options.replicaSet = replicaSet->second;
    }
}

std::string makeConnectionString(const ConnectionConfig& config) {
    std::ostringstream ss;
    ss << kScheme;

    if (isSet(config.user) && isSet(config.password)) {
        if (!isSet(config.database)) {
            BOOST_THROW_EXCEPTION(InvalidConfigurationException(
                "A database must be configured when authentication is used."));
        }
        ss << percentEncodeUserInfo(*config.user) << ':'
           << percentEncodeUserInfo(*config.password) << '@';
    }

    // An unset host or port produces a target the driver will refuse.
    ss << config.host.value_or("") << ':';
    if (config.port) {
        ss << *config.port;
    }
    ss << '/';

    if (isSet(config.database)) {
        ss << *config.database;
    }
    return ss.str();
}

}  // namespace

std::map<std::string, std::string> parseQueryParameters(std::string_view url) {
    std::map<std::string, std::string> out;

    auto start = url.find('?');
    if (start == std::string_view::npos) {
        return out;
    }
    auto query = url.substr(start + 1);
    query = query.substr(0, query.find('#'));

    while (!query.empty()) {
        auto end = query.find_first_of("&;");
        auto pair = query.substr(0, end);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            auto key = percentDecode(pair.substr(0, eq));
            auto value = eq == std::string_view::npos ? std::string{}
                                                      : percentDecode(pair.substr(eq + 1));
            out[std::move(key)] = std::move(value);
        }
        if (end == std::string_view::npos) {
            break;
        }
        query.remove_prefix(end + 1);
    }
    return out;
}

ConnectionDescriptor ConnectionBuilder::resolve(const ConnectionConfig& config) {
    ConnectionDescriptor descriptor;
    descriptor.options = config.options;

    if (isSet(config.url)) {
        applyUrlOverrides(*config.url, descriptor.options);
        descriptor.target = *config.url;
    } else {
        descriptor.target = makeConnectionString(config);
    }
    return descriptor;
}

std::unique_ptr<Connection> ConnectionBuilder::build(const ConnectionConfig& config) const {
    return _connect(_driver, resolve(config));
}

std::future<std::unique_ptr<Connection>> ConnectionBuilder::buildAsync(
    const ConnectionConfig& config) const {
    auto descriptor = resolve(config);
    return std::async(std::launch::async,
                      [&driver = _driver, descriptor = std::move(descriptor)]() {
                          return _connect(driver, descriptor);
                      });
}

std::unique_ptr<Connection> ConnectionBuilder::_connect(Driver& driver,
                                                        const ConnectionDescriptor& descriptor) {
    BOOST_LOG_TRIVIAL(info) << "Connecting to '" << descriptor.redactedTarget() << "'";

    auto db = driver.connect(descriptor);
    if (!db) {
        BOOST_THROW_EXCEPTION(ConnectionException("no database object returned"));
    }

    BOOST_LOG_TRIVIAL(debug) << "Connected to database '" << db->name() << "'";
    return std::make_unique<Connection>(descriptor, std::move(db));
}

}  // namespace mongolink
