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

#include <stdexcept>

#include <catch2/catch.hpp>

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/json.hpp>

#include <mongolink/ConnectionBuilder.hpp>

#include <testlib/RecordingDriver.hpp>

namespace mongolink {
namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using testing::RecordingDriver;

ConnectionConfig localConfig() {
    ConnectionConfig config;
    config.host = "localhost";
    config.port = 27017;
    return config;
}

CollectionSpec ordersSpec() {
    CollectionSpec spec;
    spec.indexes.push_back(
        IndexSpec{make_document(kvp("sku", 1)), make_document(kvp("unique", true))});
    return spec;
}

TEST_CASE("Connection creates a collection and its indexes") {
    RecordingDriver driver;
    auto connection = ConnectionBuilder{driver}.build(localConfig());

    auto collection = connection->createCollection("orders", ordersSpec());
    REQUIRE(collection);
    REQUIRE(collection->name() == "orders");

    // The index exists by the time createCollection returns.
    REQUIRE(driver.events() ==
            std::vector<std::string>{
                "connect mongodb://localhost:27017/",
                "createCollection orders",
                "ensureIndex orders " + bsoncxx::to_json(make_document(kvp("sku", 1))),
            });
}

TEST_CASE("Connection passes index options through to the driver") {
    RecordingDriver driver;
    std::string seenKeys;
    std::string seenOptions;
    driver.onEnsureIndex = [&](const std::string& collection,
                               bsoncxx::document::view keys,
                               bsoncxx::document::view options) {
        seenKeys = collection + " " + bsoncxx::to_json(keys);
        seenOptions = bsoncxx::to_json(options);
    };
    auto connection = ConnectionBuilder{driver}.build(localConfig());

    connection->createCollection("orders", ordersSpec());
    REQUIRE(seenKeys == "orders " + bsoncxx::to_json(make_document(kvp("sku", 1))));
    REQUIRE(seenOptions == bsoncxx::to_json(make_document(kvp("unique", true))));
}

TEST_CASE("Connection with an empty collection spec") {
    RecordingDriver driver;
    auto connection = ConnectionBuilder{driver}.build(localConfig());

    auto collection = connection->createCollection("events", CollectionSpec{});
    REQUIRE(collection->name() == "events");
    REQUIRE(driver.ensureIndexCalls() == 0);
}

TEST_CASE("Connection failures while creating collections") {
    RecordingDriver driver;

    SECTION("An index failure leaves the collection in place") {
        driver.onEnsureIndex = [](const std::string&,
                                  bsoncxx::document::view,
                                  bsoncxx::document::view) {
            throw std::runtime_error("E11000 duplicate key error");
        };
        auto connection = ConnectionBuilder{driver}.build(localConfig());

        REQUIRE_THROWS_AS(connection->createCollection("orders", ordersSpec()),
                          IndexProvisionException);
        REQUIRE_THROWS_WITH(connection->createCollection("orders", ordersSpec()),
                            Catch::Contains("E11000 duplicate key error") &&
                                Catch::Contains("'orders'"));

        for (auto&& event : driver.events()) {
            REQUIRE(event.rfind("dropCollection", 0) != 0);
        }
    }

    SECTION("A collection failure skips indexing") {
        driver.onCreateCollection = [](const std::string&) {
            throw std::runtime_error("not authorized");
        };
        auto connection = ConnectionBuilder{driver}.build(localConfig());

        REQUIRE_THROWS_WITH(connection->createCollection("orders", ordersSpec()),
                            "not authorized");
        REQUIRE(driver.ensureIndexCalls() == 0);
    }
}

TEST_CASE("Connection drops collections through the database handle") {
    RecordingDriver driver;

    SECTION("Success") {
        auto connection = ConnectionBuilder{driver}.build(localConfig());
        connection->dropCollection("orders");
        REQUIRE(driver.events().back() == "dropCollection orders");
    }

    SECTION("Driver errors propagate") {
        driver.onDropCollection = [](const std::string&) {
            throw std::runtime_error("ns not found");
        };
        auto connection = ConnectionBuilder{driver}.build(localConfig());
        REQUIRE_THROWS_WITH(connection->dropCollection("missing"), "ns not found");
    }
}

}  // namespace
}  // namespace mongolink
