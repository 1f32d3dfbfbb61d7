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

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include <boost/exception/get_error_info.hpp>

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/json.hpp>

#include <mongolink/IndexProvisioner.hpp>

#include <testlib/RecordingDriver.hpp>

namespace mongolink {
namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using testing::RecordingDriver;

/**
 * Blocks index tasks until the test lets them go.
 */
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock{_mutex};
            _open = true;
        }
        _cv.notify_all();
    }

    bool wait() {
        std::unique_lock<std::mutex> lock{_mutex};
        return _cv.wait_for(lock, std::chrono::seconds{10}, [&]() { return _open; });
    }

private:
    std::mutex _mutex;
    std::condition_variable _cv;
    bool _open = false;
};

IndexSpec index(const std::string& field) {
    return IndexSpec{make_document(kvp(field, 1))};
}

std::string field(bsoncxx::document::view keys,
                                 bsoncxx::document::view) {
    return std::string{(*keys.begin()).key()};
}

std::string causeOf(const IndexProvisionException& x) {
    try {
        std::rethrow_exception(x.cause());
    } catch (const std::exception& cause) {
        return cause.what();
    }
}

// Polls until `predicate` holds or ten seconds have passed.
template <typename Predicate>
bool eventually(Predicate&& predicate) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return true;
}

size_t countIndexEvents(const RecordingDriver& driver) {
    auto events = driver.events();
    return std::count_if(events.begin(), events.end(), [](const std::string& event) {
        return event.rfind("ensureIndex ", 0) == 0;
    });
}

TEST_CASE("IndexProvisioner with nothing to do") {
    RecordingDriver driver;
    auto collection = driver.connect(ConnectionDescriptor{})->createCollection("orders");

    IndexProvisioner provisioner;
    REQUIRE_NOTHROW(provisioner.ensureIndexes(collection, {}));
    REQUIRE(driver.ensureIndexCalls() == 0);
    REQUIRE(provisioner.inFlight() == 0);
}

TEST_CASE("IndexProvisioner creates every index") {
    RecordingDriver driver;
    auto collection = driver.connect(ConnectionDescriptor{})->createCollection("orders");

    IndexProvisioner provisioner;
    provisioner.ensureIndexes(collection, {index("a"), index("b"), index("c")});

    REQUIRE(driver.ensureIndexCalls() == 3);
    REQUIRE(countIndexEvents(driver) == 3);
    REQUIRE(eventually([&]() { return provisioner.inFlight() == 0; }));
}

TEST_CASE("IndexProvisioner issues index creations concurrently") {
    constexpr size_t kIndexes = 4;

    std::mutex mutex;
    std::condition_variable allStarted;
    size_t started = 0;

    RecordingDriver driver;
    // Each creation only completes once all of them are running at the same time.
    driver.onEnsureIndex = [&](const std::string&,
                               bsoncxx::document::view,
                               bsoncxx::document::view) {
        std::unique_lock<std::mutex> lock{mutex};
        ++started;
        allStarted.notify_all();
        if (!allStarted.wait_for(
                lock, std::chrono::seconds{10}, [&]() { return started == kIndexes; })) {
            throw std::runtime_error("index creations were not concurrent");
        }
    };
    auto collection = driver.connect(ConnectionDescriptor{})->createCollection("orders");

    IndexProvisioner provisioner;
    REQUIRE_NOTHROW(
        provisioner.ensureIndexes(collection, {index("a"), index("b"), index("c"), index("d")}));
    REQUIRE(countIndexEvents(driver) == kIndexes);
}

TEST_CASE("IndexProvisioner fails on the first error") {
    Gate gate;
    RecordingDriver driver;

    SECTION("Siblings keep running after the failure") {
        driver.onEnsureIndex = [&](const std::string&,
                                   bsoncxx::document::view keys,
                                   bsoncxx::document::view) {
            if (field(keys) == "b") {
                throw std::runtime_error("duplicate key");
            }
            gate.wait();
        };
        auto collection = driver.connect(ConnectionDescriptor{})->createCollection("orders");

        auto provisioner = std::make_unique<IndexProvisioner>();
        try {
            provisioner->ensureIndexes(collection, {index("a"), index("b"), index("c")});
            FAIL("Expected IndexProvisionException");
        } catch (const IndexProvisionException& x) {
            REQUIRE(causeOf(x) == "duplicate key");
            REQUIRE(x.collection() == "orders");

            auto keys = boost::get_error_info<IndexProvisionException::IndexKeys>(x);
            REQUIRE(keys);
            REQUIRE(*keys == bsoncxx::to_json(make_document(kvp("b", 1))));
        }

        // "a" and "c" are still waiting on the gate; nothing was retracted.
        REQUIRE(eventually([&]() { return driver.ensureIndexCalls() == 3; }));
        REQUIRE(eventually([&]() { return provisioner->inFlight() == 2; }));
        REQUIRE(countIndexEvents(driver) == 0);

        gate.open();
        provisioner.reset();
        REQUIRE(countIndexEvents(driver) == 2);
    }

    SECTION("Only the first error is reported") {
        driver.onEnsureIndex = [&](const std::string&,
                                   bsoncxx::document::view keys,
                                   bsoncxx::document::view) {
            if (field(keys) == "first") {
                throw std::runtime_error("first failure");
            }
            gate.wait();
            throw std::runtime_error("second failure");
        };
        auto collection = driver.connect(ConnectionDescriptor{})->createCollection("orders");

        IndexProvisioner provisioner;
        try {
            provisioner.ensureIndexes(collection, {index("second"), index("first")});
            FAIL("Expected IndexProvisionException");
        } catch (const IndexProvisionException& x) {
            REQUIRE(causeOf(x) == "first failure");
        }
        gate.open();
    }

    SECTION("A later call reaps finished stragglers") {
        driver.onEnsureIndex = [&](const std::string&,
                                   bsoncxx::document::view keys,
                                   bsoncxx::document::view) {
            if (field(keys) == "bad") {
                throw std::runtime_error("bad index");
            }
            gate.wait();
        };
        auto collection = driver.connect(ConnectionDescriptor{})->createCollection("orders");

        IndexProvisioner provisioner;
        REQUIRE_THROWS_AS(provisioner.ensureIndexes(collection, {index("bad"), index("slow")}),
                          IndexProvisionException);
        REQUIRE(eventually([&]() { return provisioner.inFlight() == 1; }));

        gate.open();
        provisioner.ensureIndexes(collection, {index("next")});
        REQUIRE(eventually([&]() { return provisioner.inFlight() == 0; }));
    }
}

}  // namespace
}  // namespace mongolink
