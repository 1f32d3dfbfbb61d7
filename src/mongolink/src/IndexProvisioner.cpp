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

#include <mongolink/IndexProvisioner.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <sstream>

#include <boost/log/trivial.hpp>
#include <boost/throw_exception.hpp>

#include <bsoncxx/json.hpp>

namespace mongolink {
namespace {

/**
 * Shared by the caller and every task of one `ensureIndexes()` call.
 */
struct Join {
    explicit Join(size_t count) : remaining{count} {}

    std::mutex mutex;
    std::condition_variable done;
    size_t remaining;
    std::exception_ptr firstError;
    std::string failedKeys;
};

std::string describe(const std::exception_ptr& cause) {
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

}  // namespace

IndexProvisionException::IndexProvisionException(std::string collection,
                                                 std::exception_ptr cause)
    : _collection{std::move(collection)}, _cause{std::move(cause)} {
    std::ostringstream ss;
    ss << "Failed to create index on collection '" << _collection << "': " << describe(_cause);
    _message = ss.str();
}

IndexProvisioner::~IndexProvisioner() {
    std::lock_guard<std::mutex> lock{_mutex};
    for (auto& task : _tasks) {
        task.wait();
    }
}

void IndexProvisioner::ensureIndexes(const std::shared_ptr<CollectionHandle>& collection,
                                     const std::vector<IndexSpec>& indexes) {
    if (indexes.empty()) {
        return;
    }

    auto join = std::make_shared<Join>(indexes.size());
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _reap();

        for (const auto& spec : indexes) {
            BOOST_LOG_TRIVIAL(debug) << "Building index " << bsoncxx::to_json(spec.index.view())
                                     << " on '" << collection->name() << "'";

            _tasks.push_back(std::async(std::launch::async, [collection, join, spec]() {
                std::exception_ptr error;
                try {
                    collection->ensureIndex(spec.index.view(), spec.options.view());
                } catch (...) {
                    error = std::current_exception();
                }

                std::lock_guard<std::mutex> lock{join->mutex};
                if (error && !join->firstError) {
                    join->firstError = error;
                    join->failedKeys = bsoncxx::to_json(spec.index.view());
                }
                --join->remaining;
                join->done.notify_all();
            }));
        }
    }

    std::unique_lock<std::mutex> lock{join->mutex};
    join->done.wait(lock, [&]() { return join->remaining == 0 || join->firstError; });

    if (join->firstError) {
        BOOST_THROW_EXCEPTION(IndexProvisionException(collection->name(), join->firstError)
                              << IndexProvisionException::IndexKeys(join->failedKeys));
    }
}

size_t IndexProvisioner::inFlight() {
    std::lock_guard<std::mutex> lock{_mutex};
    _reap();
    return _tasks.size();
}

// Caller holds _mutex.
void IndexProvisioner::_reap() {
    auto finished = [](std::future<void>& task) {
        return task.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
    };
    _tasks.erase(std::remove_if(_tasks.begin(), _tasks.end(), finished), _tasks.end());
}

}  // namespace mongolink
