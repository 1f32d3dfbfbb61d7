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

#ifndef HEADER_8B8D8155_07D6_42CF_9DEF_46F86E8C01AD_INCLUDED
#define HEADER_8B8D8155_07D6_42CF_9DEF_46F86E8C01AD_INCLUDED

#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/exception/exception.hpp>
#include <boost/exception/info.hpp>

#include <mongolink/CollectionSpec.hpp>
#include <mongolink/Driver.hpp>

namespace mongolink {

/**
 * An index could not be created. Only the first failure observed is reported.
 */
class IndexProvisionException : public boost::exception, public std::exception {
public:
    /**
     * Tagged with the JSON of the index keys whose creation failed.
     */
    using IndexKeys = boost::error_info<struct IndexKeysTag, std::string>;

    IndexProvisionException(std::string collection, std::exception_ptr cause);

    /**
     * The exception thrown by the driver for the failing index.
     */
    const std::exception_ptr& cause() const {
        return _cause;
    }

    const std::string& collection() const {
        return _collection;
    }

    const char* what() const noexcept override {
        return _message.c_str();
    }

private:
    std::string _collection;
    std::exception_ptr _cause;
    std::string _message;
};

/**
 * Creates the indexes declared for a collection.
 *
 * All index creations for a call are started at once, each on its own task, and the
 * call returns once they have all succeeded or as soon as one of them fails. A failure
 * doesn't cancel the others: they keep running in the background and their futures are
 * held here until they finish. Destroying the provisioner waits for them.
 */
class IndexProvisioner {
public:
    IndexProvisioner() = default;
    ~IndexProvisioner();

    IndexProvisioner(const IndexProvisioner&) = delete;
    IndexProvisioner& operator=(const IndexProvisioner&) = delete;

    /**
     * @throws IndexProvisionException carrying the first error observed.
     */
    void ensureIndexes(const std::shared_ptr<CollectionHandle>& collection,
                       const std::vector<IndexSpec>& indexes);

    /**
     * @return the number of index creations, from any call, that haven't finished yet.
     */
    size_t inFlight();

private:
    void _reap();

    std::mutex _mutex;
    std::vector<std::future<void>> _tasks;
};

}  // namespace mongolink

#endif  // HEADER_8B8D8155_07D6_42CF_9DEF_46F86E8C01AD_INCLUDED
