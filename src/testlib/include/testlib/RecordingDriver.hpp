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

#ifndef HEADER_0E3F2A41_6C1D_4B7E_9A52_3D8C7B1F6E09_INCLUDED
#define HEADER_0E3F2A41_6C1D_4B7E_9A52_3D8C7B1F6E09_INCLUDED

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <mongolink/Driver.hpp>

namespace mongolink::testing {

/**
 * In-memory `Driver` that records every call made through it.
 *
 * Behaviour is scripted through the public hooks; a hook that throws makes the
 * corresponding driver call fail with that exception. Handles handed out share
 * state with the driver and may outlive it.
 *
 * Recorded events look like:
 *
 *  - `connect <target>`
 *  - `createCollection <name>`
 *  - `ensureIndex <collection> <keys as json>` (appended once the call has returned)
 *  - `dropCollection <name>`
 */
class RecordingDriver : public Driver {
public:
    using ConnectHook = std::function<void(const ConnectionDescriptor&)>;
    using CollectionHook = std::function<void(const std::string& collection)>;
    using IndexHook = std::function<void(const std::string& collection,
                                         bsoncxx::document::view keys,
                                         bsoncxx::document::view options)>;

    RecordingDriver();
    ~RecordingDriver() override;

    std::unique_ptr<DatabaseHandle> connect(const ConnectionDescriptor& descriptor) override;

    /** Runs before a connect is recorded. */
    ConnectHook onConnect;
    /** When set, `connect()` "succeeds" with a null handle. */
    bool returnNoDatabase = false;

    CollectionHook onCreateCollection;
    CollectionHook onDropCollection;

    /** Runs on the calling thread, which is an index task for `IndexProvisioner`. */
    IndexHook onEnsureIndex;

    std::vector<std::string> events() const;
    std::vector<ConnectionDescriptor> connects() const;

    /** Number of `ensureIndex()` calls started, whether or not they succeed. */
    size_t ensureIndexCalls() const;

    struct State;

private:
    std::shared_ptr<State> _state;
};

}  // namespace mongolink::testing

#endif  // HEADER_0E3F2A41_6C1D_4B7E_9A52_3D8C7B1F6E09_INCLUDED
