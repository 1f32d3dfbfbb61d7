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

#include <testlib/RecordingDriver.hpp>

#include <bsoncxx/json.hpp>

namespace mongolink::testing {

struct RecordingDriver::State {
    void record(std::string event) {
        std::lock_guard<std::mutex> lock{mutex};
        events.push_back(std::move(event));
    }

    mutable std::mutex mutex;
    std::vector<std::string> events;
    std::vector<ConnectionDescriptor> connects;
    size_t ensureIndexCalls = 0;

    // Copies of the driver's hooks, taken at connect() time.
    CollectionHook onCreateCollection;
    CollectionHook onDropCollection;
    IndexHook onEnsureIndex;
};

namespace {

class RecordingCollection : public CollectionHandle {
public:
    RecordingCollection(std::shared_ptr<RecordingDriver::State> state, std::string name)
        : _state{std::move(state)}, _name{std::move(name)} {}

    std::string name() const override {
        return _name;
    }

    void ensureIndex(bsoncxx::document::view keys, bsoncxx::document::view options) override {
        {
            std::lock_guard<std::mutex> lock{_state->mutex};
            ++_state->ensureIndexCalls;
        }
        if (_state->onEnsureIndex) {
            _state->onEnsureIndex(_name, keys, options);
        }
        _state->record("ensureIndex " + _name + " " + bsoncxx::to_json(keys));
    }

private:
    std::shared_ptr<RecordingDriver::State> _state;
    const std::string _name;
};

class RecordingDatabase : public DatabaseHandle {
public:
    RecordingDatabase(std::shared_ptr<RecordingDriver::State> state, std::string name)
        : _state{std::move(state)}, _name{std::move(name)} {}

    std::string name() const override {
        return _name;
    }

    std::shared_ptr<CollectionHandle> createCollection(const std::string& name) override {
        if (_state->onCreateCollection) {
            _state->onCreateCollection(name);
        }
        _state->record("createCollection " + name);
        return std::make_shared<RecordingCollection>(_state, name);
    }

    void dropCollection(const std::string& name) override {
        if (_state->onDropCollection) {
            _state->onDropCollection(name);
        }
        _state->record("dropCollection " + name);
    }

private:
    std::shared_ptr<RecordingDriver::State> _state;
    const std::string _name;
};

}  // namespace

RecordingDriver::RecordingDriver() : _state{std::make_shared<State>()} {}

RecordingDriver::~RecordingDriver() = default;

std::unique_ptr<DatabaseHandle> RecordingDriver::connect(const ConnectionDescriptor& descriptor) {
    if (onConnect) {
        onConnect(descriptor);
    }
    {
        std::lock_guard<std::mutex> lock{_state->mutex};
        _state->connects.push_back(descriptor);
        _state->events.push_back("connect " + descriptor.target);
        _state->onCreateCollection = onCreateCollection;
        _state->onDropCollection = onDropCollection;
        _state->onEnsureIndex = onEnsureIndex;
    }

    if (returnNoDatabase) {
        return nullptr;
    }
    return std::make_unique<RecordingDatabase>(_state, "test");
}

std::vector<std::string> RecordingDriver::events() const {
    std::lock_guard<std::mutex> lock{_state->mutex};
    return _state->events;
}

std::vector<ConnectionDescriptor> RecordingDriver::connects() const {
    std::lock_guard<std::mutex> lock{_state->mutex};
    return _state->connects;
}

size_t RecordingDriver::ensureIndexCalls() const {
    std::lock_guard<std::mutex> lock{_state->mutex};
    return _state->ensureIndexCalls;
}

}  // namespace mongolink::testing
