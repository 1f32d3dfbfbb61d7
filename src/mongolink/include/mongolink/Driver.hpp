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

#ifndef HEADER_D35AFB3D_C5CA_4E9A_94D9_F080175B04E6_INCLUDED
#define HEADER_D35AFB3D_C5CA_4E9A_94D9_F080175B04E6_INCLUDED

#include <memory>
#include <string>

#include <bsoncxx/document/view.hpp>

#include <mongolink/ConnectionDescriptor.hpp>

namespace mongolink {

/**
 * Abstraction over a single collection on the server.
 */
class CollectionHandle {
public:
    virtual ~CollectionHandle() = default;

    virtual std::string name() const = 0;

    /**
     * Create the index described by `keys` if it doesn't already exist.
     *
     * Implementations must allow concurrent calls from multiple threads.
     */
    virtual void ensureIndex(bsoncxx::document::view keys, bsoncxx::document::view options) = 0;
};

/**
 * Abstraction over an opened database.
 */
class DatabaseHandle {
public:
    virtual ~DatabaseHandle() = default;

    virtual std::string name() const = 0;

    virtual std::shared_ptr<CollectionHandle> createCollection(const std::string& name) = 0;

    virtual void dropCollection(const std::string& name) = 0;
};

/**
 * Abstraction over the client library that actually talks to the server.
 */
class Driver {
public:
    virtual ~Driver() = default;

    /**
     * Open a connection. Errors are reported by throwing whatever the underlying
     * library throws.
     *
     * @return the opened database. Callers treat `nullptr` as a failed connect.
     */
    virtual std::unique_ptr<DatabaseHandle> connect(const ConnectionDescriptor& descriptor) = 0;
};

}  // namespace mongolink

#endif  // HEADER_D35AFB3D_C5CA_4E9A_94D9_F080175B04E6_INCLUDED
