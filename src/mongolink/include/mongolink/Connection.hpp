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

#ifndef HEADER_56684EA5_B166_4171_9E98_CE668E7DF681_INCLUDED
#define HEADER_56684EA5_B166_4171_9E98_CE668E7DF681_INCLUDED

#include <memory>
#include <string>

#include <mongolink/CollectionSpec.hpp>
#include <mongolink/ConnectionDescriptor.hpp>
#include <mongolink/Driver.hpp>
#include <mongolink/IndexProvisioner.hpp>

namespace mongolink {

/**
 * An opened connection to one database.
 *
 * Exclusively owns the database handle it was built with. The handle is never
 * replaced; there is no reconnect logic here. Obtain one from `ConnectionBuilder`.
 */
class Connection {
public:
    /**
     * @param db must not be null.
     */
    Connection(ConnectionDescriptor descriptor, std::unique_ptr<DatabaseHandle> db);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const ConnectionDescriptor& descriptor() const {
        return _descriptor;
    }

    DatabaseHandle& database() const {
        return *_db;
    }

    /**
     * Create `name` and then every index in `spec`.
     *
     * Returns only once all indexes exist. If an index fails the collection is left
     * in place with whichever indexes did get created.
     *
     * @throws IndexProvisionException if any index creation fails.
     */
    std::shared_ptr<CollectionHandle> createCollection(const std::string& name,
                                                       const CollectionSpec& spec);

    void dropCollection(const std::string& name);

private:
    ConnectionDescriptor _descriptor;
    std::unique_ptr<DatabaseHandle> _db;

    // Declared after _db so stragglers are joined before the database goes away.
    IndexProvisioner _indexes;
};

}  // namespace mongolink

#endif  // HEADER_56684EA5_B166_4171_9E98_CE668E7DF681_INCLUDED
