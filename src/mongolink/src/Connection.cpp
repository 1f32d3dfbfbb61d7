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

#include <mongolink/Connection.hpp>

#include <boost/log/trivial.hpp>

namespace mongolink {

Connection::Connection(ConnectionDescriptor descriptor, std::unique_ptr<DatabaseHandle> db)
    : _descriptor{std::move(descriptor)}, _db{std::move(db)} {}

std::shared_ptr<CollectionHandle> Connection::createCollection(const std::string& name,
                                                               const CollectionSpec& spec) {
    auto collection = _db->createCollection(name);
    BOOST_LOG_TRIVIAL(debug) << "Created collection '" << name << "' with "
                             << spec.indexes.size() << " index(es) to build";

    _indexes.ensureIndexes(collection, spec.indexes);
    return collection;
}

void Connection::dropCollection(const std::string& name) {
    _db->dropCollection(name);
}

}  // namespace mongolink
