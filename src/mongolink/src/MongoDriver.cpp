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

#include <mongolink/MongoDriver.hpp>

#include <string>

#include <boost/log/trivial.hpp>

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/pool.hpp>

#include <mongolink/v1/PoolFactory.hpp>

namespace mongolink {
namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

class MongoCollectionHandle : public CollectionHandle {
public:
    MongoCollectionHandle(std::shared_ptr<mongocxx::pool> pool,
                          std::string database,
                          std::string name)
        : _pool{std::move(pool)}, _database{std::move(database)}, _name{std::move(name)} {}

    std::string name() const override {
        return _name;
    }

    void ensureIndex(bsoncxx::document::view keys, bsoncxx::document::view options) override {
        auto client = _pool->acquire();
        (*client)[_database][_name].create_index(keys, options);
    }

private:
    std::shared_ptr<mongocxx::pool> _pool;
    const std::string _database;
    const std::string _name;
};

class MongoDatabaseHandle : public DatabaseHandle {
public:
    MongoDatabaseHandle(std::shared_ptr<mongocxx::pool> pool, std::string name)
        : _pool{std::move(pool)}, _name{std::move(name)} {}

    std::string name() const override {
        return _name;
    }

    std::shared_ptr<CollectionHandle> createCollection(const std::string& name) override {
        auto client = _pool->acquire();
        auto database = (*client)[_name];

        // An existing collection is reused as-is.
        if (!database.has_collection(name)) {
            database.create_collection(name);
        }
        return std::make_shared<MongoCollectionHandle>(_pool, _name, name);
    }

    void dropCollection(const std::string& name) override {
        auto client = _pool->acquire();
        (*client)[_name][name].drop();
    }

private:
    std::shared_ptr<mongocxx::pool> _pool;
    const std::string _name;
};

}  // namespace

MongoDriver::MongoDriver() : _instance{mongocxx::instance::current()} {}

std::unique_ptr<DatabaseHandle> MongoDriver::connect(const ConnectionDescriptor& descriptor) {
    auto factory = v1::PoolFactory(descriptor.target, descriptor.options);
    std::shared_ptr<mongocxx::pool> pool = factory.makePool();

    {
        auto client = pool->acquire();
        auto ping = make_document(kvp("ping", 1));
        (*client)["admin"].run_command(ping.view());
    }

    auto database = factory.database();
    if (database.empty()) {
        database = kDefaultDatabase;
    }
    return std::make_unique<MongoDatabaseHandle>(std::move(pool), std::move(database));
}

}  // namespace mongolink
