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

#ifndef HEADER_50421FB2_B1F8_464E_9171_A1E7C29C4A19_INCLUDED
#define HEADER_50421FB2_B1F8_464E_9171_A1E7C29C4A19_INCLUDED

#include <vector>

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/document/value.hpp>

#include <yaml-cpp/yaml.h>

namespace mongolink {

/**
 * One secondary index: the key definition plus its creation options
 * (e.g. `{unique: true}`).
 */
struct IndexSpec {
    bsoncxx::document::value index;
    bsoncxx::document::value options = bsoncxx::builder::basic::make_document();
};

/**
 * Everything needed to set up a collection beyond its name.
 *
 * ```yaml
 * indexes:
 *   - index: {sku: 1}
 *     options: {unique: true}
 *   - index: {createdAt: -1}
 * ```
 *
 * Duplicate index entries are not filtered out.
 */
struct CollectionSpec {
    std::vector<IndexSpec> indexes;

    /**
     * @throws InvalidConfigurationException
     *   if `node` isn't a map, `indexes` isn't a sequence, or an entry lacks `index`.
     */
    static CollectionSpec fromYaml(const YAML::Node& node);
};

}  // namespace mongolink

#endif  // HEADER_50421FB2_B1F8_464E_9171_A1E7C29C4A19_INCLUDED
