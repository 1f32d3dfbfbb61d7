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

#include <mongolink/CollectionSpec.hpp>

#include <sstream>

#include <boost/throw_exception.hpp>

#include <mongolink/InvalidConfigurationException.hpp>
#include <mongolink/yamlToBson.hpp>

namespace mongolink {

CollectionSpec CollectionSpec::fromYaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        BOOST_THROW_EXCEPTION(InvalidConfigurationException("Collection spec must be a map"));
    }

    CollectionSpec spec;
    const YAML::Node indexes = node["indexes"];
    if (!indexes || indexes.IsNull()) {
        return spec;
    }
    if (!indexes.IsSequence()) {
        BOOST_THROW_EXCEPTION(
            InvalidConfigurationException("Collection spec 'indexes' must be a sequence"));
    }

    long i = 0;
    for (auto&& entry : indexes) {
        if (!entry.IsMap()) {
            std::ostringstream ss;
            ss << "Entry " << i << " of 'indexes' must be a map";
            BOOST_THROW_EXCEPTION(InvalidConfigurationException(ss.str()));
        }
        const YAML::Node keys = entry["index"];
        if (!keys) {
            std::ostringstream ss;
            ss << "Entry " << i << " of 'indexes' has no 'index' key";
            BOOST_THROW_EXCEPTION(InvalidConfigurationException(ss.str()));
        }

        IndexSpec index{toDocumentBson(keys)};
        const YAML::Node options = entry["options"];
        if (options && !options.IsNull()) {
            index.options = toDocumentBson(options);
        }
        spec.indexes.push_back(std::move(index));
        ++i;
    }
    return spec;
}

}  // namespace mongolink
