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

#include <mongolink/yamlToBson.hpp>

#include <cstdint>
#include <sstream>
#include <string>

#include <boost/throw_exception.hpp>

#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/types.hpp>

namespace mongolink {
namespace {

using bsoncxx::builder::basic::kvp;

std::string to_string(const YAML::Node& node) {
    YAML::Emitter e;
    e << node;
    return std::string{e.c_str()};
}

/**
 * Call `append` with the most specific BSON value `node` converts to.
 */
template <typename Append>
void appendScalar(const YAML::Node& node, Append&& append) {
    if (node.IsNull() || !node.IsDefined()) {
        append(bsoncxx::types::b_null{});
        return;
    }

    // A tag of "!" means the scalar was quoted; keep "123" a string.
    if (node.Tag() != "!") {
        int32_t i32;
        if (YAML::convert<int32_t>::decode(node, i32)) {
            append(i32);
            return;
        }
        int64_t i64;
        if (YAML::convert<int64_t>::decode(node, i64)) {
            append(i64);
            return;
        }
        double dbl;
        if (YAML::convert<double>::decode(node, dbl)) {
            append(dbl);
            return;
        }
        bool b;
        if (YAML::convert<bool>::decode(node, b)) {
            append(b);
            return;
        }
    }

    append(node.Scalar());
}

void appendTo(bsoncxx::builder::basic::document& doc, const std::string& key, const YAML::Node& node) {
    if (node.IsMap()) {
        doc.append(kvp(key, toDocumentBson(node)));
    } else if (node.IsSequence()) {
        doc.append(kvp(key, toArrayBson(node)));
    } else {
        appendScalar(node, [&](auto&& value) { doc.append(kvp(key, value)); });
    }
}

void appendTo(bsoncxx::builder::basic::array& arr, const YAML::Node& node) {
    if (node.IsMap()) {
        arr.append(toDocumentBson(node));
    } else if (node.IsSequence()) {
        arr.append(toArrayBson(node));
    } else {
        appendScalar(node, [&](auto&& value) { arr.append(value); });
    }
}

}  // namespace

const char* nodeTypeName(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
            return "undefined";
        case YAML::NodeType::Null:
            return "null";
        case YAML::NodeType::Scalar:
            return "scalar";
        case YAML::NodeType::Sequence:
            return "sequence";
        case YAML::NodeType::Map:
            return "map";
    }
    return "unknown";
}

bsoncxx::document::value toDocumentBson(const YAML::Node& node) {
    if (!node.IsMap()) {
        std::stringstream msg;
        msg << "Wanted map got " << nodeTypeName(node) << ": " << to_string(node);
        BOOST_THROW_EXCEPTION(InvalidYAMLToBsonException(msg.str()));
    }

    bsoncxx::builder::basic::document doc{};
    for (auto&& entry : node) {
        appendTo(doc, entry.first.as<std::string>(), entry.second);
    }
    return doc.extract();
}

bsoncxx::array::value toArrayBson(const YAML::Node& node) {
    if (!node.IsSequence()) {
        std::stringstream msg;
        msg << "Wanted sequence got " << nodeTypeName(node) << ": " << to_string(node);
        BOOST_THROW_EXCEPTION(InvalidYAMLToBsonException(msg.str()));
    }

    bsoncxx::builder::basic::array arr{};
    for (auto&& elt : node) {
        appendTo(arr, elt);
    }
    return arr.extract();
}

}  // namespace mongolink
