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

#ifndef HEADER_9DBED9FC_C6AF_409E_B4CE_17EEB0A0060B_INCLUDED
#define HEADER_9DBED9FC_C6AF_409E_B4CE_17EEB0A0060B_INCLUDED

#include <bsoncxx/array/value.hpp>
#include <bsoncxx/document/value.hpp>

#include <yaml-cpp/yaml.h>

#include <mongolink/InvalidConfigurationException.hpp>

namespace mongolink {

class InvalidYAMLToBsonException : public InvalidConfigurationException {
    using InvalidConfigurationException::InvalidConfigurationException;
};

/**
 * @return "undefined", "null", "scalar", "sequence" or "map", for error messages.
 */
const char* nodeTypeName(const YAML::Node& node);

/**
 * Quoted scalars stay strings; unquoted ones become int32, int64, double or bool
 * when they parse as such.
 *
 * @param node yaml map node
 * @return bson representation of it.
 * @throws InvalidYAMLToBsonException if node isn't a map
 */
bsoncxx::document::value toDocumentBson(const YAML::Node& node);

/**
 * @param node yaml list node
 * @return bson representation of it.
 * @throws InvalidYAMLToBsonException if node isn't a list (sequence)
 */
bsoncxx::array::value toArrayBson(const YAML::Node& node);

}  // namespace mongolink

#endif  // HEADER_9DBED9FC_C6AF_409E_B4CE_17EEB0A0060B_INCLUDED
