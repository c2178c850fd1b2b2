// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <optional>

#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/Example.h>

namespace apiref {

using DereferencedExampleMap = OrderedMap<Example>;

namespace impl {

// Keys and their order are preserved.
inline
std::optional<DereferencedExampleMap> dereference_examples(const std::optional<ExampleMap>& examples, ResolutionContext& context) {
    if (!examples) return std::nullopt;
    DereferencedExampleMap result;
    for (auto& [name, example] : *examples)
        result.insert({name, context.dereference(example)});
    return result;
}

// True when the first entry of the examples map carries an inline value.
inline
bool has_first_value(const std::optional<DereferencedExampleMap>& examples) {
    return examples && examples->size() > 0 && examples->begin()->second.value.has_value();
}

// The value of the first entry of the examples map replaces the single
// example.  An empty map, or a first entry with only an external value,
// leaves the single example in place.
inline
std::optional<Object> derive_example(const std::optional<DereferencedExampleMap>& examples, const std::optional<Object>& example) {
    if (has_first_value(examples)) return codec::copy(examples->begin()->second.value);
    return codec::copy(example);
}

inline
std::optional<ExampleMap> inline_examples(const std::optional<DereferencedExampleMap>& examples) {
    if (!examples) return std::nullopt;
    ExampleMap result;
    for (auto& [name, example] : *examples)
        result.insert({name, example});
    return result;
}

} // namespace impl
} // namespace apiref
