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

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace apiref {

using Int = int64_t;
using Float = double;
using String = std::string;
using StringView = std::string_view;

struct nil_t {
    bool operator == (const nil_t&) const { return true; }
};
constexpr static nil_t nil;

template <typename T>
concept is_bool = std::is_same<T, bool>::value;

template<typename T>
concept is_like_Int = !is_bool<T> && std::is_integral<T>::value && std::is_convertible_v<T, Int>;

template<typename T>
concept is_like_Float = std::is_floating_point<T>::value;

} // namespace apiref
