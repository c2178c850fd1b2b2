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

#include <cctype>
#include <cstdio>
#include <string>
#include <sstream>
#include <vector>

#include <apiref/support/types.h>
#include <apiref/support/exception.h>

namespace apiref {

// JSON string quoting: escapes quotes, backslashes and control characters
inline
std::string quoted(const StringView& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('"');
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)c);
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

inline
std::string int_to_str(int64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%lld", (long long)v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string float_to_str(double v) {
    char buf[26];
    // There are 53-bits in IEEE 754 (64-bit float) standard, and log10(2**53) equals 15.95, so
    // round to 15 digits precision.
    auto len = std::snprintf(buf, 25, "%.15g", v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
StringView trim(const StringView& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace((unsigned char)str[begin])) ++begin;
    while (end > begin && std::isspace((unsigned char)str[end - 1])) --end;
    return str.substr(begin, end - begin);
}

inline
bool starts_with(const StringView& str, const StringView& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// split on a separator character, trimming each part and dropping empty parts
inline
std::vector<String> split_trimmed(const StringView& str, char sep) {
    std::vector<String> parts;
    size_t pos = 0;
    while (pos <= str.size()) {
        auto next = str.find(sep, pos);
        if (next == StringView::npos) next = str.size();
        auto part = trim(str.substr(pos, next - pos));
        if (part.size() > 0) parts.emplace_back(part);
        pos = next + 1;
    }
    return parts;
}

inline
String join(const std::vector<String>& parts, const StringView& sep) {
    String out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace apiref
