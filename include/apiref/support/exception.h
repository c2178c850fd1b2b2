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

#include <exception>
#include <string>
#include <sstream>
#include <cpptrace/cpptrace.hpp>

#include <apiref/support/types.h>

#define ASSERT(cond) { if (!(cond)) throw ::apiref::Assert{#cond}; }

namespace apiref {

class ApirefException : public cpptrace::exception_with_message
{
  public:
    ApirefException(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
    ApirefException() : ApirefException{""} {}
};


class Assert : public cpptrace::exception_with_message
{
  public:
    Assert(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
};


struct WrongType : public ApirefException
{
    static std::string make_message(const std::string_view& actual) {
        std::stringstream ss;
        ss << "type=" << actual;
        return ss.str();
    }

    static std::string make_message(const std::string_view& actual, const std::string_view& expected) {
        std::stringstream ss;
        ss << "type=" << actual << ", expected=" << expected;
        return ss.str();
    }

    WrongType(const std::string_view& actual) : ApirefException(make_message(actual)) {}
    WrongType(const std::string_view& actual, const std::string_view& expected) : ApirefException(make_message(actual, expected)) {}
};


/// Raised by the model decoders when a document field has the wrong shape.
/// The path names the offending field, e.g. "schemas.Pet.properties.id.type".
struct DecodeError : public ApirefException
{
    static std::string make_message(const std::string& path, const std::string& message) {
        std::stringstream ss;
        ss << "decode error at '" << path << "': " << message;
        return ss.str();
    }

    DecodeError(const std::string& path, const std::string& message)
      : ApirefException(make_message(path, message)), m_path{path} {}

    const std::string& path() const { return m_path; }

  private:
    std::string m_path;
};

} // namespace apiref
