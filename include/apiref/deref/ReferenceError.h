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

#include <fmt/format.h>
#include <optional>
#include <string>

#include <apiref/model/Reference.h>
#include <apiref/support/exception.h>

namespace apiref {

//////////////////////////////////////////////////////////////////////////////
/// @brief Base class of the errors raised while following a reference.
/// Every error names the exact category and name (or the external locator)
/// of the offending reference.
//////////////////////////////////////////////////////////////////////////////
class ReferenceError : public ApirefException
{
  public:
    enum Kind {
        NOT_FOUND,
        CANNOT_RESOLVE_REMOTE,
        RECURSIVE_REFERENCE,
        TYPE_MISMATCH,
    };

    Kind kind() const { return m_kind; }

    /// Category of the offending reference, absent for remote references.
    std::optional<Category> category() const { return m_category; }

    /// Definition name, or the locator of a remote reference.
    const std::string& name() const { return m_name; }

  protected:
    ReferenceError(Kind kind, std::optional<Category> category, const std::string& name, std::string&& msg)
      : ApirefException(std::forward<std::string>(msg)), m_kind{kind}, m_category{category}, m_name{name} {}

    static std::string describe(Category category, const std::string& name) {
        return fmt::format("{}/{}", category_name(category), name);
    }

  private:
    Kind m_kind;
    std::optional<Category> m_category;
    std::string m_name;
};


struct NotFound : public ReferenceError
{
    NotFound(Category category, const std::string& name)
      : ReferenceError(NOT_FOUND, category, name,
                       fmt::format("reference not found: no definition '{}' in components", describe(category, name))) {}
};


struct CannotResolveRemote : public ReferenceError
{
    CannotResolveRemote(const std::string& locator)
      : ReferenceError(CANNOT_RESOLVE_REMOTE, std::nullopt, locator,
                       fmt::format("cannot resolve remote reference '{}'", locator)) {}

    const std::string& locator() const { return name(); }
};


struct RecursiveReference : public ReferenceError
{
    RecursiveReference(Category category, const std::string& name)
      : ReferenceError(RECURSIVE_REFERENCE, category, name,
                       fmt::format("recursive reference: '{}' is already being resolved", describe(category, name))) {}
};


struct TypeMismatch : public ReferenceError
{
    TypeMismatch(Category category, const std::string& name, Category expected, Category actual)
      : ReferenceError(TYPE_MISMATCH, category, name,
                       fmt::format("type mismatch: '{}' is a {} definition, expected {}",
                                   describe(category, name), category_name(actual), category_name(expected))),
        m_expected{expected}, m_actual{actual} {}

    Category expected() const { return m_expected; }
    Category actual() const   { return m_actual; }

  private:
    Category m_expected;
    Category m_actual;
};


struct DuplicateDefinition : public ApirefException
{
    DuplicateDefinition(Category category, const std::string& name)
      : ApirefException(fmt::format("duplicate definition '{}/{}' in components", category_name(category), name)),
        m_category{category}, m_name{name} {}

    Category category() const { return m_category; }
    const std::string& name() const { return m_name; }

  private:
    Category m_category;
    std::string m_name;
};

} // namespace apiref
