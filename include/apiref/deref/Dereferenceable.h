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

#include <concepts>

#include <apiref/deref/DereferencedContent.h>
#include <apiref/deref/DereferencedEncoding.h>
#include <apiref/deref/DereferencedHeader.h>
#include <apiref/deref/DereferencedParameter.h>
#include <apiref/deref/DereferencedRequestBody.h>
#include <apiref/deref/DereferencedResponse.h>
#include <apiref/deref/DereferencedSchema.h>
#include <apiref/deref/DereferencedSchemaContext.h>
#include <apiref/deref/ResolutionContext.h>
#include <apiref/model/Components.h>

namespace apiref {

template <typename T>
concept Dereferenceable = requires (const T& node, const Components& components, ResolutionContext& context) {
    typename T::Dereferenced;
    { node.dereferenced(components) } -> std::same_as<typename T::Dereferenced>;
    { node.dereferenced(context) } -> std::same_as<typename T::Dereferenced>;
};

static_assert(Dereferenceable<Schema>);
static_assert(Dereferenceable<SchemaContext>);
static_assert(Dereferenceable<Example>);
static_assert(Dereferenceable<Header>);
static_assert(Dereferenceable<Encoding>);
static_assert(Dereferenceable<Content>);
static_assert(Dereferenceable<Parameter>);
static_assert(Dereferenceable<RequestBody>);
static_assert(Dereferenceable<Response>);

template <Dereferenceable T>
typename T::Dereferenced dereference(const T& node, const Components& components) {
    return node.dereferenced(components);
}

template <Dereferenceable T>
typename T::Dereferenced dereference(const Reference<T>& ref, const Components& components) {
    ResolutionContext context{components};
    return context.dereference(ref);
}

template <Dereferenceable T>
typename T::Dereferenced dereference(const RefOr<T>& either, const Components& components) {
    ResolutionContext context{components};
    return context.dereference(either);
}

} // namespace apiref
