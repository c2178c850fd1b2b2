#include <apiref/core.h>

#include <iostream>

using namespace apiref;

// Loads a components document from a JSON file, dereferences one named
// definition and prints it with every reference inlined.
//
//   apiref_dereference components.json schemas Pet
//
template <typename T>
Object dereference_named(const Components& components, const String& name) {
    return dereference(Reference<T>::local(name), components).inlined().encode();
}

Object dereference_definition(const Components& components, Category category, const String& name) {
    switch (category) {
        case SCHEMAS:        return dereference_named<Schema>(components, name);
        case RESPONSES:      return dereference_named<Response>(components, name);
        case PARAMETERS:     return dereference_named<Parameter>(components, name);
        case EXAMPLES:       return components.get<Example>(name).encode();
        case REQUEST_BODIES: return dereference_named<RequestBody>(components, name);
        case HEADERS:        return dereference_named<Header>(components, name);
    }
    return nil;
}

int main(int argc, char** argv) {
    if (argc != 4) {
        std::cerr << "usage: " << argv[0] << " <components.json> <category> <name>" << std::endl;
        return 2;
    }

    std::string error;
    auto document = json::parse_file(argv[1], error);
    if (error.size() > 0) {
        ERROR("{}", error);
        return 1;
    }

    // accept either a full document or the bare components object
    auto components_obj = document.is_map() && document.contains("components")? document.get("components"): document;

    auto category = parse_category(argv[2]);
    if (!category) {
        ERROR("unknown category '{}'", argv[2]);
        return 2;
    }

    try {
        auto components = Components::decode(components_obj);
        std::cout << dereference_definition(components, *category, argv[3]).to_json() << std::endl;
    } catch (const ApirefException& exc) {
        ERROR("{}", exc.message());
        return 1;
    }
    return 0;
}
