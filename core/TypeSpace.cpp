/*
 * TypeSpace.cpp
 *
 *  Owner and registry of type descriptors.
 */

#include "../headers/facet_internal.h"
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace facet {

struct TypeSpace::Impl {
    std::vector<std::unique_ptr<const TypeDescriptor>> types;
    std::map<std::string, const TypeDescriptor*> byName;
};

TypeSpace::TypeSpace() :
    maxHierarchyDepth(FACET_DEFAULT_HIERARCHY_DEPTH),
    diagnostics(diagnosticsRequested(FACET_TYPE_DIAG_ENV)),
    typeNotFoundCallback(nullptr),
    impl(std::make_unique<Impl>())
{
}

TypeSpace::~TypeSpace() = default;

const TypeDescriptor* TypeSpace::newType(const std::string& name, const std::vector<const TypeDescriptor*>& parents) {
    if (impl->byName.count(name)) {
        if (diagnostics) {
            fprintf(stderr, "DEBUG: [TYPE] newType(%s) rejected: already declared\n", name.c_str());
        }
        throw std::invalid_argument(Message::colon(Message::TypeExists) + name);
    }

    unsigned int depth = 0;
    for (const TypeDescriptor* parent : parents) {
        if (!parent || parent->isAbsent()) {
            if (diagnostics) {
                fprintf(stderr, "DEBUG: [TYPE] newType(%s) rejected: absent parent\n", name.c_str());
            }
            throw std::invalid_argument(Message::colon(Message::TypeAbsentParent) + name);
        }
        if (parent->getSpace() != this) {
            if (diagnostics) {
                fprintf(stderr, "DEBUG: [TYPE] newType(%s) rejected: foreign parent %s\n", name.c_str(), parent->getName().c_str());
            }
            throw std::invalid_argument(Message::colon(Message::TypeForeign) + parent->getName());
        }
        if (parent->getDepth() + 1 > depth) depth = parent->getDepth() + 1;
    }

    if (depth > maxHierarchyDepth) {
        if (diagnostics) {
            fprintf(stderr, "DEBUG: [TYPE] newType(%s) rejected: depth=%u max=%u\n", name.c_str(), depth, maxHierarchyDepth);
        }
        throw std::invalid_argument(Message::colon(Message::TypeTooDeep) + name);
    }

    const unsigned long hash = generate_type_hash(name, impl->types.size());
    std::unique_ptr<const TypeDescriptor> type(new TypeDescriptor(this, name, parents, hash));
    const TypeDescriptor* raw = type.get();
    impl->types.push_back(std::move(type));
    impl->byName[name] = raw;

    if (diagnostics) {
        fprintf(stderr, "DEBUG: [TYPE] newType(%s) depth=%u parents=%lu\n", name.c_str(), depth, (unsigned long)parents.size());
    }
    return raw;
}

const TypeDescriptor* TypeSpace::getType(const std::string& name) {
    auto it = impl->byName.find(name);
    if (it != impl->byName.end()) return it->second;

    if (diagnostics) {
        fprintf(stderr, "DEBUG: [TYPE] getType(%s) not declared\n", name.c_str());
    }
    if (typeNotFoundCallback) {
        const TypeDescriptor* found = typeNotFoundCallback(this, name);
        if (found) return found;
    }
    return FACET_ABSENT_TYPE;
}

bool TypeSpace::isDeclared(const std::string& name) const {
    return impl->byName.count(name) != 0;
}

unsigned long TypeSpace::getSize() const {
    return impl->types.size();
}

} // namespace facet
