/*
 * TypeDescriptor.cpp
 *
 *  The "is" relation over declared type hierarchies.
 */

#include "../headers/facet_internal.h"
#include <algorithm>
#include <functional>

namespace facet
{
    namespace {
        unsigned int depthOf(const std::vector<const TypeDescriptor*>& parents)
        {
            unsigned int depth = 0;
            for (const TypeDescriptor* parent : parents)
                depth = std::max(depth, parent->getDepth() + 1);
            return depth;
        }
    }

    unsigned long generate_type_hash(const std::string& name, unsigned long serial)
    {
        unsigned long hash = std::hash<std::string>{}(name) * 31UL + serial;
        // 0 is reserved for the absent type
        return hash == FACET_ABSENT_TYPE_HASH ? 1UL : hash;
    }

    TypeDescriptor::TypeDescriptor(
        const TypeSpace* space,
        std::string name,
        std::vector<const TypeDescriptor*> parents,
        unsigned long hash
    ) : space(space), name(std::move(name)), parents(std::move(parents)), hash(hash),
        depth(depthOf(this->parents))
    {
    }

    TypeDescriptor::~TypeDescriptor() = default;

    const std::string& TypeDescriptor::getName() const
    {
        return this->name;
    }

    unsigned long TypeDescriptor::getHash() const
    {
        return this->hash;
    }

    const TypeSpace* TypeDescriptor::getSpace() const
    {
        return this->space;
    }

    bool TypeDescriptor::isAbsent() const
    {
        return false;
    }

    const std::vector<const TypeDescriptor*>& TypeDescriptor::getParents() const
    {
        return this->parents;
    }

    unsigned int TypeDescriptor::getDepth() const
    {
        return this->depth;
    }

    /**
     * @brief Walks the ancestors of \a candidate looking for this type.
     *
     * Multiple parents make the hierarchy a DAG, so shared ancestors are visited once.
     * A proper ancestor is always shallower than its descendants, which lets the walk
     * drop every branch that is already at or above this type's depth.
     */
    bool TypeDescriptor::is(const TypeDescriptor* candidate) const
    {
        if (candidate == this)
            return true;
        if (!candidate || candidate->isAbsent() || candidate->space != this->space)
            return false;
        if (candidate->depth <= this->depth)
            return false;

        std::vector<const TypeDescriptor*> pending(candidate->parents.begin(), candidate->parents.end());
        std::vector<const TypeDescriptor*> visited;

        while (!pending.empty()) {
            const TypeDescriptor* current = pending.back();
            pending.pop_back();

            if (current == this)
                return true;
            if (current->depth <= this->depth)
                continue;
            if (std::find(visited.begin(), visited.end(), current) != visited.end())
                continue;

            visited.push_back(current);
            pending.insert(pending.end(), current->parents.begin(), current->parents.end());
        }
        return false;
    }

    bool TypeDescriptor::isSubtypeOf(const TypeDescriptor* other) const
    {
        return other != nullptr && other->is(this);
    }
}
