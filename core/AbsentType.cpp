/*
 * AbsentType.cpp
 *
 *  The distinguished absent type. It belongs to no space, has no parents and is
 *  only ever itself.
 */

#include "../headers/facet_internal.h"

namespace facet
{
    AbsentType::AbsentType() :
        TypeDescriptor(nullptr, FACET_ABSENT_TYPE_NAME, {}, FACET_ABSENT_TYPE_HASH)
    {
    }

    const AbsentType& AbsentType::instance()
    {
        static const AbsentType s_instance;
        return s_instance;
    }

    // No data survives the conversion, so every source yields the shared instance.
    const AbsentType& AbsentType::fromNode(const DocumentNode* node)
    {
        return instance();
    }

    const AbsentType& AbsentType::fromElement(const JsonElement* element)
    {
        return instance();
    }

    const AbsentType& AbsentType::fromElement(const XmlElement* element)
    {
        return instance();
    }

    bool AbsentType::isNull() const
    {
        return true;
    }

    bool AbsentType::isAbsent() const
    {
        return true;
    }

    bool AbsentType::is(const TypeDescriptor* candidate) const
    {
        return candidate == this;
    }
}
