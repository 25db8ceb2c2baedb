/*
 * NullType.cpp
 *
 *  Reflective type without significance.
 */

#include "../headers/facet_internal.h"

namespace facet
{
    const NullType& NullType::instance()
    {
        static const NullType s_instance{};
        return s_instance;
    }

    void* NullType::accept(TypeVisitor* visitor, void* parameter) const
    {
        return nullptr;
    }

    const Annotation* NullType::getAnnotation(const std::string& annotationType) const
    {
        return nullptr;
    }

    std::vector<const Annotation*> NullType::getAnnotationMirrors() const
    {
        return {};
    }

    std::vector<const Annotation*> NullType::getAnnotationsByType(const std::string& annotationType) const
    {
        return {};
    }

    TypeKind NullType::getKind() const
    {
        return TypeKind::NONE;
    }
}
