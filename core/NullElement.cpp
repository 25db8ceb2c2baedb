/*
 * NullElement.cpp
 *
 *  JSON and XML element that is not there.
 */

#include "../headers/facet_internal.h"

namespace facet
{
    const NullElement& NullElement::instance()
    {
        static const NullElement s_instance{};
        return s_instance;
    }

    const NullElement& NullElement::of(const JsonElement* target)
    {
        return instance();
    }

    const NullElement& NullElement::of(const XmlElement* target)
    {
        return instance();
    }

    bool NullElement::isNull() const { return true; }

    char NullElement::charAt(int index) const { return '\0'; }
    int NullElement::length() const { return 0; }
    std::string NullElement::subSequence(int start, int end) const { return {}; }
    int NullElement::getStart() const { return 0; }
    int NullElement::getEnd() const { return 0; }
    void* NullElement::object() const { return nullptr; }
    JsonValueType NullElement::getValueType() const { return JsonValueType::NONE; }
    DocumentNode* NullElement::getNode() const { return nullptr; }
}
