/*
 * NullNode.cpp
 *
 *  Document node that is not there. Every query answers the empty value of its
 *  return type and every modifier leaves everything untouched.
 */

#include "../headers/facet_internal.h"

namespace facet
{
    NullNode& NullNode::instance()
    {
        static NullNode s_instance{};
        return s_instance;
    }

    NullNode& NullNode::of(const DocumentNode* target)
    {
        return instance();
    }

    bool NullNode::isNull() const { return true; }

    //- Naming
    std::string NullNode::getNodeName() const { return {}; }
    std::string NullNode::getLocalName() const { return {}; }
    std::string NullNode::getPrefix() const { return {}; }
    void NullNode::setPrefix(const std::string& prefix) {}
    std::string NullNode::getNamespaceURI() const { return {}; }
    std::string NullNode::getBaseURI() const { return {}; }
    std::string NullNode::lookupNamespaceURI(const std::string& prefix) const { return {}; }
    std::string NullNode::lookupPrefix(const std::string& namespaceURI) const { return {}; }
    bool NullNode::isDefaultNamespace(const std::string& namespaceURI) const { return false; }

    //- Value
    unsigned short NullNode::getNodeType() const { return NONE_NODE; }
    std::string NullNode::getNodeValue() const { return {}; }
    void NullNode::setNodeValue(const std::string& nodeValue) {}
    std::string NullNode::getTextContent() const { return {}; }
    void NullNode::setTextContent(const std::string& textContent) {}

    //- Navigation
    DocumentNode* NullNode::getParentNode() const { return nullptr; }
    NodeList NullNode::getChildNodes() const { return {}; }
    DocumentNode* NullNode::getFirstChild() const { return nullptr; }
    DocumentNode* NullNode::getLastChild() const { return nullptr; }
    DocumentNode* NullNode::getPreviousSibling() const { return nullptr; }
    DocumentNode* NullNode::getNextSibling() const { return nullptr; }
    NodeList NullNode::getAttributes() const { return {}; }
    DocumentNode* NullNode::getOwnerDocument() const { return nullptr; }
    bool NullNode::hasChildNodes() const { return false; }
    bool NullNode::hasAttributes() const { return false; }

    //- Tree modifiers
    DocumentNode* NullNode::insertBefore(DocumentNode* newChild, DocumentNode* refChild) { return nullptr; }
    DocumentNode* NullNode::replaceChild(DocumentNode* newChild, DocumentNode* oldChild) { return nullptr; }
    DocumentNode* NullNode::removeChild(DocumentNode* oldChild) { return nullptr; }
    DocumentNode* NullNode::appendChild(DocumentNode* newChild) { return nullptr; }
    DocumentNode* NullNode::cloneNode(bool deep) const { return nullptr; }
    void NullNode::normalize() {}

    //- Comparison
    unsigned short NullNode::compareDocumentPosition(const DocumentNode* other) const { return 0; }
    bool NullNode::isSameNode(const DocumentNode* other) const { return false; }
    bool NullNode::isEqualNode(const DocumentNode* other) const { return false; }

    //- Features and user data
    bool NullNode::isSupported(const std::string& feature, const std::string& version) const { return false; }
    void* NullNode::getFeature(const std::string& feature, const std::string& version) const { return nullptr; }
    void* NullNode::setUserData(const std::string& key, void* data, UserDataHandler handler) { return nullptr; }
    void* NullNode::getUserData(const std::string& key) const { return nullptr; }
}
