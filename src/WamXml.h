/**
 * @file WamXml.h
 * @brief Thin ixml helpers shared by the command codec and reply parser
 */

#ifndef WAM_XML_H
#define WAM_XML_H

#include <upnp/ixml.h>
#include <memory>
#include <string>
#include <vector>

struct IxmlDocumentDeleter {
    void operator()(IXML_Document* doc) const {
        if (doc) {
            ixmlDocument_free(doc);
        }
    }
};

using IxmlDocumentPtr = std::unique_ptr<IXML_Document, IxmlDocumentDeleter>;

// Parse a buffer; returns nullptr on malformed XML
IxmlDocumentPtr ixmlParse(const std::string& buffer);

// First element child of the document (skips prolog/comments)
IXML_Node* ixmlRootElement(IXML_Document* doc);

// Element children of a node, in document order
std::vector<IXML_Node*> ixmlChildElements(IXML_Node* node);

// Attribute value, empty if the attribute is absent
std::string ixmlAttribute(IXML_Node* element, const std::string& name);

// Text content of an element. CDATA sections win over plain text, so
// <spkname><![CDATA[Kitchen]]></spkname> yields "Kitchen".
std::string ixmlElementText(IXML_Node* element);

#endif // WAM_XML_H
