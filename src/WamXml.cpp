#include "WamXml.h"

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

IxmlDocumentPtr ixmlParse(const std::string& buffer) {
    if (buffer.empty()) {
        return IxmlDocumentPtr();
    }

    IXML_Document* doc = nullptr;
    if (ixmlParseBufferEx(buffer.c_str(), &doc) != IXML_SUCCESS) {
        if (doc) {
            ixmlDocument_free(doc);
        }
        return IxmlDocumentPtr();
    }
    return IxmlDocumentPtr(doc);
}

IXML_Node* ixmlRootElement(IXML_Document* doc) {
    if (!doc) return nullptr;

    for (IXML_Node* node = ixmlNode_getFirstChild(&doc->n); node;
         node = ixmlNode_getNextSibling(node)) {
        if (ixmlNode_getNodeType(node) == eELEMENT_NODE) {
            return node;
        }
    }
    return nullptr;
}

std::vector<IXML_Node*> ixmlChildElements(IXML_Node* node) {
    std::vector<IXML_Node*> children;
    if (!node) return children;

    for (IXML_Node* child = ixmlNode_getFirstChild(node); child;
         child = ixmlNode_getNextSibling(child)) {
        if (ixmlNode_getNodeType(child) == eELEMENT_NODE) {
            children.push_back(child);
        }
    }
    return children;
}

std::string ixmlAttribute(IXML_Node* element, const std::string& name) {
    if (!element) return "";

    const char* value = ixmlElement_getAttribute(
        reinterpret_cast<IXML_Element*>(element), const_cast<char*>(name.c_str()));
    return value ? value : "";
}

std::string ixmlElementText(IXML_Node* element) {
    if (!element) return "";

    std::string cdata;
    std::string text;
    bool sawCdata = false;

    for (IXML_Node* child = ixmlNode_getFirstChild(element); child;
         child = ixmlNode_getNextSibling(child)) {
        const char* value = ixmlNode_getNodeValue(child);
        if (!value) continue;

        switch (ixmlNode_getNodeType(child)) {
            case eCDATA_SECTION_NODE:
                cdata += value;
                sawCdata = true;
                break;
            case eTEXT_NODE:
                text += value;
                break;
            default:
                break;
        }
    }

    // CDATA is taken verbatim, plain text is whitespace-trimmed
    return sawCdata ? cdata : trim(text);
}
