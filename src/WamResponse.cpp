#include "WamResponse.h"
#include "WamErrors.h"
#include "WamXml.h"

#include <cstdlib>
#include <cerrno>
#include <climits>

static void collectFields(IXML_Node* element,
                          std::vector<std::pair<std::string, std::string>>& out) {
    for (IXML_Node* child : ixmlChildElements(element)) {
        out.emplace_back(ixmlNode_getNodeName(child), ixmlElementText(child));
        collectFields(child, out);
    }
}

WamResponse WamResponse::parse(const std::string& command, WamEndpoint endpoint,
                               const std::string& body) {
    if (body.empty()) {
        throw ProtocolError(command, "empty response", body);
    }

    IxmlDocumentPtr doc = ixmlParse(body);
    if (!doc) {
        throw ProtocolError(command, "malformed XML", body);
    }

    IXML_Node* root = ixmlRootElement(doc.get());
    if (!root || std::string(ixmlNode_getNodeName(root)) != endpointName(endpoint)) {
        throw ProtocolError(command, std::string("root element is not <") +
                            endpointName(endpoint) + ">", body);
    }

    IXML_Node* responseNode = nullptr;
    WamResponse response;
    response.m_command = command;
    response.m_raw = body;

    for (IXML_Node* child : ixmlChildElements(root)) {
        std::string tag = ixmlNode_getNodeName(child);
        if (tag == "response") {
            responseNode = child;
        } else if (tag == "method") {
            response.m_method = ixmlElementText(child);
        }
    }

    if (!responseNode) {
        throw ProtocolError(command, "missing <response> element", body);
    }

    std::string result = ixmlAttribute(responseNode, "result");
    if (!result.empty() && result != "ok") {
        throw ProtocolError(command, "device reported result=\"" + result + "\"", body);
    }

    collectFields(responseNode, response.m_fields);
    return response;
}

bool WamResponse::has(const std::string& field) const {
    for (const auto& f : m_fields) {
        if (f.first == field) return true;
    }
    return false;
}

std::string WamResponse::field(const std::string& name) const {
    for (const auto& f : m_fields) {
        if (f.first == name) return f.second;
    }
    throw ProtocolError(m_command, "missing <" + name + "> in response", m_raw);
}

int WamResponse::intField(const std::string& name) const {
    std::string value = field(name);

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE ||
        parsed < INT_MIN || parsed > INT_MAX) {
        throw ProtocolError(m_command, "<" + name + "> is not an integer: '" + value + "'", m_raw);
    }
    return static_cast<int>(parsed);
}

std::string WamResponse::optionalField(const std::string& name) const {
    for (const auto& f : m_fields) {
        if (f.first == name) return f.second;
    }
    return "";
}

std::vector<std::string> WamResponse::fields(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& f : m_fields) {
        if (f.first == name) values.push_back(f.second);
    }
    return values;
}
