#include "WamCommand.h"
#include "WamErrors.h"
#include "WamXml.h"

#include <cctype>
#include <sstream>

const char* endpointName(WamEndpoint endpoint) {
    switch (endpoint) {
        case WamEndpoint::UIC: return "UIC";
        case WamEndpoint::CPM: return "CPM";
    }
    return "UIC";
}

static const char* paramTypeName(WamParam::Type type) {
    switch (type) {
        case WamParam::Type::Str:   return "str";
        case WamParam::Type::Dec:   return "dec";
        case WamParam::Type::Cdata: return "cdata";
    }
    return "str";
}

static std::string escapeAttribute(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

// "]]>" cannot appear inside a CDATA section, split it across two sections
static std::string escapeCdata(const std::string& value) {
    std::string out;
    size_t pos = 0;
    size_t found;
    while ((found = value.find("]]>", pos)) != std::string::npos) {
        out += value.substr(pos, found - pos);
        out += "]]]]><![CDATA[>";
        pos = found + 3;
    }
    out += value.substr(pos);
    return out;
}

WamCommand::WamCommand(const std::string& name, WamEndpoint endpoint)
    : m_name(name)
    , m_endpoint(endpoint)
{
}

WamCommand& WamCommand::str(const std::string& name, const std::string& value) {
    m_params.push_back({WamParam::Type::Str, name, value});
    return *this;
}

WamCommand& WamCommand::dec(const std::string& name, long long value) {
    m_params.push_back({WamParam::Type::Dec, name, std::to_string(value)});
    return *this;
}

WamCommand& WamCommand::cdata(const std::string& name, const std::string& value) {
    m_params.push_back({WamParam::Type::Cdata, name, value});
    return *this;
}

std::string WamCommand::param(const std::string& name) const {
    for (const auto& p : m_params) {
        if (p.name == name) {
            return p.value;
        }
    }
    return "";
}

size_t WamCommand::countParams(const std::string& name) const {
    size_t count = 0;
    for (const auto& p : m_params) {
        if (p.name == name) {
            ++count;
        }
    }
    return count;
}

std::string WamCommand::toXml() const {
    std::stringstream ss;
    ss << "<name>" << m_name << "</name>";

    for (const auto& p : m_params) {
        ss << "<p type=\"" << paramTypeName(p.type) << "\" name=\"" << escapeAttribute(p.name) << "\"";
        if (p.type == WamParam::Type::Cdata) {
            // Vendor quirk: the attribute is a placeholder, the value lives in CDATA
            ss << " val=\"empty\"><![CDATA[" << escapeCdata(p.value) << "]]></p>";
        } else {
            ss << " val=\"" << escapeAttribute(p.value) << "\"/>";
        }
    }
    return ss.str();
}

std::string WamCommand::encode() const {
    return urlEncode(toXml());
}

std::string WamCommand::urlEncode(const std::string& text) {
    static const char hex[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '_' || c == '.' || c == '~' || c == '-') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[c >> 4];
            encoded += hex[c & 0x0F];
        }
    }

    // The device does not decode these two
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            std::string code = encoded.substr(i + 1, 2);
            if (code == "2F") { out += '/'; i += 2; continue; }
            if (code == "3D") { out += '='; i += 2; continue; }
        }
        out += encoded[i];
    }
    return out;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string WamCommand::urlDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

WamCommand WamCommand::decode(const std::string& encoded, WamEndpoint endpoint) {
    std::string fragment = urlDecode(encoded);

    // The fragment has no single root, give it one
    IxmlDocumentPtr doc = ixmlParse("<wamcmd>" + fragment + "</wamcmd>");
    if (!doc) {
        throw ProtocolError("decode", "malformed command fragment", fragment);
    }

    IXML_Node* root = ixmlRootElement(doc.get());
    std::vector<IXML_Node*> children = ixmlChildElements(root);
    if (children.empty() || std::string(ixmlNode_getNodeName(children.front())) != "name") {
        throw ProtocolError("decode", "missing <name> element", fragment);
    }

    WamCommand command(ixmlElementText(children.front()), endpoint);

    for (size_t i = 1; i < children.size(); ++i) {
        IXML_Node* p = children[i];
        if (std::string(ixmlNode_getNodeName(p)) != "p") {
            throw ProtocolError("decode", "unexpected element <" +
                                std::string(ixmlNode_getNodeName(p)) + ">", fragment);
        }

        std::string type = ixmlAttribute(p, "type");
        std::string name = ixmlAttribute(p, "name");
        if (type == "cdata") {
            command.m_params.push_back({WamParam::Type::Cdata, name, ixmlElementText(p)});
        } else if (type == "dec") {
            command.m_params.push_back({WamParam::Type::Dec, name, ixmlAttribute(p, "val")});
        } else if (type == "str") {
            command.m_params.push_back({WamParam::Type::Str, name, ixmlAttribute(p, "val")});
        } else {
            throw ProtocolError("decode", "unknown parameter type '" + type + "'", fragment);
        }
    }

    return command;
}
