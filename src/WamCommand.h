/**
 * @file WamCommand.h
 * @brief UIC/CPM command builder and wire codec
 *
 * A command serializes to the vendor XML fragment
 *   <name>SetVolume</name><p type="dec" name="volume" val="15"/>
 * which is percent-encoded for the query string, except that the device
 * wants '/' and '=' left as they are.
 */

#ifndef WAM_COMMAND_H
#define WAM_COMMAND_H

#include <string>
#include <vector>

enum class WamEndpoint {
    UIC,    // playback, volume, naming, grouping
    CPM     // content provider services
};

const char* endpointName(WamEndpoint endpoint);

struct WamParam {
    enum class Type { Str, Dec, Cdata };

    Type type;
    std::string name;
    std::string value;

    bool operator==(const WamParam& other) const {
        return type == other.type && name == other.name && value == other.value;
    }
};

class WamCommand {
public:
    explicit WamCommand(const std::string& name, WamEndpoint endpoint = WamEndpoint::UIC);

    // Builders, chainable
    WamCommand& str(const std::string& name, const std::string& value);
    WamCommand& dec(const std::string& name, long long value);
    WamCommand& cdata(const std::string& name, const std::string& value);

    const std::string& name() const { return m_name; }
    WamEndpoint endpoint() const { return m_endpoint; }
    const std::vector<WamParam>& params() const { return m_params; }

    // Value of the first parameter with this name, empty if absent
    std::string param(const std::string& name) const;
    size_t countParams(const std::string& name) const;

    // Raw XML fragment
    std::string toXml() const;

    // Query-string ready form of toXml()
    std::string encode() const;

    // Inverse of encode(); throws ProtocolError on a malformed fragment
    static WamCommand decode(const std::string& encoded,
                             WamEndpoint endpoint = WamEndpoint::UIC);

    // Percent-encode every byte outside [A-Za-z0-9_.~-], then restore
    // "%2F" -> "/" and "%3D" -> "="
    static std::string urlEncode(const std::string& text);
    static std::string urlDecode(const std::string& text);

private:
    std::string m_name;
    WamEndpoint m_endpoint;
    std::vector<WamParam> m_params;
};

#endif // WAM_COMMAND_H
