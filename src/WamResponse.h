/**
 * @file WamResponse.h
 * @brief Parsed reply of a UIC/CPM command
 *
 * Replies look like
 *   <UIC><method>VolumeLevel</method>...<response result="ok"><volume>15</volume></response></UIC>
 * Fields are flattened from the <response> subtree in document order.
 */

#ifndef WAM_RESPONSE_H
#define WAM_RESPONSE_H

#include "WamCommand.h"

#include <string>
#include <utility>
#include <vector>

class WamResponse {
public:
    // Throws ProtocolError on an empty body, malformed XML, a root that does
    // not match the endpoint, a missing <response> or result != "ok"
    static WamResponse parse(const std::string& command, WamEndpoint endpoint,
                             const std::string& body);

    const std::string& command() const { return m_command; }
    const std::string& method() const { return m_method; }
    const std::string& raw() const { return m_raw; }

    bool has(const std::string& field) const;

    // Throw ProtocolError when the field is missing (or not an integer)
    std::string field(const std::string& name) const;
    int intField(const std::string& name) const;

    // Empty string when missing
    std::string optionalField(const std::string& name) const;

    // Every occurrence, for list replies
    std::vector<std::string> fields(const std::string& name) const;

private:
    WamResponse() = default;

    std::string m_command;
    std::string m_method;
    std::string m_raw;
    std::vector<std::pair<std::string, std::string>> m_fields;
};

#endif // WAM_RESPONSE_H
