/**
 * @file WamErrors.h
 * @brief Error taxonomy for the WAM speaker protocol
 *
 * - TransportError : network level (unreachable, timeout, refused)
 * - ProtocolError  : malformed/unexpected reply, device reported "ng"
 * - InvalidArgument: rejected client-side, nothing was sent
 * - GroupingError  : one step of the grouping sequence failed
 */

#ifndef WAM_ERRORS_H
#define WAM_ERRORS_H

#include <stdexcept>
#include <string>

class WamError : public std::runtime_error {
public:
    explicit WamError(const std::string& what) : std::runtime_error(what) {}
};

class TransportError : public WamError {
public:
    TransportError(const std::string& host, const std::string& cause)
        : WamError("transport error (" + host + "): " + cause)
        , m_host(host)
        , m_cause(cause) {}

    const std::string& host() const { return m_host; }
    const std::string& cause() const { return m_cause; }

private:
    std::string m_host;
    std::string m_cause;
};

class ProtocolError : public WamError {
public:
    ProtocolError(const std::string& command, const std::string& reason,
                  const std::string& rawResponse)
        : WamError("protocol error in " + command + ": " + reason)
        , m_command(command)
        , m_rawResponse(rawResponse) {}

    const std::string& command() const { return m_command; }
    const std::string& rawResponse() const { return m_rawResponse; }

private:
    std::string m_command;
    std::string m_rawResponse;
};

class InvalidArgument : public WamError {
public:
    explicit InvalidArgument(const std::string& what) : WamError(what) {}
};

class GroupingError : public WamError {
public:
    enum class Step { Ungroup, GroupCommand };

    GroupingError(Step step, size_t stepIndex, const std::string& speakerAddress,
                  const std::string& cause)
        : WamError(std::string(step == Step::Ungroup ? "ungroup" : "group command")
                   + " failed at step " + std::to_string(stepIndex)
                   + " (" + speakerAddress + "): " + cause)
        , m_step(step)
        , m_stepIndex(stepIndex)
        , m_speakerAddress(speakerAddress) {}

    Step step() const { return m_step; }
    size_t stepIndex() const { return m_stepIndex; }
    const std::string& speakerAddress() const { return m_speakerAddress; }

private:
    Step m_step;
    size_t m_stepIndex;
    std::string m_speakerAddress;
};

#endif // WAM_ERRORS_H
