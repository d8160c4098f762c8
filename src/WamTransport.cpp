#include "WamTransport.h"
#include "WamErrors.h"
#include "WamLog.h"

#include <upnp/upnp.h>
#include <sstream>

std::string buildCommandUrl(const std::string& host, uint16_t port,
                            WamEndpoint endpoint, const std::string& encodedCmd) {
    std::stringstream ss;
    ss << "http://";
    if (host.find(':') != std::string::npos) {
        ss << "[" << host << "]";   // IPv6 literal
    } else {
        ss << host;
    }
    ss << ":" << port << "/" << endpointName(endpoint)
       << "?cmd=" << encodedCmd;
    return ss.str();
}

namespace {

// Closes a libupnp HTTP GET handle on scope exit
class HttpGetHandle {
public:
    HttpGetHandle() = default;
    ~HttpGetHandle() {
        if (m_handle) {
            UpnpCloseHttpGet(m_handle);
        }
    }

    HttpGetHandle(const HttpGetHandle&) = delete;
    HttpGetHandle& operator=(const HttpGetHandle&) = delete;

    void** out() { return &m_handle; }
    void* get() const { return m_handle; }

private:
    void* m_handle = nullptr;
};

std::string upnpError(int code) {
    const char* message = UpnpGetErrorMessage(code);
    std::stringstream ss;
    ss << (message ? message : "unknown error") << " (" << code << ")";
    return ss.str();
}

} // namespace

WamHttpTransport::WamHttpTransport(const Config& config)
    : m_config(config)
{
    DEBUG_LOG("[WamHttpTransport] Created (port " << m_config.port
              << ", timeout " << m_config.timeoutSeconds << "s)");
}

std::mutex& WamHttpTransport::hostMutex(const std::string& host) {
    std::lock_guard<std::mutex> lock(m_hostsMutex);
    auto& slot = m_hostMutexes[host];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::string WamHttpTransport::get(const std::string& host, WamEndpoint endpoint,
                                  const std::string& encodedCmd) {
    const std::string url = buildCommandUrl(host, m_config.port, endpoint, encodedCmd);

    std::lock_guard<std::mutex> hostLock(hostMutex(host));

    DEBUG_LOG("[WamHttpTransport] GET " << url);

    HttpGetHandle handle;
    char* contentType = nullptr;
    int contentLength = 0;
    int httpStatus = 0;

    int ret = UpnpOpenHttpGet(url.c_str(), handle.out(), &contentType,
                              &contentLength, &httpStatus, m_config.timeoutSeconds);
    if (ret != UPNP_E_SUCCESS) {
        throw TransportError(host, upnpError(ret));
    }

    if (httpStatus < 200 || httpStatus >= 300) {
        throw TransportError(host, "HTTP status " + std::to_string(httpStatus));
    }

    std::string body;
    char buffer[4096];
    while (true) {
        size_t size = sizeof(buffer);
        ret = UpnpReadHttpGet(handle.get(), buffer, &size, m_config.timeoutSeconds);
        if (ret != UPNP_E_SUCCESS) {
            throw TransportError(host, upnpError(ret));
        }
        if (size == 0) {
            break;
        }
        body.append(buffer, size);

        if (contentLength >= 0 && body.size() >= static_cast<size_t>(contentLength)) {
            break;
        }
    }

    DEBUG_LOG("[WamHttpTransport] " << host << " replied " << body.size() << " bytes");
    return body;
}
