/**
 * @file WamTransport.h
 * @brief HTTP GET transport to a speaker's control endpoint
 *
 * http://{host}:55001/{UIC|CPM}?cmd={encoded}
 * Transports return the raw body and never look at its content.
 */

#ifndef WAM_TRANSPORT_H
#define WAM_TRANSPORT_H

#include "WamCommand.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class WamTransport {
public:
    virtual ~WamTransport() = default;

    // Returns the body of a 2xx reply, throws TransportError otherwise
    virtual std::string get(const std::string& host, WamEndpoint endpoint,
                            const std::string& encodedCmd) = 0;
};

std::string buildCommandUrl(const std::string& host, uint16_t port,
                            WamEndpoint endpoint, const std::string& encodedCmd);

/**
 * @brief libupnp HTTP client transport
 *
 * Every read is bounded by timeoutSeconds. Requests to the same host are
 * serialized; different hosts proceed in parallel.
 */
class WamHttpTransport : public WamTransport {
public:
    struct Config {
        uint16_t port;
        int timeoutSeconds;

        Config()
            : port(55001)
            , timeoutSeconds(5)
        {}
    };

    explicit WamHttpTransport(const Config& config = Config());

    WamHttpTransport(const WamHttpTransport&) = delete;
    WamHttpTransport& operator=(const WamHttpTransport&) = delete;

    std::string get(const std::string& host, WamEndpoint endpoint,
                    const std::string& encodedCmd) override;

private:
    std::mutex& hostMutex(const std::string& host);

    Config m_config;

    std::mutex m_hostsMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_hostMutexes;
};

#endif // WAM_TRANSPORT_H
