/**
 * @file WamDiscovery.h
 * @brief SSDP discovery of WAM speakers and initial state hydration
 *
 * Flow:
 *   1. SSDP M-SEARCH for urn:samsung.com:device:RemoteControlReceiver:1
 *      on the configured interface, bounded by the search window
 *   2. Keep matching devices, take the control host from LOCATION
 *   3. Hydrate every host in its own thread (refresh() + MAC lookup)
 *
 * Result order follows SSDP arrival order and is not stable.
 */

#ifndef WAM_DISCOVERY_H
#define WAM_DISCOVERY_H

#include "WamSpeaker.h"
#include "WamTransport.h"

#include <upnp/upnp.h>

#include <atomic>
#include <condition_variable>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct SsdpResult {
    std::string location;       // description URL
    std::string deviceType;     // NT / ST
    std::string serviceType;
    std::string usn;
};

class SsdpSearcher {
public:
    virtual ~SsdpSearcher() = default;

    // Blocks at most windowSeconds (plus libupnp slack) or until cancel()
    virtual std::vector<SsdpResult> search(const std::string& target, int windowSeconds) = 0;
    virtual void cancel() = 0;
};

/**
 * @brief SSDP control point on top of libupnp
 *
 * Owns the libupnp stack for the duration of one search unless the
 * process already initialized it.
 */
class UpnpSsdpSearcher : public SsdpSearcher {
public:
    // Empty interface lets libupnp pick the first usable one
    explicit UpnpSsdpSearcher(const std::string& networkInterface);
    ~UpnpSsdpSearcher() override;

    UpnpSsdpSearcher(const UpnpSsdpSearcher&) = delete;
    UpnpSsdpSearcher& operator=(const UpnpSsdpSearcher&) = delete;

    std::vector<SsdpResult> search(const std::string& target, int windowSeconds) override;
    void cancel() override;

private:
    static int upnpCallbackStatic(Upnp_EventType eventType, const void* event, void* cookie);
    int upnpCallback(Upnp_EventType eventType, const void* event);

    std::string m_networkInterface;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<SsdpResult> m_results;
    bool m_searchDone = false;
    bool m_cancelled = false;
};

/**
 * @brief Maps an IPv4 address to its link-layer (MAC) address
 *
 * Returns an empty string when the address is unknown.
 */
class AddressResolver {
public:
    virtual ~AddressResolver() = default;
    virtual std::string resolveMac(const std::string& ipAddress) = 0;
};

// Kernel neighbor table (/proc/net/arp)
class NeighborTableResolver : public AddressResolver {
public:
    explicit NeighborTableResolver(const std::string& path = "/proc/net/arp");

    std::string resolveMac(const std::string& ipAddress) override;

    // Parse an ARP table listing, exposed for tests
    static std::string lookup(std::istream& table, const std::string& ipAddress);

private:
    std::string m_path;
};

class WamDiscovery {
public:
    static constexpr const char* DEVICE_TYPE = "urn:samsung.com:device:RemoteControlReceiver:1";

    struct Config {
        std::string networkInterface;   // used by the default searcher
        int searchWindowSeconds;

        Config()
            : searchWindowSeconds(5)
        {}
    };

    WamDiscovery(const Config& config,
                 std::shared_ptr<WamTransport> transport,
                 std::unique_ptr<SsdpSearcher> searcher,
                 std::unique_ptr<AddressResolver> resolver);

    // Every matching device is returned. Fields that could not be read
    // keep defaults and are listed in state().failedFields.
    std::vector<WamSpeaker> discover();

    // Stops a running search; hydration is skipped afterwards
    void cancel();

    static bool isWamDevice(const SsdpResult& result);
    static std::string hostFromLocation(const std::string& location);

private:
    WamSpeaker hydrate(const std::string& host);

    Config m_config;
    std::shared_ptr<WamTransport> m_transport;
    std::unique_ptr<SsdpSearcher> m_searcher;
    std::unique_ptr<AddressResolver> m_resolver;

    std::atomic<bool> m_cancelled{false};
};

#endif // WAM_DISCOVERY_H
