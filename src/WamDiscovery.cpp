#include "WamDiscovery.h"
#include "WamErrors.h"
#include "WamLog.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

// ============================================================================
// UpnpSsdpSearcher
// ============================================================================

UpnpSsdpSearcher::UpnpSsdpSearcher(const std::string& networkInterface)
    : m_networkInterface(networkInterface)
{
    DEBUG_LOG("[UpnpSsdpSearcher] Created (interface: "
              << (m_networkInterface.empty() ? "auto" : m_networkInterface) << ")");
}

UpnpSsdpSearcher::~UpnpSsdpSearcher() {
    cancel();
}

int UpnpSsdpSearcher::upnpCallbackStatic(Upnp_EventType eventType,
                                         const void* event,
                                         void* cookie)
{
    UpnpSsdpSearcher* searcher = static_cast<UpnpSsdpSearcher*>(cookie);
    return searcher->upnpCallback(eventType, event);
}

int UpnpSsdpSearcher::upnpCallback(Upnp_EventType eventType, const void* event) {
    switch (eventType) {
        case UPNP_DISCOVERY_SEARCH_RESULT:
        case UPNP_DISCOVERY_ADVERTISEMENT_ALIVE: {
            const UpnpDiscovery* discovery = static_cast<const UpnpDiscovery*>(event);
            if (UpnpDiscovery_get_ErrCode(discovery) != UPNP_E_SUCCESS) {
                DEBUG_LOG("[UpnpSsdpSearcher] Discovery error "
                          << UpnpDiscovery_get_ErrCode(discovery));
                break;
            }

            SsdpResult result;
            result.location = UpnpDiscovery_get_Location_cstr(discovery);
            result.deviceType = UpnpDiscovery_get_DeviceType_cstr(discovery);
            result.serviceType = UpnpDiscovery_get_ServiceType_cstr(discovery);
            result.usn = UpnpDiscovery_get_DeviceID_cstr(discovery);

            DEBUG_LOG("[UpnpSsdpSearcher] Reply: " << result.deviceType
                      << " at " << result.location);

            std::lock_guard<std::mutex> lock(m_mutex);
            m_results.push_back(result);
            break;
        }

        case UPNP_DISCOVERY_SEARCH_TIMEOUT: {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_searchDone = true;
            m_cv.notify_all();
            break;
        }

        default:
            // Other events ignored
            break;
    }

    return UPNP_E_SUCCESS;
}

std::vector<SsdpResult> UpnpSsdpSearcher::search(const std::string& target, int windowSeconds) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_results.clear();
        m_searchDone = false;
        m_cancelled = false;
    }

    const char* ifName = m_networkInterface.empty() ? nullptr : m_networkInterface.c_str();
    int ret = UpnpInit2(ifName, 0);
    bool ownsLibrary = true;
    if (ret == UPNP_E_INIT) {
        // Already initialized elsewhere in this process
        ownsLibrary = false;
    } else if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UpnpSsdpSearcher] UpnpInit2 failed: " << ret << std::endl;
        throw TransportError(m_networkInterface.empty() ? "ssdp" : m_networkInterface,
                             std::string("UpnpInit2: ") + UpnpGetErrorMessage(ret));
    }

    DEBUG_LOG("[UpnpSsdpSearcher] libupnp on " << UpnpGetServerIpAddress()
              << ":" << UpnpGetServerPort());

    UpnpClient_Handle handle = -1;
    ret = UpnpRegisterClient(upnpCallbackStatic, this, &handle);
    if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UpnpSsdpSearcher] UpnpRegisterClient failed: " << ret << std::endl;
        if (ownsLibrary) {
            UpnpFinish();
        }
        throw TransportError("ssdp", std::string("UpnpRegisterClient: ") + UpnpGetErrorMessage(ret));
    }

    const int mx = std::max(1, windowSeconds);
    ret = UpnpSearchAsync(handle, mx, target.c_str(), this);
    if (ret != UPNP_E_SUCCESS) {
        std::cerr << "[UpnpSsdpSearcher] UpnpSearchAsync failed: " << ret << std::endl;
        UpnpUnRegisterClient(handle);
        if (ownsLibrary) {
            UpnpFinish();
        }
        throw TransportError("ssdp", std::string("UpnpSearchAsync: ") + UpnpGetErrorMessage(ret));
    }

    std::vector<SsdpResult> results;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        // libupnp reports SEARCH_TIMEOUT after MX seconds, the extra
        // second covers late replies
        m_cv.wait_for(lock, std::chrono::seconds(mx + 1),
                      [this] { return m_searchDone || m_cancelled; });
        results = m_results;
    }

    UpnpUnRegisterClient(handle);
    if (ownsLibrary) {
        UpnpFinish();
    }

    DEBUG_LOG("[UpnpSsdpSearcher] Search window closed, " << results.size() << " replies");
    return results;
}

void UpnpSsdpSearcher::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelled = true;
    m_cv.notify_all();
}

// ============================================================================
// NeighborTableResolver
// ============================================================================

NeighborTableResolver::NeighborTableResolver(const std::string& path)
    : m_path(path)
{
}

std::string NeighborTableResolver::resolveMac(const std::string& ipAddress) {
    std::ifstream table(m_path);
    if (!table.is_open()) {
        std::cerr << "[NeighborTableResolver] Cannot open " << m_path << std::endl;
        return "";
    }
    return lookup(table, ipAddress);
}

// IP address  HW type  Flags  HW address  Mask  Device
std::string NeighborTableResolver::lookup(std::istream& table, const std::string& ipAddress) {
    std::string line;
    std::getline(table, line);  // header

    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string ip, hwType, flags, mac;
        if (!(fields >> ip >> hwType >> flags >> mac)) {
            continue;
        }
        // Flags 0x0 is an incomplete entry
        if (ip == ipAddress && flags != "0x0" && mac != "00:00:00:00:00:00") {
            return mac;
        }
    }
    return "";
}

// ============================================================================
// WamDiscovery
// ============================================================================

namespace {

// Joins every started worker, also when starting a later one throws
class JoinGuard {
public:
    explicit JoinGuard(std::vector<std::thread>& threads) : m_threads(threads) {}
    ~JoinGuard() {
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    JoinGuard(const JoinGuard&) = delete;
    JoinGuard& operator=(const JoinGuard&) = delete;

private:
    std::vector<std::thread>& m_threads;
};

} // namespace

WamDiscovery::WamDiscovery(const Config& config,
                           std::shared_ptr<WamTransport> transport,
                           std::unique_ptr<SsdpSearcher> searcher,
                           std::unique_ptr<AddressResolver> resolver)
    : m_config(config)
    , m_transport(std::move(transport))
    , m_searcher(std::move(searcher))
    , m_resolver(std::move(resolver))
{
    if (!m_transport || !m_searcher || !m_resolver) {
        throw InvalidArgument("discovery needs a transport, an SSDP searcher and an address resolver");
    }
}

bool WamDiscovery::isWamDevice(const SsdpResult& result) {
    return result.deviceType == DEVICE_TYPE
        || result.serviceType == DEVICE_TYPE
        || result.usn.find(DEVICE_TYPE) != std::string::npos;
}

std::string WamDiscovery::hostFromLocation(const std::string& location) {
    size_t scheme = location.find("://");
    if (scheme == std::string::npos) {
        return "";
    }

    size_t start = scheme + 3;
    if (start < location.size() && location[start] == '[') {
        size_t end = location.find(']', start);
        if (end == std::string::npos) {
            return "";
        }
        return location.substr(start + 1, end - start - 1);
    }

    size_t end = location.find_first_of(":/?", start);
    if (end == std::string::npos) {
        end = location.size();
    }
    return location.substr(start, end - start);
}

WamSpeaker WamDiscovery::hydrate(const std::string& host) {
    WamSpeaker speaker(host, m_transport);

    speaker.refresh();

    // The neighbor entry exists once we have talked to the device
    try {
        speaker.setMac(m_resolver->resolveMac(host));
    } catch (const std::exception& e) {
        std::cerr << "[WamDiscovery] ⚠️  MAC lookup failed for " << host << ": " << e.what() << std::endl;
    }

    if (speaker.mac().empty()) {
        DEBUG_LOG("[WamDiscovery] No MAC known for " << host);
    }

    return speaker;
}

std::vector<WamSpeaker> WamDiscovery::discover() {
    m_cancelled = false;

    std::cout << "[WamDiscovery] Searching for WAM speakers ("
              << m_config.searchWindowSeconds << "s)..." << std::endl;

    std::vector<SsdpResult> replies = m_searcher->search(DEVICE_TYPE, m_config.searchWindowSeconds);

    // Keep matching devices, one entry per host, in arrival order
    std::vector<std::string> hosts;
    for (const auto& reply : replies) {
        if (!isWamDevice(reply)) {
            DEBUG_LOG("[WamDiscovery] Ignoring " << reply.deviceType << " at " << reply.location);
            continue;
        }

        std::string host = hostFromLocation(reply.location);
        if (host.empty()) {
            std::cerr << "[WamDiscovery] ⚠️  Unusable LOCATION: " << reply.location << std::endl;
            continue;
        }

        if (std::find(hosts.begin(), hosts.end(), host) == hosts.end()) {
            hosts.push_back(host);
        }
    }

    if (m_cancelled) {
        std::cout << "[WamDiscovery] Cancelled" << std::endl;
        return {};
    }

    // Hydrate every host independently; each thread owns its slot
    std::vector<std::unique_ptr<WamSpeaker>> slots(hosts.size());
    {
        std::vector<std::thread> workers;
        JoinGuard guard(workers);
        workers.reserve(hosts.size());
        for (size_t i = 0; i < hosts.size(); ++i) {
            workers.emplace_back([this, &slots, &hosts, i] {
                try {
                    slots[i] = std::make_unique<WamSpeaker>(hydrate(hosts[i]));
                } catch (const std::exception& e) {
                    std::cerr << "[WamDiscovery] ❌ Hydration of " << hosts[i]
                              << " failed: " << e.what() << std::endl;
                }
            });
        }
    }

    std::vector<WamSpeaker> speakers;
    speakers.reserve(slots.size());
    for (auto& slot : slots) {
        if (!slot) {
            continue;
        }
        WamSpeaker& speaker = *slot;
        if (speaker.state().complete()) {
            std::cout << "[WamDiscovery] ✓ " << speaker.name() << " at " << speaker.address() << std::endl;
        } else {
            std::cout << "[WamDiscovery] ✓ " << speaker.address() << " (partial: "
                      << speaker.state().failedFields.size() << " field(s) unavailable)" << std::endl;
        }
        speakers.push_back(std::move(speaker));
    }

    std::cout << "[WamDiscovery] Found " << speakers.size() << " speaker(s)" << std::endl;
    return speakers;
}

void WamDiscovery::cancel() {
    m_cancelled = true;
    m_searcher->cancel();
}
