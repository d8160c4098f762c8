#pragma once

#include "GroupCoordinator.h"
#include "WamDiscovery.h"
#include "WamSpeaker.h"
#include "WamTransport.h"

#include <memory>
#include <string>
#include <vector>

/**
 * @brief Owns the known speakers and routes front-end requests to them
 *
 * Speakers live as long as the controller or until the next discover(),
 * which replaces the list and forgets groups recorded by the coordinator.
 */
class WamController {
public:
    struct Config {
        std::string networkInterface;   // Empty = let libupnp choose
        int searchWindowSeconds;
        int httpTimeoutSeconds;

        Config();
    };

    explicit WamController(const Config& config);

    // Injected collaborators (tests, embedding)
    WamController(std::shared_ptr<WamTransport> transport,
                  std::unique_ptr<WamDiscovery> discovery);

    ~WamController();

    WamController(const WamController&) = delete;
    WamController& operator=(const WamController&) = delete;

    // Replaces the speaker list with what SSDP finds
    size_t discover();
    void cancelDiscovery();

    // Manually known address; refreshed before it is returned
    WamSpeaker& addSpeaker(const std::string& address, const std::string& mac = "");

    const std::vector<std::unique_ptr<WamSpeaker>>& speakers() const { return m_speakers; }

    WamSpeaker* findByName(const std::string& name) const;      // case-insensitive
    WamSpeaker* findByAddress(const std::string& address) const;
    WamSpeaker* findSpeaker(const std::string& nameOrAddress) const;

    // First name is the main speaker. Needs at least two known speakers;
    // unknown names throw InvalidArgument.
    GroupResult createGroup(const std::string& groupName,
                            const std::vector<std::string>& speakerNames);

    // Ungroup every speaker that believes it is grouped. Failures are
    // collected, the remaining speakers are still attempted.
    std::vector<std::string> ungroupAll();

    GroupCoordinator& coordinator() { return m_coordinator; }

private:
    std::shared_ptr<WamTransport> m_transport;
    std::unique_ptr<WamDiscovery> m_discovery;
    GroupCoordinator m_coordinator;

    std::vector<std::unique_ptr<WamSpeaker>> m_speakers;
};
