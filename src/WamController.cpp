/**
 * @file WamController.cpp
 * @brief Speaker registry, lookup and group requests for the front end
 */

#include "WamController.h"
#include "WamErrors.h"
#include "WamLog.h"

#include <algorithm>
#include <cctype>
#include <iostream>

// ============================================================================
// WamController::Config
// ============================================================================

WamController::Config::Config()
    : searchWindowSeconds(5)
    , httpTimeoutSeconds(5)
{
}

static std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ============================================================================
// WamController
// ============================================================================

WamController::WamController(const Config& config) {
    WamHttpTransport::Config transportConfig;
    transportConfig.timeoutSeconds = config.httpTimeoutSeconds;
    m_transport = std::make_shared<WamHttpTransport>(transportConfig);

    WamDiscovery::Config discoveryConfig;
    discoveryConfig.networkInterface = config.networkInterface;
    discoveryConfig.searchWindowSeconds = config.searchWindowSeconds;
    m_discovery = std::make_unique<WamDiscovery>(
        discoveryConfig,
        m_transport,
        std::make_unique<UpnpSsdpSearcher>(config.networkInterface),
        std::make_unique<NeighborTableResolver>());

    DEBUG_LOG("[WamController] Created");
}

WamController::WamController(std::shared_ptr<WamTransport> transport,
                             std::unique_ptr<WamDiscovery> discovery)
    : m_transport(std::move(transport))
    , m_discovery(std::move(discovery))
{
    if (!m_transport) {
        throw InvalidArgument("controller needs a transport");
    }
    DEBUG_LOG("[WamController] Created");
}

WamController::~WamController() {
    DEBUG_LOG("[WamController] Destroyed");
}

size_t WamController::discover() {
    if (!m_discovery) {
        throw InvalidArgument("controller was built without discovery");
    }

    std::vector<WamSpeaker> found = m_discovery->discover();

    m_coordinator.forgetGroups();
    m_speakers.clear();
    for (auto& speaker : found) {
        m_speakers.push_back(std::make_unique<WamSpeaker>(std::move(speaker)));
    }
    return m_speakers.size();
}

void WamController::cancelDiscovery() {
    if (m_discovery) {
        m_discovery->cancel();
    }
}

WamSpeaker& WamController::addSpeaker(const std::string& address, const std::string& mac) {
    if (WamSpeaker* existing = findByAddress(address)) {
        existing->refresh();
        return *existing;
    }

    auto speaker = std::make_unique<WamSpeaker>(address, m_transport, mac);
    speaker->refresh();
    m_speakers.push_back(std::move(speaker));
    return *m_speakers.back();
}

WamSpeaker* WamController::findByName(const std::string& name) const {
    const std::string wanted = toLower(name);
    for (const auto& speaker : m_speakers) {
        if (!speaker->name().empty() && toLower(speaker->name()) == wanted) {
            return speaker.get();
        }
    }
    return nullptr;
}

WamSpeaker* WamController::findByAddress(const std::string& address) const {
    for (const auto& speaker : m_speakers) {
        if (speaker->address() == address) {
            return speaker.get();
        }
    }
    return nullptr;
}

WamSpeaker* WamController::findSpeaker(const std::string& nameOrAddress) const {
    WamSpeaker* speaker = findByName(nameOrAddress);
    return speaker ? speaker : findByAddress(nameOrAddress);
}

GroupResult WamController::createGroup(const std::string& groupName,
                                       const std::vector<std::string>& speakerNames) {
    std::vector<WamSpeaker*> members;
    for (const auto& name : speakerNames) {
        WamSpeaker* speaker = findSpeaker(name);
        if (!speaker) {
            throw InvalidArgument("speaker '" + name + "' not found");
        }
        members.push_back(speaker);
    }

    if (members.size() < 2) {
        throw InvalidArgument("need at least 2 speakers to create a group");
    }

    return m_coordinator.createGroup(groupName, members);
}

std::vector<std::string> WamController::ungroupAll() {
    std::vector<std::string> failures;

    for (const auto& speaker : m_speakers) {
        if (speaker->groupName().empty()) {
            continue;
        }

        const std::string previousGroup = speaker->groupName();
        try {
            m_coordinator.dissolveGroup(*speaker);
            std::cout << "[WamController] Removed " << speaker->address()
                      << " from group '" << previousGroup << "'" << std::endl;
        } catch (const WamError& e) {
            std::cerr << "[WamController] ⚠️  " << speaker->address() << ": " << e.what() << std::endl;
            failures.push_back(speaker->address() + ": " + e.what());
        }
    }
    return failures;
}
