/**
 * @file WamSpeaker.cpp
 * @brief Speaker command surface - one UIC/CPM command per operation
 */

#include "WamSpeaker.h"
#include "WamErrors.h"
#include "WamLog.h"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iostream>
#include <utility>

const char* repeatModeName(RepeatMode mode) {
    switch (mode) {
        case RepeatMode::Off: return "off";
        case RepeatMode::One: return "one";
        case RepeatMode::All: return "all";
    }
    return "off";
}

RepeatMode parseRepeatMode(const std::string& mode) {
    if (mode == "off") return RepeatMode::Off;
    if (mode == "one") return RepeatMode::One;
    if (mode == "all") return RepeatMode::All;
    throw InvalidArgument("repeat mode must be 'off', 'one' or 'all', got '" + mode + "'");
}

const char* groupStateName(GroupState state) {
    switch (state) {
        case GroupState::Ungrouped:   return "ungrouped";
        case GroupState::Grouping:    return "grouping";
        case GroupState::GroupedMain: return "main";
        case GroupState::GroupedSub:  return "sub";
    }
    return "ungrouped";
}

// 7-band EQ presets known to the firmware
static const struct {
    const char* name;
    int index;
} kEqPresets[] = {
    {"none",    0},
    {"pop",     1},
    {"jazz",    2},
    {"classic", 3},
    {"custom1", 4},
    {"custom2", 5},
};

static const int kMaxEqPresetIndex = 5;

WamSpeaker::WamSpeaker(const std::string& address, std::shared_ptr<WamTransport> transport,
                       const std::string& mac)
    : m_address(address)
    , m_mac(mac)
    , m_transport(std::move(transport))
{
    if (!m_transport) {
        throw InvalidArgument("speaker " + address + " needs a transport");
    }
}

WamResponse WamSpeaker::execute(const WamCommand& command) {
    DEBUG_LOG("[WamSpeaker] " << m_address << " <- " << endpointName(command.endpoint())
              << " " << command.name());

    std::string body = m_transport->get(m_address, command.endpoint(), command.encode());
    return WamResponse::parse(command.name(), command.endpoint(), body);
}

// ============================================================================
// Refresh
// ============================================================================

SpeakerSnapshot WamSpeaker::refresh() {
    SpeakerSnapshot snapshot = m_state;
    snapshot.failedFields.clear();

    struct Query {
        const char* field;
        const char* command;
        std::function<void(const WamResponse&)> apply;
    };

    const Query queries[] = {
        {"name", "GetSpkName",
            [&](const WamResponse& r) { snapshot.name = r.field("spkname"); }},
        {"led", "GetLed",
            [&](const WamResponse& r) { snapshot.led = r.field("led"); }},
        {"mute", "GetMute",
            [&](const WamResponse& r) { snapshot.mute = r.field("mute"); }},
        {"volume", "GetVolume",
            [&](const WamResponse& r) { snapshot.volume = r.intField("volume"); }},
        {"groupName", "GetGroupName",
            [&](const WamResponse& r) { snapshot.groupName = r.field("groupname"); }},
        {"apSsid", "GetApInfo",
            [&](const WamResponse& r) { snapshot.apSsid = r.field("ssid"); }},
        {"repeat", "GetRepeatMode",
            [&](const WamResponse& r) { snapshot.repeat = parseRepeatMode(r.field("repeat")); }},
    };

    for (const auto& query : queries) {
        try {
            query.apply(execute(WamCommand(query.command)));
        } catch (const std::exception& e) {
            snapshot.failedFields.push_back(query.field);
            std::cerr << "[WamSpeaker] ⚠️  " << m_address << ": " << query.field
                      << " unavailable: " << e.what() << std::endl;
        }
    }

    m_state = snapshot;

    // A group formed by another controller shows up with an unknown role,
    // it is reported as sub until this client groups the speaker itself
    if (m_groupState != GroupState::Grouping) {
        if (m_state.groupName.empty()) {
            m_groupState = GroupState::Ungrouped;
        } else if (m_groupState == GroupState::Ungrouped) {
            m_groupState = GroupState::GroupedSub;
        }
    }

    DEBUG_LOG("[WamSpeaker] " << m_address << " refreshed ("
              << (snapshot.complete() ? "complete" : "partial") << ")");
    return snapshot;
}

// ============================================================================
// Volume / mute / LED
// ============================================================================

void WamSpeaker::setVolume(int level) {
    if (level < MIN_VOLUME) {
        throw InvalidArgument("volume must be >= 0, got " + std::to_string(level));
    }
    level = std::min(level, MAX_VOLUME);

    execute(WamCommand("SetVolume").dec("volume", level));
    m_state.volume = level;
}

int WamSpeaker::getVolume() {
    m_state.volume = execute(WamCommand("GetVolume")).intField("volume");
    return m_state.volume;
}

void WamSpeaker::requireOnOff(const std::string& what, const std::string& choice) {
    if (choice != "on" && choice != "off") {
        throw InvalidArgument(what + " must be 'on' or 'off', got '" + choice + "'");
    }
}

void WamSpeaker::setMute(const std::string& choice) {
    requireOnOff("mute", choice);
    execute(WamCommand("SetMute").str("mute", choice));
    m_state.mute = choice;
}

std::string WamSpeaker::getMute() {
    m_state.mute = execute(WamCommand("GetMute")).field("mute");
    return m_state.mute;
}

void WamSpeaker::setLed(const std::string& choice) {
    requireOnOff("led", choice);
    execute(WamCommand("SetLed").str("option", choice));
    m_state.led = choice;
}

std::string WamSpeaker::getLed() {
    m_state.led = execute(WamCommand("GetLed")).field("led");
    return m_state.led;
}

// ============================================================================
// Playback
// ============================================================================

void WamSpeaker::playbackControl(const std::string& action) {
    execute(WamCommand("SetPlaybackControl").str("playbackcontrol", action));
}

void WamSpeaker::play() { playbackControl("play"); }
void WamSpeaker::pause() { playbackControl("pause"); }
void WamSpeaker::resume() { playbackControl("resume"); }
void WamSpeaker::nextTrack() { playbackControl("next"); }
void WamSpeaker::previousTrack() { playbackControl("previous"); }

void WamSpeaker::playFromUrl(const std::string& url, bool resume) {
    if (url.empty()) {
        throw InvalidArgument("playback URL is empty");
    }

    execute(WamCommand("SetUrlPlayback")
                .cdata("url", url)
                .dec("buffersize", 0)
                .dec("seektime", 0)
                .dec("resume", resume ? 1 : 0));
}

int WamSpeaker::getCurrentPlayTime() {
    return execute(WamCommand("GetCurrentPlayTime")).intField("playtime");
}

void WamSpeaker::setSearchTime(int seconds) {
    if (seconds < 0) {
        throw InvalidArgument("seek position must be >= 0, got " + std::to_string(seconds));
    }
    execute(WamCommand("SetSearchTime").dec("playtime", seconds));
}

MusicInfo WamSpeaker::getMusicInfo() {
    WamResponse r = execute(WamCommand("GetMusicInfo"));

    MusicInfo info;
    info.title = r.optionalField("title");
    info.artist = r.optionalField("artist");
    info.album = r.optionalField("album");
    return info;
}

void WamSpeaker::setRepeatMode(RepeatMode mode) {
    execute(WamCommand("SetRepeatMode").str("repeatmode", repeatModeName(mode)));
    m_state.repeat = mode;
}

void WamSpeaker::setRepeatMode(const std::string& mode) {
    setRepeatMode(parseRepeatMode(mode));
}

RepeatMode WamSpeaker::getRepeatMode() {
    m_state.repeat = parseRepeatMode(execute(WamCommand("GetRepeatMode")).field("repeat"));
    return m_state.repeat;
}

void WamSpeaker::setShuffle(bool enabled) {
    execute(WamCommand("SetShuffleMode").str("shufflemode", enabled ? "on" : "off"));
}

// ============================================================================
// Equalizer
// ============================================================================

int WamSpeaker::eqPresetIndex(const std::string& presetName) {
    std::string key;
    for (char c : presetName) {
        if (c != ' ') {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    for (const auto& preset : kEqPresets) {
        if (key == preset.name) {
            return preset.index;
        }
    }
    throw InvalidArgument("unknown EQ preset '" + presetName + "'");
}

void WamSpeaker::requirePresetIndex(int presetIndex) {
    if (presetIndex < 0 || presetIndex > kMaxEqPresetIndex) {
        throw InvalidArgument("EQ preset index must be 0-" + std::to_string(kMaxEqPresetIndex) +
                              ", got " + std::to_string(presetIndex));
    }
}

void WamSpeaker::set7BandPreset(const std::string& presetName) {
    set7BandPreset(eqPresetIndex(presetName));
}

void WamSpeaker::set7BandPreset(int presetIndex) {
    requirePresetIndex(presetIndex);
    execute(WamCommand("Set7bandEQMode").dec("presetindex", presetIndex));
}

void WamSpeaker::set7BandValues(int presetIndex, const std::vector<int>& values) {
    requirePresetIndex(presetIndex);
    if (values.size() != static_cast<size_t>(EQ_BANDS)) {
        throw InvalidArgument("exactly 7 EQ band values are required, got " +
                              std::to_string(values.size()));
    }
    for (int value : values) {
        if (value < MIN_EQ_VALUE || value > MAX_EQ_VALUE) {
            throw InvalidArgument("EQ band value out of range [-10, 10]: " + std::to_string(value));
        }
    }

    WamCommand command("Set7bandEQValue");
    command.dec("presetindex", presetIndex);
    for (size_t i = 0; i < values.size(); ++i) {
        command.dec("eqvalue" + std::to_string(i + 1), values[i]);
    }
    execute(command);
}

std::vector<EqPreset> WamSpeaker::get7BandEqList() {
    WamResponse r = execute(WamCommand("Get7BandEQList"));

    std::vector<std::string> indices = r.fields("presetindex");
    std::vector<std::string> names = r.fields("presetname");
    if (indices.size() != names.size()) {
        throw ProtocolError(r.command(), "preset index/name count mismatch", r.raw());
    }

    std::vector<EqPreset> presets;
    for (size_t i = 0; i < indices.size(); ++i) {
        try {
            presets.push_back({std::stoi(indices[i]), names[i]});
        } catch (const std::exception&) {
            throw ProtocolError(r.command(), "bad preset index '" + indices[i] + "'", r.raw());
        }
    }
    return presets;
}

void WamSpeaker::addCustomEqMode(int presetIndex, const std::string& presetName) {
    requirePresetIndex(presetIndex);
    if (presetName.empty()) {
        throw InvalidArgument("custom EQ preset name is empty");
    }
    execute(WamCommand("AddCustomEQMode")
                .dec("presetindex", presetIndex)
                .str("presetname", presetName));
}

void WamSpeaker::removeCustomEqMode(int presetIndex) {
    requirePresetIndex(presetIndex);
    execute(WamCommand("DelCustomEQMode").dec("presetindex", presetIndex));
}

std::string WamSpeaker::getEqMode() {
    return execute(WamCommand("GetEQMode")).field("eqmode");
}

void WamSpeaker::setEqMode(const std::string& mode) {
    if (mode.empty()) {
        throw InvalidArgument("EQ mode is empty");
    }
    execute(WamCommand("SetEQMode").str("eqmode", mode));
}

// ============================================================================
// Naming / info
// ============================================================================

void WamSpeaker::setName(const std::string& name) {
    if (name.empty()) {
        throw InvalidArgument("speaker name is empty");
    }
    execute(WamCommand("SetSpkName").cdata("spkname", name));
    m_state.name = name;
}

std::string WamSpeaker::getName() {
    m_state.name = execute(WamCommand("GetSpkName")).field("spkname");
    return m_state.name;
}

std::string WamSpeaker::getGroupName() {
    m_state.groupName = execute(WamCommand("GetGroupName")).field("groupname");
    return m_state.groupName;
}

std::string WamSpeaker::getApSsid() {
    m_state.apSsid = execute(WamCommand("GetApInfo")).field("ssid");
    return m_state.apSsid;
}

std::string WamSpeaker::getContentProvider() {
    return execute(WamCommand("GetCpInfo", WamEndpoint::CPM)).field("cpname");
}

// ============================================================================
// Grouping
// ============================================================================

void WamSpeaker::ungroup() {
    execute(WamCommand("SetUngroup"));
    markUngrouped();
}

void WamSpeaker::markGrouping() {
    m_groupState = GroupState::Grouping;
}

void WamSpeaker::markGrouped(const std::string& groupName, GroupState role) {
    m_state.groupName = groupName;
    m_groupState = role;
}

void WamSpeaker::markUngrouped() {
    m_state.groupName.clear();
    m_groupState = GroupState::Ungrouped;
}
