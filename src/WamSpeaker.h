/**
 * @file WamSpeaker.h
 * @brief One Samsung WAM speaker and every control operation it exposes
 *
 * Cached fields mirror the device and are only a snapshot: the device is
 * authoritative and refresh() re-reads them.
 */

#ifndef WAM_SPEAKER_H
#define WAM_SPEAKER_H

#include "WamCommand.h"
#include "WamResponse.h"
#include "WamTransport.h"

#include <memory>
#include <string>
#include <vector>

enum class RepeatMode { Off, One, All };

const char* repeatModeName(RepeatMode mode);
RepeatMode parseRepeatMode(const std::string& mode);   // throws InvalidArgument

enum class GroupState {
    Ungrouped,
    Grouping,       // a grouping sequence is in flight
    GroupedMain,
    GroupedSub
};

const char* groupStateName(GroupState state);

/**
 * @brief Result of refresh(): the fixed set of mirrored attributes
 *
 * Fields whose query failed keep their previous value and are listed in
 * failedFields.
 */
struct SpeakerSnapshot {
    std::string name;
    std::string led = "off";
    std::string mute = "off";
    int volume = 0;
    std::string groupName;
    std::string apSsid;
    RepeatMode repeat = RepeatMode::Off;

    std::vector<std::string> failedFields;

    bool complete() const { return failedFields.empty(); }
};

struct EqPreset {
    int index;
    std::string name;
};

struct MusicInfo {
    std::string title;
    std::string artist;
    std::string album;
};

class WamSpeaker {
public:
    static constexpr int MIN_VOLUME = 0;
    static constexpr int MAX_VOLUME = 30;
    static constexpr int EQ_BANDS = 7;
    static constexpr int MIN_EQ_VALUE = -10;
    static constexpr int MAX_EQ_VALUE = 10;

    WamSpeaker(const std::string& address, std::shared_ptr<WamTransport> transport,
               const std::string& mac = "");

    const std::string& address() const { return m_address; }
    const std::string& mac() const { return m_mac; }
    void setMac(const std::string& mac) { m_mac = mac; }

    // Cached state
    const SpeakerSnapshot& state() const { return m_state; }
    const std::string& name() const { return m_state.name; }
    const std::string& groupName() const { return m_state.groupName; }
    GroupState groupState() const { return m_groupState; }

    // Re-query name, LED, mute, volume, group name, AP SSID and repeat
    // mode. Individual failures are recorded, never thrown.
    SpeakerSnapshot refresh();

    // Encode, send and parse one command
    WamResponse execute(const WamCommand& command);

    // Volume: level < 0 is rejected, level > 30 is clamped
    void setVolume(int level);
    int getVolume();

    // "on" / "off" only, checked before anything is sent
    void setMute(const std::string& choice);
    std::string getMute();
    void setLed(const std::string& choice);
    std::string getLed();

    // Playback
    void play();
    void pause();
    void resume();
    void nextTrack();
    void previousTrack();
    void playFromUrl(const std::string& url, bool resume = true);
    int getCurrentPlayTime();
    void setSearchTime(int seconds);
    MusicInfo getMusicInfo();

    void setRepeatMode(RepeatMode mode);
    void setRepeatMode(const std::string& mode);
    void repeatOne() { setRepeatMode(RepeatMode::One); }
    void repeatAll() { setRepeatMode(RepeatMode::All); }
    void repeatOff() { setRepeatMode(RepeatMode::Off); }
    RepeatMode getRepeatMode();
    void setShuffle(bool enabled);

    // Equalizer
    static int eqPresetIndex(const std::string& presetName);   // throws InvalidArgument
    void set7BandPreset(const std::string& presetName);
    void set7BandPreset(int presetIndex);
    void set7BandValues(int presetIndex, const std::vector<int>& values);
    std::vector<EqPreset> get7BandEqList();
    void addCustomEqMode(int presetIndex, const std::string& presetName);
    void removeCustomEqMode(int presetIndex);
    std::string getEqMode();
    void setEqMode(const std::string& mode);

    // Naming and device info
    void setName(const std::string& name);
    std::string getName();
    std::string getGroupName();
    std::string getApSsid();
    std::string getContentProvider();

    // Leave whatever group the device is in
    void ungroup();

    // Local group bookkeeping, driven by GroupCoordinator
    void markGrouping();
    void markGrouped(const std::string& groupName, GroupState role);
    void markUngrouped();

private:
    void playbackControl(const std::string& action);
    static void requireOnOff(const std::string& what, const std::string& choice);
    static void requirePresetIndex(int presetIndex);

    std::string m_address;
    std::string m_mac;
    std::shared_ptr<WamTransport> m_transport;

    SpeakerSnapshot m_state;
    GroupState m_groupState = GroupState::Ungrouped;
};

#endif // WAM_SPEAKER_H
