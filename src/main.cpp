/**
 * @file main.cpp
 * @brief wamctl - command line front end for Samsung WAM speakers
 */

#include "SignalWatcher.h"
#include "WamController.h"
#include "WamErrors.h"
#include "WamLog.h"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Version information
#define WAMCTL_VERSION "1.0.0"
#define WAMCTL_BUILD_DATE __DATE__
#define WAMCTL_BUILD_TIME __TIME__

// Global controller instance for the signal watcher
std::unique_ptr<WamController> g_controller;

// Ctrl+C during a search closes the window early, otherwise it exits
SignalWatcher g_signals([] {
    if (g_controller) {
        g_controller->cancelDiscovery();
    }
});

struct CliOptions {
    WamController::Config controller;
    std::vector<std::string> hosts;     // --host: skip discovery
    std::vector<std::string> args;      // subcommand and its arguments
};

static void printUsage(const char* argv0) {
    std::cout << "wamctl - Samsung Wireless Audio Multiroom controller\n\n"
              << "Usage: " << argv0 << " [options] <command> [arguments]\n\n"
              << "Commands:\n"
              << "  discover                          Search the network for speakers\n"
              << "  list                              Discover and show every speaker\n"
              << "  info <spk>                        Show full state of a speaker\n"
              << "  volume <spk> [0-30]               Get or set volume\n"
              << "  mute <spk> [on|off]               Get or set mute\n"
              << "  led <spk> [on|off]                Get or set the LED\n"
              << "  repeat <spk> [off|one|all]        Get or set repeat mode\n"
              << "  shuffle <spk> on|off              Set shuffle mode\n"
              << "  playback <spk> play|pause|resume|next|prev\n"
              << "  url <spk> <url> [--no-resume]     Play a stream URL\n"
              << "  eq <spk> <preset|index>           Select a 7-band EQ preset\n"
              << "  name <spk> <new name>             Rename a speaker\n"
              << "  group create --name <N> --speakers <A> <B> ...\n"
              << "  group ungroup [spk]               Ungroup one speaker, or all\n"
              << "\n"
              << "<spk> is a speaker name or IP address.\n"
              << "\n"
              << "Options:\n"
              << "  --interface <name>     Network interface for discovery (e.g., eth0)\n"
              << "  --timeout <secs>       Discovery search window (default: 5)\n"
              << "  --http-timeout <secs>  Per-command timeout (default: 5)\n"
              << "  --host <ip>            Use this speaker instead of discovering (repeatable)\n"
              << "  --verbose, -v          Enable verbose debug output\n"
              << "  --version, -V          Show version information\n"
              << "  --help, -h             Show this help\n"
              << std::endl;
}

// Parse command line arguments
static CliOptions parseArguments(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--interface" && i + 1 < argc) {
            options.controller.networkInterface = argv[++i];
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            options.controller.searchWindowSeconds = std::atoi(argv[++i]);
            if (options.controller.searchWindowSeconds < 1) {
                std::cerr << "⚠️  Warning: search window < 1 second, using 1" << std::endl;
                options.controller.searchWindowSeconds = 1;
            }
        }
        else if (arg == "--http-timeout" && i + 1 < argc) {
            options.controller.httpTimeoutSeconds = std::atoi(argv[++i]);
            if (options.controller.httpTimeoutSeconds < 1) {
                std::cerr << "⚠️  Warning: HTTP timeout < 1 second, using 1" << std::endl;
                options.controller.httpTimeoutSeconds = 1;
            }
        }
        else if (arg == "--host" && i + 1 < argc) {
            options.hosts.push_back(argv[++i]);
        }
        else if (arg == "--verbose" || arg == "-v") {
            g_verbose = true;
        }
        else if (arg == "--version" || arg == "-V") {
            std::cout << "wamctl " << WAMCTL_VERSION << std::endl;
            std::cout << "Build: " << WAMCTL_BUILD_DATE << " " << WAMCTL_BUILD_TIME << std::endl;
            exit(0);
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            exit(0);
        }
        else {
            options.args.push_back(arg);
        }
    }

    return options;
}

static bool looksLikeAddress(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == ':')) {
            return false;
        }
    }
    return true;
}

static bool isNumber(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return s.size() < 10;
}

static int parseNumber(const std::string& s, const std::string& what) {
    if (!isNumber(s)) {
        throw InvalidArgument(what + " must be a number, got '" + s + "'");
    }
    return std::stoi(s);
}

// Populate the controller once, from --host or from SSDP
static void loadSpeakers(WamController& controller, const CliOptions& options) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    if (options.hosts.empty()) {
        SignalWatcher::SearchScope scope(g_signals);
        controller.discover();
        return;
    }
    for (const auto& host : options.hosts) {
        controller.addSpeaker(host);
    }
}

static WamSpeaker& resolveSpeaker(WamController& controller, const CliOptions& options,
                                  const std::string& id) {
    // A literal address needs no discovery
    if (looksLikeAddress(id)) {
        return controller.addSpeaker(id);
    }

    loadSpeakers(controller, options);
    WamSpeaker* speaker = controller.findSpeaker(id);
    if (!speaker) {
        throw InvalidArgument("speaker '" + id + "' not found");
    }
    return *speaker;
}

static std::string label(const WamSpeaker& speaker) {
    return speaker.name().empty() ? speaker.address() : speaker.name();
}

static void printSpeaker(const WamSpeaker& speaker) {
    const SpeakerSnapshot& s = speaker.state();
    std::cout << "  Name:    " << (s.name.empty() ? "(unknown)" : s.name) << "\n"
              << "  IP:      " << speaker.address() << "\n"
              << "  MAC:     " << (speaker.mac().empty() ? "(unknown)" : speaker.mac()) << "\n"
              << "  Volume:  " << s.volume << "\n"
              << "  Mute:    " << s.mute << "\n"
              << "  LED:     " << s.led << "\n"
              << "  Repeat:  " << repeatModeName(s.repeat) << "\n"
              << "  Group:   " << (s.groupName.empty() ? "None" : s.groupName)
              << " (" << groupStateName(speaker.groupState()) << ")\n"
              << "  AP SSID: " << (s.apSsid.empty() ? "(unknown)" : s.apSsid) << std::endl;
    if (!s.complete()) {
        std::cout << "  ⚠️  Unavailable:";
        for (const auto& field : s.failedFields) {
            std::cout << " " << field;
        }
        std::cout << std::endl;
    }
}

static const std::string& requireArg(const std::vector<std::string>& args, size_t index,
                                     const std::string& what) {
    if (index >= args.size()) {
        throw InvalidArgument("missing " + what);
    }
    return args[index];
}

static int runGroupCommand(WamController& controller, const CliOptions& options) {
    const auto& args = options.args;
    const std::string& action = requireArg(args, 1, "group action (create|ungroup)");

    if (action == "create") {
        std::string groupName;
        std::vector<std::string> members;
        for (size_t i = 2; i < args.size(); ++i) {
            if (args[i] == "--name" && i + 1 < args.size()) {
                groupName = args[++i];
            } else if (args[i] == "--speakers") {
                while (i + 1 < args.size() && args[i + 1].compare(0, 2, "--") != 0) {
                    members.push_back(args[++i]);
                }
            } else {
                throw InvalidArgument("unexpected argument '" + args[i] + "'");
            }
        }
        if (groupName.empty()) {
            throw InvalidArgument("group name is required (--name)");
        }

        loadSpeakers(controller, options);
        for (const auto& member : members) {
            if (looksLikeAddress(member) && !controller.findSpeaker(member)) {
                controller.addSpeaker(member);
            }
        }

        GroupResult result = controller.createGroup(groupName, members);
        const WamGroup& group = GroupCoordinator::groupOrThrow(result);
        std::cout << "✓ Created group '" << group.name << "' with " << group.size()
                  << " speakers (main: " << label(*group.main) << ")" << std::endl;
        return 0;
    }

    if (action == "ungroup") {
        if (args.size() > 2) {
            WamSpeaker& speaker = resolveSpeaker(controller, options, args[2]);
            controller.coordinator().dissolveGroup(speaker);
            std::cout << "✓ " << label(speaker) << " ungrouped" << std::endl;
            return 0;
        }

        loadSpeakers(controller, options);
        std::vector<std::string> failures = controller.ungroupAll();
        if (!failures.empty()) {
            std::cerr << "❌ " << failures.size() << " speaker(s) could not be ungrouped" << std::endl;
            return 1;
        }
        std::cout << "✓ All speakers have been ungrouped" << std::endl;
        return 0;
    }

    throw InvalidArgument("unknown group action '" + action + "'");
}

static int runCommand(WamController& controller, const CliOptions& options) {
    const auto& args = options.args;
    const std::string& command = args.front();

    if (command == "discover" || command == "list") {
        loadSpeakers(controller, options);
        const auto& speakers = controller.speakers();
        if (speakers.empty()) {
            std::cout << "No speakers found." << std::endl;
            return 0;
        }
        std::cout << "\nFound " << speakers.size() << " speaker(s):" << std::endl;
        for (size_t i = 0; i < speakers.size(); ++i) {
            if (command == "discover") {
                std::cout << "  " << (i + 1) << ". " << label(*speakers[i])
                          << " at " << speakers[i]->address() << std::endl;
            } else {
                std::cout << "\n" << (i + 1) << "." << std::endl;
                printSpeaker(*speakers[i]);
            }
        }
        return 0;
    }

    if (command == "group") {
        return runGroupCommand(controller, options);
    }

    WamSpeaker& speaker = resolveSpeaker(controller, options, requireArg(args, 1, "speaker"));
    const bool hasValue = args.size() > 2;

    if (command == "info") {
        speaker.refresh();
        std::cout << "Information for " << label(speaker) << ":" << std::endl;
        printSpeaker(speaker);
        try {
            MusicInfo music = speaker.getMusicInfo();
            std::cout << "  Playing: " << music.title;
            if (!music.artist.empty()) std::cout << " - " << music.artist;
            if (!music.album.empty()) std::cout << " (" << music.album << ")";
            std::cout << std::endl;
        } catch (const WamError& e) {
            DEBUG_LOG("[wamctl] Music info unavailable: " << e.what());
            std::cout << "  Playing: (unavailable)" << std::endl;
        }
        return 0;
    }

    if (command == "volume") {
        if (hasValue) {
            speaker.setVolume(parseNumber(args[2], "volume"));
            std::cout << "✓ Volume for " << label(speaker) << " set to "
                      << speaker.state().volume << std::endl;
        } else {
            std::cout << "Volume for " << label(speaker) << ": " << speaker.getVolume() << std::endl;
        }
        return 0;
    }

    if (command == "mute") {
        if (hasValue) {
            speaker.setMute(args[2]);
            std::cout << "✓ Mute for " << label(speaker) << " set to " << args[2] << std::endl;
        } else {
            std::cout << "Mute for " << label(speaker) << ": " << speaker.getMute() << std::endl;
        }
        return 0;
    }

    if (command == "led") {
        if (hasValue) {
            speaker.setLed(args[2]);
            std::cout << "✓ LED for " << label(speaker) << " set to " << args[2] << std::endl;
        } else {
            std::cout << "LED for " << label(speaker) << ": " << speaker.getLed() << std::endl;
        }
        return 0;
    }

    if (command == "repeat") {
        if (hasValue) {
            speaker.setRepeatMode(args[2]);
            std::cout << "✓ Repeat mode for " << label(speaker) << " set to " << args[2] << std::endl;
        } else {
            std::cout << "Repeat mode for " << label(speaker) << ": "
                      << repeatModeName(speaker.getRepeatMode()) << std::endl;
        }
        return 0;
    }

    if (command == "shuffle") {
        const std::string& state = requireArg(args, 2, "shuffle state (on|off)");
        if (state != "on" && state != "off") {
            throw InvalidArgument("shuffle must be 'on' or 'off'");
        }
        speaker.setShuffle(state == "on");
        std::cout << "✓ Shuffle for " << label(speaker) << " set to " << state << std::endl;
        return 0;
    }

    if (command == "playback") {
        const std::string& action = requireArg(args, 2, "playback action");
        if (action == "play") speaker.play();
        else if (action == "pause") speaker.pause();
        else if (action == "resume") speaker.resume();
        else if (action == "next") speaker.nextTrack();
        else if (action == "prev") speaker.previousTrack();
        else throw InvalidArgument("unknown playback action '" + action + "'");
        std::cout << "✓ Sent " << action << " to " << label(speaker) << std::endl;
        return 0;
    }

    if (command == "url") {
        const std::string& url = requireArg(args, 2, "URL");
        bool resume = !(args.size() > 3 && args[3] == "--no-resume");
        speaker.playFromUrl(url, resume);
        std::cout << "✓ " << label(speaker) << " is playing " << url << std::endl;
        return 0;
    }

    if (command == "eq") {
        const std::string& preset = requireArg(args, 2, "EQ preset");
        if (isNumber(preset)) {
            speaker.set7BandPreset(parseNumber(preset, "EQ preset index"));
        } else {
            speaker.set7BandPreset(preset);
        }
        std::cout << "✓ EQ preset for " << label(speaker) << " set to " << preset << std::endl;
        return 0;
    }

    if (command == "name") {
        const std::string& newName = requireArg(args, 2, "new name");
        speaker.setName(newName);
        std::cout << "✓ Speaker " << speaker.address() << " renamed to " << newName << std::endl;
        return 0;
    }

    throw InvalidArgument("unknown command '" + command + "' (use --help)");
}

int main(int argc, char* argv[]) {
    CliOptions options = parseArguments(argc, argv);
    if (options.args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (!options.controller.networkInterface.empty()) {
        DEBUG_LOG("[wamctl] Discovery interface: " << options.controller.networkInterface);
    }

    try {
        g_signals.start();

        g_controller = std::make_unique<WamController>(options.controller);
        int rc = runCommand(*g_controller, options);
        g_controller.reset();
        return rc;
    } catch (const InvalidArgument& e) {
        std::cerr << "❌ Invalid argument: " << e.what() << std::endl;
    } catch (const GroupingError& e) {
        std::cerr << "❌ Grouping failed: " << e.what() << std::endl;
    } catch (const WamError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
    }

    g_controller.reset();
    return 1;
}
