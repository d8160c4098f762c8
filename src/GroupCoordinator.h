/**
 * @file GroupCoordinator.h
 * @brief Multi-speaker group formation and dissolution
 *
 * createGroup() runs numbered steps:
 *   0 .. n-1 : SetUngroup on member i (always, cached state may be stale)
 *   n        : SetMultispkGroup to the main speaker (members[0]) only
 * Sub speakers are never contacted, they join through the main speaker.
 * A failed result carries its step so the caller can resume there.
 */

#ifndef GROUP_COORDINATOR_H
#define GROUP_COORDINATOR_H

#include "WamCommand.h"
#include "WamSpeaker.h"

#include <string>
#include <variant>
#include <vector>

struct WamGroup {
    std::string name;
    WamSpeaker* main = nullptr;
    std::vector<WamSpeaker*> subs;

    size_t size() const { return main ? subs.size() + 1 : 0; }
};

struct GroupFormed {
    WamGroup group;
};

struct UngroupFailed {
    size_t step;
    WamSpeaker* speaker;
    std::string cause;
};

struct GroupCommandFailed {
    size_t step;
    WamSpeaker* main;
    std::string cause;
};

using GroupResult = std::variant<GroupFormed, UngroupFailed, GroupCommandFailed>;

class GroupCoordinator {
public:
    static constexpr const char* UNKNOWN_MAC = "00:00:00:00:00:00";

    GroupCoordinator() = default;

    GroupCoordinator(const GroupCoordinator&) = delete;
    GroupCoordinator& operator=(const GroupCoordinator&) = delete;

    // members[0] becomes main. Throws InvalidArgument on an empty name,
    // no members, a null or repeated member or resumeFromStep > n.
    GroupResult createGroup(const std::string& name,
                            const std::vector<WamSpeaker*>& members,
                            size_t resumeFromStep = 0);

    // SetUngroup on this speaker: the whole group when it is the main,
    // only this member when it is a sub. Throws on failure.
    void dissolveGroup(WamSpeaker& speaker);

    // Groups formed through this coordinator and still believed alive
    const std::vector<WamGroup>& groups() const { return m_groups; }
    void forgetGroups() { m_groups.clear(); }

    static WamCommand buildGroupCommand(const std::string& name,
                                        const WamSpeaker& main,
                                        const std::vector<WamSpeaker*>& subs);

    static bool succeeded(const GroupResult& result);
    static size_t failedStep(const GroupResult& result);   // throws InvalidArgument on success

    // Returns the formed group or throws the matching GroupingError
    static const WamGroup& groupOrThrow(const GroupResult& result);

private:
    // Drop the speaker from recorded groups once the device has left them.
    // Subs of a group it was main of are marked ungrouped unless listed in keep.
    void releaseMember(WamSpeaker& speaker, const std::vector<WamSpeaker*>& keep);

    std::vector<WamGroup> m_groups;
};

#endif // GROUP_COORDINATOR_H
