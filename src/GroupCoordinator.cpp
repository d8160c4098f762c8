#include "GroupCoordinator.h"
#include "WamErrors.h"
#include "WamLog.h"

#include <algorithm>
#include <iostream>

WamCommand GroupCoordinator::buildGroupCommand(const std::string& name,
                                               const WamSpeaker& main,
                                               const std::vector<WamSpeaker*>& subs) {
    WamCommand command("SetMultispkGroup");
    command.cdata("name", name)
           .dec("index", 1)
           .str("type", "main")
           .dec("spknum", static_cast<long long>(subs.size() + 1))
           .str("audiosourcemacaddr", main.mac().empty() ? UNKNOWN_MAC : main.mac())
           .cdata("audiosourcename", main.name())
           .str("audiosourcetype", "speaker");

    for (const WamSpeaker* sub : subs) {
        command.str("subspkip", sub->address())
               .str("subspkmacaddr", sub->mac().empty() ? UNKNOWN_MAC : sub->mac());
    }
    return command;
}

GroupResult GroupCoordinator::createGroup(const std::string& name,
                                          const std::vector<WamSpeaker*>& members,
                                          size_t resumeFromStep) {
    if (name.empty()) {
        throw InvalidArgument("group name is empty");
    }
    if (members.empty()) {
        throw InvalidArgument("a group needs at least one speaker");
    }
    for (size_t i = 0; i < members.size(); ++i) {
        if (!members[i]) {
            throw InvalidArgument("group member " + std::to_string(i) + " is null");
        }
        for (size_t j = 0; j < i; ++j) {
            if (members[j]->address() == members[i]->address()) {
                throw InvalidArgument("speaker " + members[i]->address() + " listed twice");
            }
        }
    }

    const size_t groupStep = members.size();
    if (resumeFromStep > groupStep) {
        throw InvalidArgument("resume step " + std::to_string(resumeFromStep) +
                              " is past the last step " + std::to_string(groupStep));
    }

    WamSpeaker* main = members.front();
    std::vector<WamSpeaker*> subs(members.begin() + 1, members.end());

    std::cout << "[GroupCoordinator] Creating group '" << name << "' with "
              << members.size() << " speaker(s), main " << main->address() << std::endl;
    if (resumeFromStep > 0) {
        std::cout << "[GroupCoordinator] Resuming at step " << resumeFromStep << std::endl;
    }

    std::vector<GroupState> previous;
    for (size_t i = 0; i < members.size(); ++i) {
        previous.push_back(members[i]->groupState());
        // Members before the resume point left their groups in an earlier attempt
        if (i < resumeFromStep) {
            releaseMember(*members[i], members);
        }
        members[i]->markGrouping();
    }

    // Steps 0..n-1: ungroup every member
    for (size_t step = resumeFromStep; step < groupStep; ++step) {
        WamSpeaker* member = members[step];
        try {
            member->ungroup();
            releaseMember(*member, members);
            member->markGrouping();
            DEBUG_LOG("[GroupCoordinator] Step " << step << ": " << member->address() << " ungrouped");
        } catch (const WamError& e) {
            std::cerr << "[GroupCoordinator] ❌ Step " << step << ": ungroup of "
                      << member->address() << " failed: " << e.what() << std::endl;

            for (size_t i = 0; i < members.size(); ++i) {
                if (i < step) {
                    members[i]->markUngrouped();
                } else if (previous[i] == GroupState::Ungrouped) {
                    members[i]->markUngrouped();
                } else {
                    members[i]->markGrouped(members[i]->groupName(), previous[i]);
                }
            }
            return UngroupFailed{step, member, e.what()};
        }
    }

    // Step n: one SetMultispkGroup to the main speaker
    WamCommand command = buildGroupCommand(name, *main, subs);
    try {
        main->execute(command);
    } catch (const WamError& e) {
        std::cerr << "[GroupCoordinator] ❌ Step " << groupStep << ": SetMultispkGroup on "
                  << main->address() << " failed: " << e.what() << std::endl;
        for (WamSpeaker* member : members) {
            member->markUngrouped();
        }
        return GroupCommandFailed{groupStep, main, e.what()};
    }

    // Accepted by the main speaker; subs are not asked to confirm
    main->markGrouped(name, GroupState::GroupedMain);
    for (WamSpeaker* sub : subs) {
        sub->markGrouped(name, GroupState::GroupedSub);
    }

    WamGroup group;
    group.name = name;
    group.main = main;
    group.subs = subs;
    m_groups.push_back(group);

    std::cout << "[GroupCoordinator] ✓ Group '" << name << "' formed" << std::endl;
    return GroupFormed{group};
}

void GroupCoordinator::dissolveGroup(WamSpeaker& speaker) {
    std::cout << "[GroupCoordinator] Ungrouping " << speaker.address() << std::endl;

    speaker.ungroup();
    releaseMember(speaker, {});
}

void GroupCoordinator::releaseMember(WamSpeaker& speaker, const std::vector<WamSpeaker*>& keep) {
    for (auto it = m_groups.begin(); it != m_groups.end(); ) {
        if (it->main == &speaker) {
            // The main speaker leaving dissolves the whole group
            for (WamSpeaker* sub : it->subs) {
                if (std::find(keep.begin(), keep.end(), sub) == keep.end()) {
                    sub->markUngrouped();
                }
            }
            std::cout << "[GroupCoordinator] ✓ Group '" << it->name << "' dissolved" << std::endl;
            it = m_groups.erase(it);
            continue;
        }
        auto& subs = it->subs;
        subs.erase(std::remove(subs.begin(), subs.end(), &speaker), subs.end());
        ++it;
    }
}

bool GroupCoordinator::succeeded(const GroupResult& result) {
    return std::holds_alternative<GroupFormed>(result);
}

size_t GroupCoordinator::failedStep(const GroupResult& result) {
    if (const auto* failed = std::get_if<UngroupFailed>(&result)) {
        return failed->step;
    }
    if (const auto* failed = std::get_if<GroupCommandFailed>(&result)) {
        return failed->step;
    }
    throw InvalidArgument("group result is not a failure");
}

const WamGroup& GroupCoordinator::groupOrThrow(const GroupResult& result) {
    if (const auto* formed = std::get_if<GroupFormed>(&result)) {
        return formed->group;
    }
    if (const auto* failed = std::get_if<UngroupFailed>(&result)) {
        throw GroupingError(GroupingError::Step::Ungroup, failed->step,
                            failed->speaker->address(), failed->cause);
    }
    const auto& failed = std::get<GroupCommandFailed>(result);
    throw GroupingError(GroupingError::Step::GroupCommand, failed.step,
                        failed.main->address(), failed.cause);
}
