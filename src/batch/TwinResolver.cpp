#include "fnsanitizer/batch/TwinResolver.h"
#include "fnsanitizer/Exceptions.h"
#include "fnsanitizer/utils/PathUtils.h"
#include "fnsanitizer/utils/TimestampUtils.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

#include <algorithm>
#include <unordered_map>

namespace fns {

TwinResolver::TwinResolver(const FileSystemProbe& probe)
    : m_probe(probe) {}

std::vector<TwinFamily> TwinResolver::identifyTwins(const std::vector<std::string>& paths,
                                                    const ChangeSet& changes) {
    std::vector<TwinFamily> groups;
    std::unordered_map<std::string, size_t> groupByKey;

    for (const auto& path : paths) {
        TwinMember member;
        member.originalPath = path;
        member.proposedPath = changes.find(path).value_or(path);

        std::string key = UnicodeUtils::lowerCaseUtf8(member.proposedPath);
        auto it = groupByKey.find(key);
        if (it == groupByKey.end()) {
            groupByKey.emplace(key, groups.size());
            groups.push_back({key, {std::move(member)}});
        } else {
            groups[it->second].members.push_back(std::move(member));
        }
    }

    std::vector<TwinFamily> families;
    for (auto& group : groups) {
        if (group.members.size() > 1) {
            families.push_back(std::move(group));
        }
    }
    return families;
}

std::vector<size_t> TwinResolver::rankFamily(const TwinFamily& family, CreationTimePolicy policy) {
    const auto& members = family.members;

    bool useTimes = policy != CreationTimePolicy::Unavailable;
    for (const auto& member : members) {
        if (!member.times) {
            useTimes = false;
        }
    }

    std::vector<std::string> lowered;
    lowered.reserve(members.size());
    for (const auto& member : members) {
        lowered.push_back(UnicodeUtils::lowerCaseUtf8(member.originalPath));
    }

    std::vector<size_t> order(members.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }

    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (useTimes) {
            std::time_t ka = TimestampUtils::creationKey(*members[a].times, policy);
            std::time_t kb = TimestampUtils::creationKey(*members[b].times, policy);
            if (ka != kb) {
                return ka < kb;
            }
        }
        if (lowered[a] != lowered[b]) {
            return lowered[a] < lowered[b];
        }
        return members[a].originalPath < members[b].originalPath;
    });
    return order;
}

std::string TwinResolver::twinPath(const std::string& proposedPath, size_t rank) {
    std::string name = TWIN_PREFIX + std::to_string(rank) + "_" + PathUtils::baseName(proposedPath);
    return PathUtils::join(PathUtils::parentOf(proposedPath), name);
}

TwinResolution TwinResolver::resolve(const std::vector<std::string>& paths,
                                     const ChangeSet& changes,
                                     CreationTimePolicy policy) const {
    TwinResolution resolution;
    resolution.changes = changes;
    resolution.families = identifyTwins(paths, changes);

    for (auto& family : resolution.families) {
        if (policy != CreationTimePolicy::Unavailable) {
            for (auto& member : family.members) {
                member.times = m_probe.statTimes(member.originalPath);
            }
        }

        std::vector<size_t> order = rankFamily(family, policy);
        for (size_t rank = 0; rank < order.size(); ++rank) {
            const TwinMember& member = family.members[order[rank]];
            resolution.changes.set(member.originalPath, twinPath(member.proposedPath, rank));
        }
    }

    verify(paths, resolution.changes, resolution.families);
    return resolution;
}

void TwinResolver::verify(const std::vector<std::string>& paths, const ChangeSet& changes,
                          const std::vector<TwinFamily>& families) const {
    for (const auto& family : families) {
        for (const auto& member : family.members) {
            std::string newPath = changes.find(member.originalPath).value_or(member.originalPath);
            if (newPath != member.originalPath && m_probe.exists(newPath)) {
                throw NamingCollisionException(member.originalPath, newPath);
            }
        }
    }

    std::unordered_map<std::string, std::string> ownerByKey;
    for (const auto& path : paths) {
        std::string finalPath = changes.find(path).value_or(path);
        auto inserted = ownerByKey.emplace(UnicodeUtils::lowerCaseUtf8(finalPath), path);
        if (!inserted.second && inserted.first->second != path) {
            throw NamingCollisionException(path, finalPath);
        }
    }
}

} // namespace fns
