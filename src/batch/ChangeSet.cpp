#include "fnsanitizer/batch/ChangeSet.h"

#include <unordered_set>

namespace fns {

void ChangeSet::set(const std::string& oldPath, const std::string& newPath) {
    auto it = m_index.find(oldPath);
    if (it != m_index.end()) {
        m_changes[it->second].newPath = newPath;
        return;
    }

    m_index.emplace(oldPath, m_changes.size());
    m_changes.push_back({oldPath, newPath});
}

std::optional<std::string> ChangeSet::find(const std::string& oldPath) const {
    auto it = m_index.find(oldPath);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return m_changes[it->second].newPath;
}

bool ChangeSet::contains(const std::string& oldPath) const {
    return m_index.count(oldPath) != 0;
}

ChangeSet ChangeSet::sortedByPathOrder(const std::vector<std::string>& paths) const {
    ChangeSet sorted;
    std::unordered_set<std::string> placed;

    for (const auto& path : paths) {
        auto it = m_index.find(path);
        if (it != m_index.end() && placed.insert(path).second) {
            sorted.set(path, m_changes[it->second].newPath);
        }
    }

    for (const auto& change : m_changes) {
        if (placed.count(change.oldPath) == 0) {
            sorted.set(change.oldPath, change.newPath);
        }
    }
    return sorted;
}

} // namespace fns
