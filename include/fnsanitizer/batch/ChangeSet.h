#ifndef FNSANITIZER_CHANGE_SET_H
#define FNSANITIZER_CHANGE_SET_H

#include "fnsanitizer/Types.h"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fns {

/**
 * Insertion-ordered map of old path -> new path
 *
 * Order matters: the executor renames in this order, and directories
 * must be renamed deepest first.
 */
class ChangeSet {
public:
    using const_iterator = std::vector<ProposedChange>::const_iterator;

    /**
     * Insert a change, or retarget an existing one in place
     */
    void set(const std::string& oldPath, const std::string& newPath);

    std::optional<std::string> find(const std::string& oldPath) const;
    bool contains(const std::string& oldPath) const;

    size_t size() const { return m_changes.size(); }
    bool empty() const { return m_changes.empty(); }

    const_iterator begin() const { return m_changes.begin(); }
    const_iterator end() const { return m_changes.end(); }

    const std::vector<ProposedChange>& changes() const { return m_changes; }

    /**
     * Copy reordered to follow @p paths. Entries whose old path is not
     * listed keep their relative order at the end.
     */
    ChangeSet sortedByPathOrder(const std::vector<std::string>& paths) const;

    bool operator==(const ChangeSet& other) const { return m_changes == other.m_changes; }

private:
    std::vector<ProposedChange> m_changes;
    std::unordered_map<std::string, size_t> m_index;
};

} // namespace fns

#endif // FNSANITIZER_CHANGE_SET_H
