#ifndef FNSANITIZER_CHANGE_PROPOSER_H
#define FNSANITIZER_CHANGE_PROPOSER_H

#include "fnsanitizer/Types.h"
#include "fnsanitizer/batch/ChangeSet.h"
#include "fnsanitizer/naming/NameSanitizer.h"
#include "fnsanitizer/utils/FileSystemProbe.h"
#include <cstddef>
#include <string>
#include <vector>

namespace fns {

// Budgets and switches of one proposal batch
struct ProposerOptions {
    NameKind kind = NameKind::File;
    size_t maxFullNameLength = 30;
    size_t maxExtLength = NameSanitizer::DEFAULT_MAX_EXT_LENGTH;
    bool replaceSymlinks = false;
};

/**
 * Builds the old -> new mapping for one batch of paths
 */
class ChangeProposer {
public:
    static constexpr const char* SYMLINK_EXTENSION = ".slk";

    ChangeProposer(const NameSanitizer& sanitizer, const FileSystemProbe& probe,
                   const ProposerOptions& options);

    /**
     * Sanitize stem and extension separately and rebuild the path in
     * the same parent directory. Parent components are left alone.
     */
    std::string buildNewPath(const std::string& stem, const std::string& ext,
                             const std::string& parentDir, size_t stemBudget) const;

    /**
     * Candidate path for one entry, possibly equal to @p path
     */
    std::string propose(const std::string& path) const;

    /**
     * Provisional mapping of every entry that changes
     * @throws NamingCollisionException if a candidate already exists
     */
    ChangeSet proposeAll(const std::vector<std::string>& paths) const;

    /**
     * proposeAll() followed by twin resolution, ordered like @p paths
     */
    ChangeSet buildChanges(const std::vector<std::string>& paths,
                           CreationTimePolicy policy) const;

    const ProposerOptions& options() const { return m_options; }

private:
    const NameSanitizer& m_sanitizer;
    const FileSystemProbe& m_probe;
    ProposerOptions m_options;

    size_t stemBudget(const std::string& sanitizedExt) const;
};

} // namespace fns

#endif // FNSANITIZER_CHANGE_PROPOSER_H
