#include "fnsanitizer/batch/ChangeProposer.h"
#include "fnsanitizer/Exceptions.h"
#include "fnsanitizer/batch/TwinResolver.h"
#include "fnsanitizer/utils/PathUtils.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

#include <tuple>

namespace fns {

ChangeProposer::ChangeProposer(const NameSanitizer& sanitizer, const FileSystemProbe& probe,
                               const ProposerOptions& options)
    : m_sanitizer(sanitizer), m_probe(probe), m_options(options) {}

size_t ChangeProposer::stemBudget(const std::string& sanitizedExt) const {
    size_t extLength = UnicodeUtils::length(sanitizedExt);
    if (m_options.maxFullNameLength <= extLength) {
        return 1;
    }
    return m_options.maxFullNameLength - extLength;
}

std::string ChangeProposer::buildNewPath(const std::string& stem, const std::string& ext,
                                         const std::string& parentDir, size_t stemBudget) const {
    std::string newName = m_sanitizer.sanitizeName(stem, stemBudget) +
                          m_sanitizer.sanitizeExt(ext, m_options.maxExtLength);
    return PathUtils::join(parentDir, newName);
}

std::string ChangeProposer::propose(const std::string& path) const {
    std::string parentDir = PathUtils::parentOf(path);
    std::string oldName = PathUtils::baseName(path);

    std::string stem;
    std::string ext;
    if (m_options.replaceSymlinks && m_probe.isSymlink(path)) {
        // The link becomes a text file describing it
        stem = oldName;
        ext = SYMLINK_EXTENSION;
    } else if (m_options.kind == NameKind::File) {
        std::tie(stem, ext) = PathUtils::splitExtension(oldName);
    } else {
        stem = oldName;
    }

    std::string sanitizedExt = m_sanitizer.sanitizeExt(ext, m_options.maxExtLength);
    return buildNewPath(stem, ext, parentDir, stemBudget(sanitizedExt));
}

ChangeSet ChangeProposer::proposeAll(const std::vector<std::string>& paths) const {
    ChangeSet changes;
    for (const auto& path : paths) {
        std::string newPath = propose(path);
        if (newPath == path) {
            continue;
        }
        if (m_probe.exists(newPath)) {
            throw NamingCollisionException(path, newPath);
        }
        changes.set(path, newPath);
    }
    return changes;
}

ChangeSet ChangeProposer::buildChanges(const std::vector<std::string>& paths,
                                       CreationTimePolicy policy) const {
    ChangeSet provisional = proposeAll(paths);

    TwinResolver resolver(m_probe);
    TwinResolution resolution = resolver.resolve(paths, provisional, policy);
    return resolution.changes.sortedByPathOrder(paths);
}

} // namespace fns
