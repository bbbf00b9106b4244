#ifndef FNSANITIZER_RENAMER_H
#define FNSANITIZER_RENAMER_H

#include "fnsanitizer/Types.h"
#include "fnsanitizer/naming/NameSanitizer.h"
#include "fnsanitizer/utils/FileSystemProbe.h"
#include "fnsanitizer/utils/RandomSource.h"
#include <string>
#include <vector>

namespace fns {

/**
 * Renames a whole directory tree
 *
 * Steps of run():
 * 1. validate the options
 * 2. copy the tree when a copy destination is given
 * 3. create the logs directory
 * 4. files, then directories: propose, log, execute, log failures
 * 5. scan for paths still over the path budget
 *
 * Nothing on disk changes unless RenameOptions::actuallyRename is set,
 * apart from the copy and the logs.
 */
class Renamer {
public:
    /**
     * @param sink Status lines; verbose-only lines go to @p detailSink
     */
    Renamer(const RenameOptions& options, const FileSystemProbe& probe, RandomSource& random,
            CreationTimePolicy policy, MessageSink sink = {}, MessageSink detailSink = {});

    /**
     * @throws InvalidConfigurationException on invalid options
     * @throws NamingCollisionException when a proposed name is taken;
     *         nothing of that kind has been renamed at that point
     * @throws WriteException if a log cannot be written
     */
    RenameReport run();

    /**
     * Directory the renaming works on: the copy, or the source itself
     */
    std::string workingDirectory() const;

private:
    RenameOptions m_options;
    const FileSystemProbe& m_probe;
    NameSanitizer m_sanitizer;
    CreationTimePolicy m_policy;
    MessageSink m_sink;
    MessageSink m_detailSink;

    KindReport renameKind(NameKind kind, const std::vector<std::string>& paths,
                          const std::string& logsDir);
    void handleLongPaths(const std::string& directory, const std::string& logsDir,
                         RenameReport& report);

    void emit(const std::string& message) const;
    void emitDetail(const std::string& message) const;
};

} // namespace fns

#endif // FNSANITIZER_RENAMER_H
