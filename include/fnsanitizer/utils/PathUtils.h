#ifndef FNSANITIZER_PATH_UTILS_H
#define FNSANITIZER_PATH_UTILS_H

#include <string>
#include <utility>

namespace fns {

/**
 * String-level path helpers
 *
 * Paths are handled as '/'-separated UTF-8 strings exactly as they were
 * collected, so that renames map back to the same spelling.
 */
class PathUtils {
public:
    /**
     * Everything before the last '/', without trailing separators.
     * "a/b" -> "a", "/a" -> "/", "a" -> ""
     */
    static std::string parentOf(const std::string& path);

    /**
     * Everything after the last '/'
     */
    static std::string baseName(const std::string& path);

    /**
     * Join with a single '/'. An empty parent yields the name alone.
     */
    static std::string join(const std::string& parent, const std::string& name);

    /**
     * Split a base name into stem and extension at the last dot.
     * Dots leading the name do not start an extension:
     * ".bashrc" -> (".bashrc", ""), "a.b.c" -> ("a.b", ".c")
     */
    static std::pair<std::string, std::string> splitExtension(const std::string& name);

    /**
     * Number of '/' separators
     */
    static size_t depth(const std::string& path);
};

} // namespace fns

#endif // FNSANITIZER_PATH_UTILS_H
