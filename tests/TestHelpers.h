#ifndef FNSANITIZER_TEST_HELPERS_H
#define FNSANITIZER_TEST_HELPERS_H

#include "fnsanitizer/utils/FileSystemProbe.h"
#include "fnsanitizer/utils/RandomSource.h"
#include <map>
#include <set>
#include <string>

namespace fns {
namespace test {

/**
 * Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return m_path; }

    /**
     * path()/relative
     */
    std::string join(const std::string& relative) const;

    /**
     * Create a file (and its parents) holding @p content
     */
    std::string writeFile(const std::string& relative, const std::string& content = "x") const;

    std::string makeDir(const std::string& relative) const;

private:
    std::string m_path;
};

/**
 * In-memory probe
 */
class FakeFileSystemProbe : public FileSystemProbe {
public:
    std::set<std::string> existing;
    std::set<std::string> symlinks;
    std::map<std::string, FileTimes> times;

    bool exists(const std::string& path) const override {
        return existing.count(path) != 0;
    }

    bool isSymlink(const std::string& path) const override {
        return symlinks.count(path) != 0;
    }

    std::optional<FileTimes> statTimes(const std::string& path) const override {
        auto it = times.find(path);
        if (it == times.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * Always returns the same number, clamped to the requested range
 */
class FixedRandomSource : public RandomSource {
public:
    explicit FixedRandomSource(int value) : m_value(value) {}

    int nextInRange(int lo, int hi) override {
        return m_value < lo ? lo : (m_value > hi ? hi : m_value);
    }

private:
    int m_value;
};

std::string readFile(const std::string& path);

} // namespace test
} // namespace fns

#endif // FNSANITIZER_TEST_HELPERS_H
