#include "fnsanitizer/utils/FileSystemProbe.h"

#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace fns {

bool LocalFileSystemProbe::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(fs::u8path(path), ec);
}

bool LocalFileSystemProbe::isSymlink(const std::string& path) const {
    std::error_code ec;
    return fs::is_symlink(fs::u8path(path), ec);
}

std::optional<FileTimes> LocalFileSystemProbe::statTimes(const std::string& path) const {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }

    FileTimes times;
    times.ctime = st.st_ctime;
    times.mtime = st.st_mtime;
    return times;
}

CreationTimePolicy LocalFileSystemProbe::hostPolicy() {
#ifdef _WIN32
    return CreationTimePolicy::Windows;
#else
    return CreationTimePolicy::Unix;
#endif
}

} // namespace fns
