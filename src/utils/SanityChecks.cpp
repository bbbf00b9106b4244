#include "fnsanitizer/utils/SanityChecks.h"
#include "fnsanitizer/Exceptions.h"

#include <algorithm>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace fns {

namespace {

fs::path normalized(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::u8path(path), ec);
    if (ec) {
        absolute = fs::u8path(path);
    }
    absolute = absolute.lexically_normal();

    // "a/b/" and "a/b" must compare equal
    if (!absolute.has_filename() && absolute.has_parent_path() &&
        absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

void invalid(const char* key) {
    throw InvalidConfigurationException(std::string("The value for ") + key + " is invalid");
}

} // anonymous namespace

size_t SanityChecks::practicalNameLength() {
    return std::strlen(PRACTICAL_EXAMPLE_NAME);
}

void SanityChecks::checkRenameOptions(const RenameOptions& options) {
    std::error_code ec;
    if (options.directoryPath.empty() || !fs::is_directory(fs::u8path(options.directoryPath), ec)) {
        invalid("directory_path");
    }
    if (options.maxFullNameLength <= 0) {
        invalid("max_full_name_len");
    }
    if (options.maxPathLength <= 0) {
        invalid("max_path_len");
    }
    if (options.maxExtLength <= 0) {
        invalid("max_ext_len");
    }

    if (options.inPlace && options.whereToCopy) {
        throw InvalidConfigurationException("Cannot rename both in place and in a copy");
    }
    if (options.actuallyRename && !options.inPlace && !options.whereToCopy) {
        throw InvalidConfigurationException(
            "Renaming requires choosing between in place and in a copy");
    }

    if (options.whereToCopy &&
        isSameOrInside(*options.whereToCopy, options.directoryPath)) {
        invalid("where_to_copy");
    }
}

void SanityChecks::checkParentExists(const std::string& path) {
    fs::path parent = fs::u8path(path).parent_path();
    if (parent.empty()) {
        parent = ".";
    }

    std::error_code ec;
    if (!fs::exists(parent, ec)) {
        throw InvalidPathException(path);
    }
}

bool SanityChecks::isSameOrInside(const std::string& path, const std::string& base) {
    fs::path p = normalized(path);
    fs::path b = normalized(base);

    auto mismatch = std::mismatch(b.begin(), b.end(), p.begin(), p.end());
    return mismatch.first == b.end();
}

} // namespace fns
