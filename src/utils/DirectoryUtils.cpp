#include "fnsanitizer/utils/DirectoryUtils.h"
#include "fnsanitizer/Exceptions.h"
#include "fnsanitizer/utils/PathUtils.h"
#include "fnsanitizer/utils/UnicodeUtils.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>

namespace fs = std::filesystem;

namespace fns {

namespace {

struct Entry {
    std::string name;
    bool isSymlink = false;
    bool isDirectory = false;   // Follows symlinks
    bool isRegular = false;     // Follows symlinks
};

std::vector<Entry> listEntries(const std::string& dir, std::error_code& ec) {
    std::vector<Entry> entries;
    fs::directory_iterator it(fs::u8path(dir), ec);
    if (ec) {
        return entries;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return entries;
        }
        std::error_code statEc;
        Entry entry;
        entry.name = it->path().filename().u8string();
        entry.isSymlink = it->is_symlink(statEc);
        entry.isDirectory = it->is_directory(statEc);
        entry.isRegular = it->is_regular_file(statEc);
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });
    return entries;
}

// Top-down walk that lists directory symlinks without following them
void walk(const std::string& dir,
          const std::function<void(const std::string& path, bool asDirectory)>& visit) {
    std::error_code ec;
    std::vector<Entry> entries = listEntries(dir, ec);
    if (ec) {
        throw ReadException("cannot list " + dir + ": " + ec.message());
    }

    for (const auto& entry : entries) {
        std::string path = PathUtils::join(dir, entry.name);
        visit(path, entry.isDirectory);
        if (entry.isDirectory && !entry.isSymlink) {
            walk(path, visit);
        }
    }
}

void sortDeepestFirst(std::vector<std::string>& paths) {
    std::map<std::string, std::pair<size_t, size_t>> keyByPath;
    for (const auto& path : paths) {
        keyByPath[path] = {PathUtils::depth(path), UnicodeUtils::length(path)};
    }

    std::sort(paths.begin(), paths.end(), [&](const std::string& a, const std::string& b) {
        const auto& ka = keyByPath[a];
        const auto& kb = keyByPath[b];
        if (ka.first != kb.first) {
            return ka.first > kb.first;
        }
        if (ka.second != kb.second) {
            return ka.second > kb.second;
        }
        return a < b;
    });
}

void report(const MessageSink& sink, const std::string& message) {
    if (sink) {
        sink(message);
    }
}

} // anonymous namespace

const std::vector<std::string>& DirectoryUtils::junkFiles() {
    static const std::vector<std::string> junk = {".DS_Store", "Thumbs.db"};
    return junk;
}

bool DirectoryUtils::isJunk(const std::string& name) {
    const auto& junk = junkFiles();
    return std::find(junk.begin(), junk.end(), name) != junk.end();
}

PathsByKind DirectoryUtils::collectPaths(const std::string& directory) {
    std::error_code ec;
    if (!fs::is_directory(fs::u8path(directory), ec)) {
        throw FileNotFoundException(directory);
    }

    PathsByKind paths;
    walk(directory, [&](const std::string& path, bool asDirectory) {
        (asDirectory ? paths.dirs : paths.files).push_back(path);
    });

    sortDeepestFirst(paths.dirs);
    sortDeepestFirst(paths.files);
    return paths;
}

std::vector<std::string> DirectoryUtils::findLongPaths(const std::string& directory,
                                                       size_t maxPathLength) {
    std::error_code ec;
    if (!fs::is_directory(fs::u8path(directory), ec)) {
        throw FileNotFoundException(directory);
    }

    std::vector<std::string> longPaths;
    walk(directory, [&](const std::string& path, bool) {
        if (UnicodeUtils::length(path) > maxPathLength) {
            longPaths.push_back(path);
        }
    });

    std::sort(longPaths.begin(), longPaths.end());
    return longPaths;
}

bool DirectoryUtils::copyDirectory(const std::string& src, const std::string& dst,
                                   const MessageSink& sink) {
    std::error_code ec;
    fs::path srcPath = fs::u8path(src);
    fs::path dstPath = fs::u8path(dst);

    if (!fs::is_directory(srcPath, ec)) {
        report(sink, "An error occurred: no such directory: " + src);
        return false;
    }

    fs::create_directories(dstPath, ec);
    if (!ec) {
        fs::copy(srcPath, dstPath,
                 fs::copy_options::recursive | fs::copy_options::copy_symlinks |
                 fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        report(sink, "An error occurred: " + ec.message());
        return false;
    }

    DirectoryComparison comparison = compareDirectories(src, dst);
    if (!comparison.identical) {
        report(sink, "Something terribly wrong happened. The dirs aren't identical:");
        for (const auto& mismatch : comparison.mismatches) {
            report(sink, mismatch);
        }
        return false;
    }
    return true;
}

DirectoryComparison DirectoryUtils::compareDirectories(const std::string& src,
                                                       const std::string& dst) {
    DirectoryComparison result;
    std::error_code ec;

    if (!fs::is_directory(fs::u8path(src), ec) || !fs::is_directory(fs::u8path(dst), ec)) {
        result.identical = false;
        result.mismatches.push_back("Directory mismatch: " + src + " or " + dst +
                                    " is not a directory");
        return result;
    }

    std::error_code srcEc;
    std::error_code dstEc;
    std::map<std::string, Entry> left;
    std::map<std::string, Entry> right;
    for (auto& entry : listEntries(src, srcEc)) {
        if (!isJunk(entry.name)) {
            left.emplace(entry.name, entry);
        }
    }
    for (auto& entry : listEntries(dst, dstEc)) {
        if (!isJunk(entry.name)) {
            right.emplace(entry.name, entry);
        }
    }
    if (srcEc || dstEc) {
        result.mismatches.push_back("Error: " + (srcEc ? src : dst) + ": " +
                                    (srcEc ? srcEc : dstEc).message());
    }

    std::vector<std::string> subdirs;
    for (const auto& [name, entry] : left) {
        auto it = right.find(name);
        if (it == right.end()) {
            result.mismatches.push_back("Only in " + src + ": " + name);
            continue;
        }

        const Entry& other = it->second;
        std::string a = PathUtils::join(src, name);
        std::string b = PathUtils::join(dst, name);

        if (entry.isSymlink != other.isSymlink) {
            result.mismatches.push_back("Funny file: " + name);
        } else if (entry.isSymlink) {
            fs::path ta = fs::read_symlink(fs::u8path(a), ec);
            fs::path tb = ec ? fs::path() : fs::read_symlink(fs::u8path(b), ec);
            if (ec) {
                result.mismatches.push_back("Error: " + name);
            } else if (ta != tb) {
                result.mismatches.push_back(name);
            }
        } else if (entry.isDirectory && other.isDirectory) {
            subdirs.push_back(name);
        } else if (entry.isRegular && other.isRegular) {
            std::ifstream fa(fs::u8path(a), std::ios::binary);
            std::ifstream fb(fs::u8path(b), std::ios::binary);
            if (!fa || !fb) {
                result.mismatches.push_back("Error: " + name);
            } else if (!sameContents(a, b)) {
                result.mismatches.push_back(name);
            }
        } else {
            result.mismatches.push_back("Funny file: " + name);
        }
    }

    for (const auto& [name, entry] : right) {
        if (left.count(name) == 0) {
            result.mismatches.push_back("Only in " + dst + ": " + name);
        }
    }

    for (const auto& name : subdirs) {
        DirectoryComparison sub = compareDirectories(PathUtils::join(src, name),
                                                     PathUtils::join(dst, name));
        for (const auto& mismatch : sub.mismatches) {
            result.mismatches.push_back("In subdirectory " + name + ": " + mismatch);
        }
    }

    result.identical = result.mismatches.empty();
    return result;
}

bool DirectoryUtils::sameContents(const std::string& a, const std::string& b) {
    std::error_code ec;
    auto sizeA = fs::file_size(fs::u8path(a), ec);
    auto sizeB = ec ? 0 : fs::file_size(fs::u8path(b), ec);
    if (ec || sizeA != sizeB) {
        return false;
    }

    std::ifstream fa(fs::u8path(a), std::ios::binary);
    std::ifstream fb(fs::u8path(b), std::ios::binary);

    std::array<char, 65536> bufA;
    std::array<char, 65536> bufB;
    while (fa && fb) {
        fa.read(bufA.data(), bufA.size());
        fb.read(bufB.data(), bufB.size());
        std::streamsize n = fa.gcount();
        if (n != fb.gcount() ||
            !std::equal(bufA.begin(), bufA.begin() + n, bufB.begin())) {
            return false;
        }
    }
    return fa.eof() && fb.eof();
}

bool DirectoryUtils::createNestedDirs(const std::string& path, const MessageSink& sink) {
    std::error_code ec;
    fs::create_directories(fs::u8path(path), ec);
    if (ec) {
        report(sink, "failed to create dir " + path + ": " + ec.message());
        return false;
    }
    if (!fs::is_directory(fs::u8path(path), ec)) {
        report(sink, "failed to create dir " + path + " for unknown reasons");
        return false;
    }
    return true;
}

std::pair<bool, std::string> DirectoryUtils::deleteDirectory(const std::string& path) {
    std::error_code ec;
    fs::path dir = fs::u8path(path);

    if (!fs::is_directory(dir, ec)) {
        return {true, "the dir doesn't exist already: " + path};
    }

    fs::remove_all(dir, ec);
    if (ec || fs::is_directory(dir, ec)) {
        return {false, "failed to delete " + path};
    }
    return {true, "successfully deleted " + path};
}

} // namespace fns
