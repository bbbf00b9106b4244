#include "fnsanitizer/utils/PathUtils.h"

#include <algorithm>

namespace fns {

std::string PathUtils::parentOf(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return {};
    }

    std::string parent = path.substr(0, slash + 1);
    // Keep a root made only of slashes
    if (parent.find_first_not_of('/') == std::string::npos) {
        return parent;
    }
    while (!parent.empty() && parent.back() == '/') {
        parent.pop_back();
    }
    return parent;
}

std::string PathUtils::baseName(const std::string& path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string PathUtils::join(const std::string& parent, const std::string& name) {
    if (parent.empty()) {
        return name;
    }
    if (parent.back() == '/') {
        return parent + name;
    }
    return parent + "/" + name;
}

std::pair<std::string, std::string> PathUtils::splitExtension(const std::string& name) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) {
        return {name, {}};
    }

    size_t firstNonDot = name.find_first_not_of('.');
    if (firstNonDot == std::string::npos || dot < firstNonDot) {
        return {name, {}};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

size_t PathUtils::depth(const std::string& path) {
    return static_cast<size_t>(std::count(path.begin(), path.end(), '/'));
}

} // namespace fns
