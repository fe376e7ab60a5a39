#include "common/PathUtils.h"

#include <cctype>
#include <filesystem>

namespace TEB {

std::string PathUtils::normalizeFsPath(const std::string &path) {
    std::string result = path;
    // URI style "/c:/dir" loses its leading slash
    if (result.size() >= 3 && result[0] == '/' && std::isalpha(static_cast<unsigned char>(result[1])) &&
        result[2] == ':') {
        result.erase(0, 1);
    }
    if (result.size() >= 2 && std::isalpha(static_cast<unsigned char>(result[0])) && result[1] == ':') {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

bool PathUtils::isSameOrDescendant(const std::string &ancestor, const std::string &path) {
    return path == ancestor || isDescendant(ancestor, path);
}

bool PathUtils::isDescendant(const std::string &ancestor, const std::string &path) {
    if (ancestor.empty() || path.size() <= ancestor.size()) {
        return false;
    }
    if (path.compare(0, ancestor.size(), ancestor) != 0) {
        return false;
    }
    const char last = ancestor.back();
    if (last == '/' || last == '\\') {
        return true;
    }
    const char next = path[ancestor.size()];
    return next == '/' || next == '\\';
}

std::string PathUtils::escapeRegex(const std::string &text) {
    static const std::string special = ".*+?^${}()|[]\\";
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string PathUtils::dirname(const std::string &path) {
    return std::filesystem::path(path).parent_path().string();
}

std::string PathUtils::basename(const std::string &path) {
    return std::filesystem::path(path).filename().string();
}

std::string PathUtils::relative(const std::string &base, const std::string &path) {
    if (base == path) {
        return "";
    }
    return std::filesystem::path(path).lexically_relative(std::filesystem::path(base)).string();
}

}  // namespace TEB
