#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

std::string FileUtils::joinPaths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;
    return (fs::path(base) / fs::path(relative)).string();
}

std::string FileUtils::getProjectRoot() {
    if (const char* env = std::getenv("CTSAFETY_ROOT")) {
        if (*env != '\0') return std::string(env);
    }

    std::error_code ec;
    fs::path dir = fs::current_path(ec);
    if (ec) return ".";

    for (fs::path candidate = dir; !candidate.empty(); candidate = candidate.parent_path()) {
        if (fs::is_directory(candidate / "data" / "configuration", ec)) {
            return candidate.string();
        }
        if (candidate == candidate.root_path()) break;
    }
    return dir.string();
}

bool FileUtils::fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string FileUtils::trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> FileUtils::split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : s) {
        if (ch == delimiter) {
            parts.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(trim(current));
    return parts;
}

std::vector<std::string> FileUtils::readContentLines(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ctsafety::FileIOException("FileUtils::readContentLines", "Cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}
