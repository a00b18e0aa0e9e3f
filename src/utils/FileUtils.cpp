#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    try {
        if (!fs::exists(path)) {
            return fs::create_directories(path);
        }
        return true;
    } catch (const fs::filesystem_error& e) {
        crn::Logger::getInstance().error("FileUtils::ensureDirectoryExists",
                                         "Error creating directory: " + std::string(e.what()));
        return false;
    }
}

std::string getProjectRoot() {
    std::string currentDir = fs::current_path().string();
    std::vector<std::string> possibleRoots = { currentDir };

    fs::path current(currentDir);
    for (int i = 0; i < 5; i++) {
        current = current.parent_path();
        if (!current.empty()) {
            possibleRoots.push_back(current.string());
        }
    }

    for (const auto& root : possibleRoots) {
        if (fs::exists(root + "/data") &&
            fs::exists(root + "/include") &&
            fs::exists(root + "/src")) {
            return fs::absolute(fs::path(root)).lexically_normal().string();
        }
    }

    return fs::absolute(fs::path(currentDir)).lexically_normal().string();
}

std::string getOutputPath(const std::string& filename) {
    fs::path outputDir = fs::path(getProjectRoot()) / "data" / "output";

    if (!ensureDirectoryExists(outputDir.string())) {
        crn::Logger::getInstance().warning("FileUtils::getOutputPath",
                                           "Could not create output directory: " + outputDir.string());
    }

    if (filename.empty()) {
        return outputDir.lexically_normal().string();
    }
    return (outputDir / filename).lexically_normal().string();
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if (path2.empty()) {
        return path1;
    }
    std::string rel = path2;
    if (rel[0] == '/') {
        rel = rel.substr(1);
    }
    fs::path p = fs::path(path1) / fs::path(rel);
    return p.lexically_normal().string();
}

std::string resolveRelativeTo(const std::string& referencing_file, const std::string& path) {
    fs::path target(path);
    if (target.is_absolute()) {
        return target.lexically_normal().string();
    }
    return (fs::path(referencing_file).parent_path() / target).lexically_normal().string();
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace FileUtils
