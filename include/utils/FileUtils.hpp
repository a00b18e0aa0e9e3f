#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

/**
 * @namespace FileUtils
 * @brief Path helpers for locating input files and the output directory.
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Locates and returns the project root directory.
     * @details Walks up from the working directory looking for one that holds
     * data, include, and src; falls back to the working directory.
     * @return Path to the project root directory as a string
     */
    std::string getProjectRoot();

    /**
     * @brief Constructs a path inside data/output, creating the directory if needed.
     * @param filename [in] Optional filename to append (empty by default)
     * @return Full path to the output directory or file as a string
     */
    std::string getOutputPath(const std::string& filename = "");

    /**
     * @brief Joins two path segments using the proper path separator.
     * @param path1 [in] First path segment
     * @param path2 [in] Second path segment
     * @return Combined path as a string
     */
    std::string joinPaths(const std::string& path1, const std::string& path2);

    /**
     * @brief Resolves a path named inside a file relative to that file's directory.
     * @details Absolute paths are returned unchanged.
     * @param referencing_file [in] File in which `path` appears
     * @param path [in] Path to resolve
     * @return Resolved path
     */
    std::string resolveRelativeTo(const std::string& referencing_file, const std::string& path);

    /**
     * @brief Strips leading and trailing whitespace.
     */
    std::string trim(const std::string& text);
}

#endif
