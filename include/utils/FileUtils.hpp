#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>

namespace dissim {

/**
 * @namespace FileUtils
 * @brief Path and directory helpers for reading graphs and writing results.
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Creates the directory that will contain @p filePath, if any.
     * @param filePath [in] Path of a file about to be written
     * @return true if the parent directory exists afterwards (or the path has none)
     */
    bool ensureParentDirectoryExists(const std::string& filePath);

    /**
     * @brief Joins two path segments using the proper path separator.
     * @param path1 [in] First path segment
     * @param path2 [in] Second path segment
     * @return Combined path as a string
     */
    std::string joinPaths(const std::string& path1, const std::string& path2);

    /**
     * @brief File name without directory and last extension ("data/karate.gml" -> "karate").
     */
    std::string getFileStem(const std::string& path);

    /**
     * @brief Lower-case extension without the dot ("net.GML" -> "gml"); empty if none.
     */
    std::string getFileExtension(const std::string& path);
}

} // namespace dissim

#endif
