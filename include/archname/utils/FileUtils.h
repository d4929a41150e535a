#ifndef ARCHNAME_FILE_UTILS_H
#define ARCHNAME_FILE_UTILS_H

#include <filesystem>
#include <string>
#include <vector>

namespace arn {

/**
 * File utility functions
 */
class FileUtils {
public:
    /**
     * Read entire file into a string
     * @throws FileNotFoundException if the file does not exist
     * @throws ReadException if it cannot be read
     */
    static std::string readTextFile(const std::filesystem::path& path);

    /**
     * Write a string to a file, replacing its content
     * @throws WriteException on failure
     */
    static void writeTextFile(const std::filesystem::path& path, const std::string& content);

    /**
     * Read a file as lines without line terminators (LF or CRLF)
     */
    static std::vector<std::string> readLines(const std::filesystem::path& path);

    /**
     * Get file extension in lowercase
     */
    static std::string getExtension(const std::filesystem::path& path);

    /**
     * Check if path has a specific extension (case-insensitive)
     */
    static bool hasExtension(const std::filesystem::path& path, const std::string& ext);

    /**
     * Stems of the regular files in a directory
     * @throws FileNotFoundException if the directory does not exist
     */
    static std::vector<std::string> listStems(const std::filesystem::path& directory);

    /**
     * Create parent directories if they don't exist
     */
    static void ensureParentExists(const std::filesystem::path& path);
};

} // namespace arn

#endif // ARCHNAME_FILE_UTILS_H
