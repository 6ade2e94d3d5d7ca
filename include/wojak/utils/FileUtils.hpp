#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wojak {
namespace utils {

class FileUtils {
public:
    static bool fileExists(const std::string& path);

    static bool createDirectory(const std::string& path);

    /// Lower-case extension including the dot, empty if none
    static std::string getFileExtension(const std::string& filename);

    static std::string getStem(const std::string& filename);

    /**
     * @brief Read a whole file
     * @throws core::FileException if the file cannot be opened or read
     */
    static std::vector<uint8_t> readBytes(const std::string& path);

    /**
     * @brief Write bytes, replacing the file
     * @throws core::FileException on failure
     */
    static void writeBytes(const std::string& path, const std::vector<uint8_t>& bytes);

    /**
     * @brief Regular files in a directory, sorted by file name
     */
    static std::vector<std::string> listFiles(const std::string& directory);
};

} // namespace utils
} // namespace wojak
