#include "wojak/utils/FileUtils.hpp"
#include "wojak/core/Exception.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace wojak {
namespace utils {

bool FileUtils::fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::createDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::string FileUtils::getFileExtension(const std::string& filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FileUtils::getStem(const std::string& filename) {
    return std::filesystem::path(filename).stem().string();
}

std::vector<uint8_t> FileUtils::readBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                    "Cannot open file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_IO,
                    "Error reading file: " + path);
    }
    return bytes;
}

void FileUtils::writeBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_IO,
                    "Cannot open file for writing: " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out.good()) {
        WOJAK_THROW(core::FileException, core::ResultCode::ERROR_FILE_IO,
                    "Error writing file: " + path);
    }
}

std::vector<std::string> FileUtils::listFiles(const std::string& directory) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end(), [](const std::string& a, const std::string& b) {
        return std::filesystem::path(a).filename() < std::filesystem::path(b).filename();
    });
    return files;
}

} // namespace utils
} // namespace wojak
