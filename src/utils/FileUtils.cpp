#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace dissim {
namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    try {
        if (!fs::exists(path)) {
            return fs::create_directories(path);
        }
        return fs::is_directory(path);
    } catch (const fs::filesystem_error& e) {
        Logger::getInstance().error("FileUtils::ensureDirectoryExists", std::string("Error creating directory: ") + e.what());
        return false;
    }
}

bool ensureParentDirectoryExists(const std::string& filePath) {
    fs::path parent = fs::path(filePath).parent_path();
    if (parent.empty()) {
        return true;
    }
    return ensureDirectoryExists(parent.string());
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if(path2.empty()){
        return path1;
    }
    std::string rel = path2;
    if (!rel.empty() && rel[0] == '/') {
        rel = rel.substr(1);
    }
    fs::path p = fs::path(path1) / fs::path(rel);
    return p.lexically_normal().string();
}

std::string getFileStem(const std::string& path) {
    return fs::path(path).stem().string();
}

std::string getFileExtension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace FileUtils
} // namespace dissim
