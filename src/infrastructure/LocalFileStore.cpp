/**
 * @file LocalFileStore.cpp
 * @brief Implementation of the LocalFileStore class.
 */
#include "infrastructure/LocalFileStore.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace kindlesender::infrastructure {

std::vector<std::string> LocalFileStore::listFiles(const std::string& directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw std::runtime_error("Error reading directory " + directory + ": " + ec.message());
    }

    std::vector<fs::path> paths;
    for (const auto& entry : it) {
        std::error_code typeEc;
        if (entry.is_regular_file(typeEc)) {
            paths.push_back(entry.path());
        }
    }
    std::sort(paths.begin(), paths.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    std::vector<std::string> files;
    files.reserve(paths.size());
    for (const auto& p : paths) {
        files.push_back(p.string());
    }
    return files;
}

void LocalFileStore::moveToDirectory(const std::string& filePath, const std::string& directory) {
    fs::path source(filePath);
    fs::path filename = source.filename();
    if (filename.empty()) {
        throw std::runtime_error("Invalid source path: no filename in " + filePath);
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create destination directory " + directory + ": " + ec.message());
    }

    fs::path destination = fs::path(directory) / filename;
    if (fs::exists(destination, ec)) {
        throw std::runtime_error("Destination already exists: " + destination.string());
    }

    fs::rename(source, destination, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw std::runtime_error("Failed to move file from " + source.string() + " to " + destination.string() + ": " + ec.message());
    }

    // Different filesystem: copy then remove the original.
    fs::copy_file(source, destination, fs::copy_options::none, ec);
    if (ec) {
        throw std::runtime_error("Failed to copy file from " + source.string() + " to " + destination.string() + ": " + ec.message());
    }
    fs::remove(source, ec);
    if (ec) {
        throw std::runtime_error("Copied " + source.string() + " but could not remove it: " + ec.message());
    }
}

} // namespace kindlesender::infrastructure
