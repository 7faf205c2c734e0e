/**
 * @file FileTokenStore.cpp
 * @brief Implementation of FileTokenStore.
 */

#include "infrastructure/FileTokenStore.hpp"
#include "infrastructure/CredentialJson.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace kindlesender::infrastructure {

namespace fs = std::filesystem;

FileTokenStore::FileTokenStore(fs::path path) : m_path(std::move(path)) {}

std::optional<domain::Credential> FileTokenStore::load() {
    std::error_code ec;
    if (!fs::exists(m_path, ec)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(m_path);
        if (!f.is_open()) {
            std::cerr << "[FileTokenStore] Cannot open " << m_path << ", ignoring stored credential." << std::endl;
            return std::nullopt;
        }
        nlohmann::json j;
        f >> j;
        return CredentialJson::FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[FileTokenStore] Ignoring unreadable credential file " << m_path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

void FileTokenStore::save(const domain::Credential& credential) {
    // Unique temp path: auth.json.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (m_path.has_parent_path() && !fs::exists(m_path.parent_path())) {
            fs::create_directories(m_path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw std::runtime_error(std::string("cannot create credential directory: ") + e.what());
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("cannot open temp file " + tempPath.string());
        }
        ofs << CredentialJson::ToJson(credential).dump(4);
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("write failed for " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::permissions(tempPath, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        std::cerr << "[FileTokenStore] Could not restrict permissions on " << tempPath << ": " << ec.message() << std::endl;
    }

    // 3. Atomic rename
    fs::rename(tempPath, m_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("cannot replace " + m_path.string() + ": " + ec.message());
    }
}

} // namespace kindlesender::infrastructure
