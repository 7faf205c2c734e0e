/**
 * @file BatchOutcome.hpp
 * @brief Result of one delivery run.
 */

#pragma once
#include <string>
#include <vector>

namespace kindlesender::domain {

/**
 * @enum FileStatus
 * @brief Which step decided the fate of a file.
 */
enum class FileStatus {
    Sent,            ///< Gateway accepted the email and the file was relocated.
    SendFailed,      ///< Nothing was delivered; the file stays in the source directory.
    RelocationFailed ///< Email went out but the file could not be moved; a rerun would send it again.
};

/**
 * @struct FileOutcome
 * @brief What happened to a single pending file.
 */
struct FileOutcome {
    std::string path;
    std::string filename;
    FileStatus status = FileStatus::SendFailed;
    std::string detail; ///< Error message for failures, empty for Sent.
};

/**
 * @struct BatchOutcome
 * @brief Aggregate of a run. A run is failed as soon as one file failed.
 */
struct BatchOutcome {
    int successCount = 0;
    int failureCount = 0;
    std::vector<FileOutcome> files; ///< In processing order.

    bool succeeded() const { return failureCount == 0; }

    int countWithStatus(FileStatus status) const {
        int n = 0;
        for (const auto& f : files) {
            if (f.status == status) ++n;
        }
        return n;
    }
};

inline const char* ToString(FileStatus status) {
    switch (status) {
        case FileStatus::Sent: return "sent";
        case FileStatus::SendFailed: return "send failed";
        case FileStatus::RelocationFailed: return "sent, relocation failed";
    }
    return "unknown";
}

} // namespace kindlesender::domain
