#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace kindlesender::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetHomeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
#if defined(_WIN32)
    const char* userProfile = std::getenv("USERPROFILE");
    if (userProfile && *userProfile) {
        return fs::path(userProfile);
    }
#endif
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetCredentialDir() {
    return GetHomeDir() / ".kindle_sender";
}

fs::path PathUtils::GetCredentialPath() {
    return GetCredentialDir() / "auth.json";
}

fs::path PathUtils::GetDefaultConfigPath() {
    return fs::path("config.json");
}

} // namespace kindlesender::infrastructure
