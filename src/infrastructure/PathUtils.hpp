// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace kindlesender::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetHomeDir();
    static std::filesystem::path GetCredentialDir();
    static std::filesystem::path GetCredentialPath();
    static std::filesystem::path GetDefaultConfigPath();
};

} // namespace kindlesender::infrastructure
