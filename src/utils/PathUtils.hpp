#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace interlink::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getInterlinkPath() {
        return getAppDataPath() / "Interlink";
    }

    static fs::path getConfigPath() {
        return getInterlinkPath() / "config.json";
    }

    // Default root of the local object store
    static fs::path getStoragePath() {
        return getInterlinkPath() / "storage";
    }
};

} // namespace interlink::utils
