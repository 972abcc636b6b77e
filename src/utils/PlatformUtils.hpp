// Interlink - Platform Utilities
// System queries used for transfer sizing

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace interlink::utils {

/**
 * @brief Platform-specific utilities
 */
class PlatformUtils {
public:
    // System info
    static int64_t getAvailableMemory();
    static int getCPUCores();

    // Environment
    static std::optional<std::string> getEnv(const std::string& name);
};

} // namespace interlink::utils
