// Interlink - String Utilities
// String manipulation and formatting

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace interlink::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toUpper(const std::string& str);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatDuration(std::chrono::seconds duration);
    static std::string formatPercentage(double value, int precision = 1);

    // Parsing
    static int parseInt(const std::string& str, int defaultValue = 0);

    /**
     * @brief Trim each tag, drop empty ones and duplicates (first occurrence wins)
     */
    static std::vector<std::string> normalizeTags(const std::vector<std::string>& tags);
};

} // namespace interlink::utils
