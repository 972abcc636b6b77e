/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace interlink::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    if (parts.empty()) return "";
    std::string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) result += separator + parts[i];
    return result;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatDuration(std::chrono::seconds duration) {
    auto h = std::chrono::duration_cast<std::chrono::hours>(duration);
    auto m = std::chrono::duration_cast<std::chrono::minutes>(duration - h);
    auto s = duration - h - m;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h.count() << ":"
        << std::setfill('0') << std::setw(2) << m.count() << ":"
        << std::setfill('0') << std::setw(2) << s.count();
    return oss.str();
}

std::string StringUtils::formatPercentage(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (value * 100.0) << "%";
    return oss.str();
}

// -- Parsing --

int StringUtils::parseInt(const std::string& str, int defaultValue) {
    try {
        return std::stoi(str);
    } catch (const std::invalid_argument&) {
        return defaultValue;
    } catch (const std::out_of_range&) {
        return defaultValue;
    }
}

// -- Tags --

std::vector<std::string> StringUtils::normalizeTags(const std::vector<std::string>& tags) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& tag : tags) {
        auto trimmed = trim(tag);
        if (trimmed.empty() || !seen.insert(trimmed).second) {
            continue;
        }
        result.push_back(std::move(trimmed));
    }
    return result;
}

} // namespace interlink::utils
