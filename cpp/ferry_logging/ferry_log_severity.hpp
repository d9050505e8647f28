#ifndef FERRY_LOG_SEVERITY_HPP
#define FERRY_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <ostream>
#include <string>

namespace ferry {
namespace logging {

/**
 * Severity levels for ferry logging.
 * FATAL is reserved for conditions the process cannot continue from.
 */
enum class severity_level {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3,
    fatal = 4
};

inline const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::debug: return "DEBUG";
        case severity_level::info: return "INFO";
        case severity_level::warn: return "WARN";
        case severity_level::error: return "ERROR";
        case severity_level::fatal: return "FATAL";
    }
    return nullptr;
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
    const char* name = to_string(level);
    if (name) {
        strm << name;
    } else {
        strm << static_cast<int>(level);
    }
    return strm;
}

/**
 * Parse a level name ("debug", "info", "warn"/"warning", "error", "fatal").
 * Matching is case-insensitive; surrounding whitespace is not accepted.
 */
inline std::optional<severity_level> parse_severity_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return severity_level::debug;
    if (lower == "info") return severity_level::info;
    if (lower == "warn" || lower == "warning") return severity_level::warn;
    if (lower == "error") return severity_level::error;
    if (lower == "fatal") return severity_level::fatal;
    return std::nullopt;
}

// Boost.Log keyword for severity filtering
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_SEVERITY_HPP
