#ifndef FERRY_LOG_MACROS_HPP
#define FERRY_LOG_MACROS_HPP

#include "ferry_log_severity.hpp"

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

namespace ferry {
namespace logging {

// Thread-safe severity logger shared by every component
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Global logger instance. Defined in ferry_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Structured " key=value" field for the stream macros.
 * Usage: FERRY_LOG_INFO("part done" << kv("part", n));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
    std::ostringstream oss;
    oss << " " << name << "=" << value;
    return oss.str();
}

// Strings are quoted so values with spaces stay readable
template<>
inline std::string kv(const char* name, const std::string& value) {
    std::ostringstream oss;
    oss << " " << name << "=\"" << value << "\"";
    return oss.str();
}

inline std::string kv(const char* name, const char* value) {
    return kv(name, std::string(value ? value : ""));
}

namespace detail {

/**
 * Per call-site state for the _THROTTLE macros.
 */
class ThrottleGate {
public:
    explicit ThrottleGate(double interval_sec)
        : interval_(interval_sec) {}

    bool allow() {
        auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_ || now - last_ >= interval_) {
            armed_ = true;
            last_ = now;
            return true;
        }
        return false;
    }

private:
    std::chrono::duration<double> interval_;
    std::chrono::steady_clock::time_point last_{};
    bool armed_ = false;
    std::mutex mutex_;
};

}  // namespace detail

}  // namespace logging
}  // namespace ferry

// Define FERRY_LOG_COMPONENT before including this header in each compilation unit.
#ifndef FERRY_LOG_COMPONENT
#define FERRY_LOG_COMPONENT "ferry"
#endif

#ifdef NDEBUG
#define FERRY_LOG_ENABLE_DEBUG 0
#else
#define FERRY_LOG_ENABLE_DEBUG 1
#endif

#define FERRY_LOG_SEV_(level, msg) \
    do { \
        BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::level) \
            << "[" << FERRY_LOG_COMPONENT << "] " << msg; \
    } while (0)

#define FERRY_LOG_DEBUG(msg) \
    do { \
        if (FERRY_LOG_ENABLE_DEBUG) { \
            FERRY_LOG_SEV_(debug, msg); \
        } \
    } while (0)

#define FERRY_LOG_INFO(msg) FERRY_LOG_SEV_(info, msg)
#define FERRY_LOG_WARN(msg) FERRY_LOG_SEV_(warn, msg)
#define FERRY_LOG_ERROR(msg) FERRY_LOG_SEV_(error, msg)
#define FERRY_LOG_FATAL(msg) FERRY_LOG_SEV_(fatal, msg)

// Log the 1st, (n+1)th, (2n+1)th... occurrence at a call site.
#define FERRY_LOG_EVERY_N_(macro, n, msg) \
    do { \
        static std::atomic<std::uint64_t> _ferry_log_counter{0}; \
        if ((++_ferry_log_counter % (n)) == 1 || (n) == 1) { \
            macro(msg); \
        } \
    } while (0)

#define FERRY_LOG_DEBUG_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_DEBUG, n, msg)
#define FERRY_LOG_INFO_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_INFO, n, msg)
#define FERRY_LOG_WARN_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_WARN, n, msg)
#define FERRY_LOG_ERROR_EVERY_N(n, msg) FERRY_LOG_EVERY_N_(FERRY_LOG_ERROR, n, msg)

// Log at most once per interval_sec at a call site.
#define FERRY_LOG_THROTTLE_(macro, interval_sec, msg) \
    do { \
        static ::ferry::logging::detail::ThrottleGate _ferry_log_gate(interval_sec); \
        if (_ferry_log_gate.allow()) { \
            macro(msg); \
        } \
    } while (0)

#define FERRY_LOG_DEBUG_THROTTLE(s, msg) FERRY_LOG_THROTTLE_(FERRY_LOG_DEBUG, s, msg)
#define FERRY_LOG_INFO_THROTTLE(s, msg) FERRY_LOG_THROTTLE_(FERRY_LOG_INFO, s, msg)
#define FERRY_LOG_WARN_THROTTLE(s, msg) FERRY_LOG_THROTTLE_(FERRY_LOG_WARN, s, msg)
#define FERRY_LOG_ERROR_THROTTLE(s, msg) FERRY_LOG_THROTTLE_(FERRY_LOG_ERROR, s, msg)

#endif  // FERRY_LOG_MACROS_HPP
