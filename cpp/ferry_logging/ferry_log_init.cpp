#include "ferry_log_init.hpp"

#include "ferry_log_macros.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry {
namespace logging {

namespace {

std::mutex g_sinks_mutex;
std::vector<boost::shared_ptr<boost::log::sinks::sink>> g_sinks;
boost::shared_ptr<async_console_sink_t> g_console_sink;
boost::shared_ptr<async_file_sink_t> g_file_sink;
bool g_initialized = false;

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

void override_level(const char* name, severity_level& target) {
    if (auto value = env_value(name)) {
        if (auto level = parse_severity_level(*value)) {
            target = *level;
        }
    }
}

void override_flag(const char* name, bool& target) {
    if (auto value = env_value(name)) {
        if (auto flag = parse_bool(*value)) {
            target = *flag;
        }
    }
}

// Caller holds g_sinks_mutex
void init_locked(const LoggingConfig& config) {
    if (g_initialized) {
        return;
    }

    auto core = boost::log::core::get();
    boost::log::add_common_attributes();

    if (config.console_enabled) {
        g_console_sink = create_console_sink(config.console_level, config.console_colors);
        core->add_sink(g_console_sink);
        g_sinks.push_back(g_console_sink);
    }

    if (config.file_enabled) {
        g_file_sink = create_file_sink(config.file_config, config.file_level);
        core->add_sink(g_file_sink);
        g_sinks.push_back(g_file_sink);
    }

    g_initialized = true;
}

void shutdown_locked() {
    if (!g_initialized) {
        return;
    }

    auto core = boost::log::core::get();

    // Stopping drains the async queues before the sinks are detached
    if (g_console_sink) {
        g_console_sink->stop();
        g_console_sink->flush();
    }
    if (g_file_sink) {
        g_file_sink->stop();
        g_file_sink->flush();
    }

    for (auto& sink : g_sinks) {
        core->remove_sink(sink);
    }
    g_sinks.clear();
    g_console_sink.reset();
    g_file_sink.reset();

    g_initialized = false;
}

}  // namespace

logger_type& get_logger() {
    static logger_type instance;
    return instance;
}

void apply_env_overrides(LoggingConfig& config) {
    if (auto value = env_value("FERRY_LOG_LEVEL")) {
        if (auto level = parse_severity_level(*value)) {
            config.console_level = *level;
            config.file_level = *level;
        }
    }
    override_level("FERRY_LOG_CONSOLE_LEVEL", config.console_level);
    override_level("FERRY_LOG_FILE_LEVEL", config.file_level);

    if (auto dir = env_value("FERRY_LOG_FILE_DIR")) {
        config.file_config.directory = *dir;
    }

    if (auto format = env_value("FERRY_LOG_FORMAT")) {
        if (*format == "json") {
            config.file_config.format_json = true;
        } else if (*format == "text") {
            config.file_config.format_json = false;
        }
    }

    override_flag("FERRY_LOG_FILE_ENABLED", config.file_enabled);
    override_flag("FERRY_LOG_CONSOLE_ENABLED", config.console_enabled);
}

void init_logging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    init_locked(config);
}

void init_logging_default() {
    LoggingConfig config;
    config.file_enabled = false;
    init_logging(config);
}

void reconfigure_logging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    shutdown_locked();
    init_locked(config);
}

void shutdown_logging() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    shutdown_locked();
}

bool is_logging_initialized() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    return g_initialized;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    boost::log::core::get()->add_sink(sink);
    g_sinks.push_back(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    boost::log::core::get()->remove_sink(sink);

    auto it = std::find(g_sinks.begin(), g_sinks.end(), sink);
    if (it != g_sinks.end()) {
        g_sinks.erase(it);
    }
}

void flush_logging() {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    if (g_console_sink) {
        g_console_sink->flush();
    }
    if (g_file_sink) {
        g_file_sink->flush();
    }
}

}  // namespace logging
}  // namespace ferry
