#ifndef FERRY_LOG_INIT_HPP
#define FERRY_LOG_INIT_HPP

#include "ferry_console_sink.hpp"
#include "ferry_file_sink.hpp"
#include "ferry_log_severity.hpp"

#include <boost/log/sinks/sink.hpp>

namespace ferry {
namespace logging {

struct LoggingConfig {
    // Console sink
    bool console_enabled = true;
    bool console_colors = true;
    severity_level console_level = severity_level::info;

    // File sink
    bool file_enabled = true;
    FileSinkConfig file_config;
    severity_level file_level = severity_level::debug;
};

/**
 * Apply FERRY_LOG_* environment overrides on top of a configuration.
 *
 * FERRY_LOG_LEVEL sets both sink levels; FERRY_LOG_CONSOLE_LEVEL and
 * FERRY_LOG_FILE_LEVEL refine them. FERRY_LOG_FILE_DIR, FERRY_LOG_FORMAT
 * (json|text), FERRY_LOG_FILE_ENABLED and FERRY_LOG_CONSOLE_ENABLED are
 * also honoured. Empty or unparsable values leave the field untouched.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install console and file sinks. A second call while initialized is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colours, file sink disabled.
 */
void init_logging_default();

/**
 * Replace the current sinks with ones built from a new configuration.
 */
void reconfigure_logging(const LoggingConfig& config);

/**
 * Stop async sink threads, drain their queues and detach every sink.
 */
void shutdown_logging();

bool is_logging_initialized();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_INIT_HPP
