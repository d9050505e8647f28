#ifndef FERRY_FILE_SINK_HPP
#define FERRY_FILE_SINK_HPP

#include "ferry_log_severity.hpp"

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

namespace ferry {
namespace logging {

/**
 * Async file sink with bounded queue.
 * Larger queue than the console sink since file I/O is slower.
 */
typedef boost::log::sinks::asynchronous_sink<
    boost::log::sinks::text_file_backend,
    boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
    async_file_sink_t;

struct FileSinkConfig {
    std::string directory = "/var/log/ferry";
    std::string file_pattern = "ferry_%Y%m%d_%H%M%S.log";
    uint64_t rotation_size_mb = 100;
    bool rotate_at_midnight = true;
    int max_files = 10;
    bool format_json = true;  // one JSON object per line
};

/**
 * Create a rotating file sink.
 * Files rotate by size and optionally at midnight; the collector keeps at
 * most max_files rotated files in the directory.
 *
 * @throws boost::filesystem::filesystem_error if the directory cannot be created
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
    const FileSinkConfig& config, severity_level min_level = severity_level::debug);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_FILE_SINK_HPP
