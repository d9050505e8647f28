#ifndef FERRY_CONSOLE_SINK_HPP
#define FERRY_CONSOLE_SINK_HPP

#include "ferry_log_severity.hpp"

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

namespace ferry {
namespace logging {

/**
 * Async console sink writing to stderr.
 * Records are dropped rather than blocking a transfer when the queue is full.
 */
typedef boost::log::sinks::asynchronous_sink<
    boost::log::sinks::text_ostream_backend,
    boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
    async_console_sink_t;

/**
 * Create the console sink.
 *
 * @param min_level Minimum severity written
 * @param use_colors Wrap the severity tag in ANSI colour codes
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
    severity_level min_level = severity_level::info, bool use_colors = true);

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_CONSOLE_SINK_HPP
