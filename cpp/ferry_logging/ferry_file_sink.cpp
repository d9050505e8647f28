#include "ferry_file_sink.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/make_shared.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace ferry {
namespace logging {

namespace {

std::string timestamp_of(const boost::log::record_view& rec) {
    auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
    return ts ? boost::posix_time::to_iso_extended_string(ts.get()) : std::string();
}

std::string thread_of(const boost::log::record_view& rec) {
    auto tid = boost::log::extract<boost::log::attributes::current_thread_id::value_type>(
        "ThreadID", rec);
    if (!tid) {
        return std::string();
    }
    std::ostringstream oss;
    oss << tid.get();
    return oss.str();
}

std::string level_of(const boost::log::record_view& rec) {
    auto level = boost::log::extract<severity_level>("Severity", rec);
    if (!level) {
        return std::string();
    }
    std::ostringstream oss;
    oss << level.get();
    return oss.str();
}

void format_json_record(const boost::log::record_view& rec,
                        boost::log::formatting_ostream& strm) {
    nlohmann::json line;
    line["ts"] = timestamp_of(rec);
    line["level"] = level_of(rec);
    line["thread"] = thread_of(rec);
    auto message = rec[boost::log::expressions::smessage];
    line["msg"] = message ? message.get() : std::string();
    strm << line.dump();
}

void format_text_record(const boost::log::record_view& rec,
                        boost::log::formatting_ostream& strm) {
    strm << timestamp_of(rec) << " [" << level_of(rec) << "] (" << thread_of(rec) << ") "
         << rec[boost::log::expressions::smessage];
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(const FileSinkConfig& config,
                                                      severity_level min_level) {
    namespace sinks = boost::log::sinks;
    namespace keywords = boost::log::keywords;

    boost::filesystem::path dir(config.directory);
    boost::filesystem::create_directories(dir);

    auto backend = boost::make_shared<sinks::text_file_backend>(
        keywords::file_name = (dir / config.file_pattern).string(),
        keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
        keywords::open_mode = std::ios_base::out | std::ios_base::app);

    if (config.rotate_at_midnight) {
        backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
    }
    backend->auto_flush(true);

    backend->set_file_collector(sinks::file::make_collector(
        keywords::target = dir.string(),
        keywords::max_files = static_cast<unsigned int>(std::max(1, config.max_files))));
    backend->scan_for_files();

    auto sink = boost::make_shared<async_file_sink_t>(backend);
    sink->set_filter(severity >= min_level);
    if (config.format_json) {
        sink->set_formatter(&format_json_record);
    } else {
        sink->set_formatter(&format_text_record);
    }
    return sink;
}

}  // namespace logging
}  // namespace ferry
