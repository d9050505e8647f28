#include "ferry_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

namespace ferry {
namespace logging {

namespace {

const char* color_for(severity_level level) {
    switch (level) {
        case severity_level::debug: return "\033[36m";
        case severity_level::info: return "\033[32m";
        case severity_level::warn: return "\033[33m";
        case severity_level::error: return "\033[31m";
        case severity_level::fatal: return "\033[1;31m";
    }
    return "";
}

void format_console_record(bool use_colors, const boost::log::record_view& rec,
                           boost::log::formatting_ostream& strm) {
    auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
    if (ts) {
        strm << boost::posix_time::to_simple_string(ts.get()).substr(12) << " ";
    }

    auto level = boost::log::extract<severity_level>("Severity", rec);
    if (level) {
        if (use_colors) {
            strm << color_for(level.get()) << "[" << level.get() << "]\033[0m ";
        } else {
            strm << "[" << level.get() << "] ";
        }
    }

    strm << rec[boost::log::expressions::smessage];
}

}  // namespace

boost::shared_ptr<async_console_sink_t> create_console_sink(severity_level min_level,
                                                            bool use_colors) {
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<async_console_sink_t>(backend);
    sink->set_filter(severity >= min_level);
    sink->set_formatter(
        [use_colors](const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
            format_console_record(use_colors, rec, strm);
        });
    return sink;
}

}  // namespace logging
}  // namespace ferry
