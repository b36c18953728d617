// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mpupload_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "mpupload_upload_context.hpp"

namespace mpupload {
namespace logging {

namespace {

constexpr const char* kResetColor = "\033[0m";

// Upload runs are short, so the date is left out of console lines.
void write_console_line(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << ts->time_of_day() << " ";
  }
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    if (use_colors) {
      strm << severity_color(*sev) << *sev << kResetColor << " ";
    } else {
      strm << *sev << " ";
    }
  }
  strm << rec[boost::log::expressions::smessage];
  append_upload_context(rec, strm);
}

}  // namespace

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[1;31m";  // bold red
  }
  return "";
}

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  // std::clog is static; the sink must not delete it.
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(
    [use_colors](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
      write_console_line(rec, strm, use_colors);
    }
  );
  return sink;
}

}  // namespace logging
}  // namespace mpupload
