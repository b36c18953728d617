// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mpupload_file_sink.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

#include "mpupload_upload_context.hpp"

namespace mpupload {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

typedef boost::log::attributes::current_thread_id::value_type thread_id_type;

std::string escape_json(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          // Remaining control characters use the \u00XX form.
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  return out;
}

namespace {

// Emits ,"field":"value" when the record carries the string attribute.
void json_string_field(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, const char* attr,
  const char* field
) {
  if (auto value = boost::log::extract<std::string>(attr, rec)) {
    strm << ",\"" << field << "\":\"" << escape_json(*value) << "\"";
  }
}

/**
 * One JSON object per line:
 * {"ts":..,"level":..,"thread":..,"msg":..,"bucket":..,"key":..,"upload_id":..,"part":N}
 * Upload fields appear only on records logged inside an upload. "part" is a
 * number so log tooling can sort a session's records by part.
 */
void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "\",\"level\":\"";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << *sev;
  }
  strm << "\"";
  if (auto tid = boost::log::extract<thread_id_type>("ThreadID", rec)) {
    strm << ",\"thread\":\"" << *tid << "\"";
  }
  strm << ",\"msg\":\"" << escape_json(rec[expr::smessage].get()) << "\"";

  json_string_field(rec, strm, kBucketAttr, "bucket");
  json_string_field(rec, strm, kObjectKeyAttr, "key");
  json_string_field(rec, strm, kUploadIdAttr, "upload_id");
  if (auto part = boost::log::extract<int>(kPartNumberAttr, rec)) {
    strm << ",\"part\":" << *part;
  }
  strm << "}";
}

// [ts] [level] [thread] message | bucket=.. key=.. upload_id=.. part=..
void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "[";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "] ";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << "[" << *sev << "] ";
  }
  if (auto tid = boost::log::extract<thread_id_type>("ThreadID", rec)) {
    strm << "[" << *tid << "] ";
  }
  strm << rec[expr::smessage];
  append_upload_context(rec, strm);
}

// The configured directory, or /tmp when it cannot be created. Logging is
// not up yet at this point, so the fallback is reported on stderr.
std::string resolve_log_directory(const std::string& requested) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(requested, ec);
  if (!ec) {
    return requested;
  }
  std::cerr << "[mpupload_logging] Cannot create log directory '" << requested
            << "': " << ec.message() << ", writing upload logs to /tmp\n";
  return "/tmp";
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string directory = resolve_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  // Keep at most max_files rotated logs from earlier runs.
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&json_formatter);
  } else {
    sink->set_formatter(&text_formatter);
  }
  return sink;
}

}  // namespace logging
}  // namespace mpupload
