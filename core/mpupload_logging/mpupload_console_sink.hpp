// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_CONSOLE_SINK_HPP
#define MPUPLOAD_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "mpupload_log_severity.hpp"

namespace mpupload {
namespace logging {

// Up to eight workers log per part. Past 1000 queued records the terminal is
// behind and records are dropped rather than stalling a part upload.
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Sink writing to std::clog, leaving std::cout to the tool's progress and
 * result output. Lines read "HH:MM:SS.ffffff LEVEL message | upload context".
 *
 * @param min_level Records below this level are filtered out
 * @param use_colors Colour the level with ANSI escapes
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

/**
 * ANSI escape used for a level; empty for levels outside the enum.
 */
const char* severity_color(severity_level level);

}  // namespace logging
}  // namespace mpupload

#endif  // MPUPLOAD_CONSOLE_SINK_HPP
