// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_PART_RESULT_COLLECTOR_HPP
#define MPUPLOAD_PART_RESULT_COLLECTOR_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "upload_types.hpp"

namespace mpupload {
namespace uploader {

/**
 * Fan-in channel between part upload workers and the coordinating thread.
 *
 * Workers push results in completion order. The coordinator pops them in
 * arrival order and cancels the channel on the first failure, after which
 * workers stop taking new parts.
 *
 * Thread-safe: push()/producerDone()/cancel() may be called from any thread.
 */
class PartResultCollector {
public:
  /**
   * @param producers Number of workers that will call producerDone()
   */
  explicit PartResultCollector(size_t producers);

  PartResultCollector(const PartResultCollector&) = delete;
  PartResultCollector& operator=(const PartResultCollector&) = delete;

  void push(PartResult result);

  /**
   * Called exactly once by each worker when it exits.
   */
  void producerDone();

  /**
   * Block until a result is available.
   *
   * @return The next result, or std::nullopt once every producer is done
   *         and all pushed results have been consumed
   */
  std::optional<PartResult> next();

  /**
   * Ask workers not to dispatch further parts. In-flight parts still push.
   */
  void cancel();

  bool cancelled() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<PartResult> results_;
  size_t active_producers_;
  bool cancelled_ = false;
};

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_PART_RESULT_COLLECTOR_HPP
