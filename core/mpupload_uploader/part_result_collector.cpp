// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_result_collector.hpp"

#include <utility>

namespace mpupload {
namespace uploader {

PartResultCollector::PartResultCollector(size_t producers)
    : active_producers_(producers) {}

void PartResultCollector::push(PartResult result) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(std::move(result));
  }
  cv_.notify_one();
}

void PartResultCollector::producerDone() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_producers_ > 0) {
      --active_producers_;
    }
  }
  cv_.notify_all();
}

std::optional<PartResult> PartResultCollector::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !results_.empty() || active_producers_ == 0; });

  if (results_.empty()) {
    return std::nullopt;
  }
  PartResult result = std::move(results_.front());
  results_.pop_front();
  return result;
}

void PartResultCollector::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = true;
}

bool PartResultCollector::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

}  // namespace uploader
}  // namespace mpupload
