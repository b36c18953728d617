// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_chunker.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace mpupload {
namespace uploader {

uint64_t partCount(uint64_t file_size, uint64_t part_size) {
  if (part_size == 0) {
    throw std::invalid_argument("part_size must be greater than zero");
  }
  return file_size / part_size + (file_size % part_size != 0 ? 1 : 0);
}

std::vector<Part> splitIntoParts(uint64_t file_size, uint64_t part_size) {
  const uint64_t count = partCount(file_size, part_size);
  if (count > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    throw std::length_error(
      "file of " + std::to_string(file_size) + " bytes needs " + std::to_string(count) +
      " parts, more than a part number can hold"
    );
  }

  std::vector<Part> parts;
  parts.reserve(static_cast<size_t>(count));

  uint64_t offset = 0;
  for (uint64_t i = 0; i < count; ++i) {
    Part part;
    part.number = static_cast<int>(i + 1);
    part.offset = offset;
    part.length = std::min(part_size, file_size - offset);
    parts.push_back(part);
    offset += part.length;
  }
  return parts;
}

}  // namespace uploader
}  // namespace mpupload
