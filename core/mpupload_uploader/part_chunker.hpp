// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_PART_CHUNKER_HPP
#define MPUPLOAD_PART_CHUNKER_HPP

#include <cstdint>
#include <vector>

#include "upload_types.hpp"

namespace mpupload {
namespace uploader {

/**
 * Number of parts a file of file_size bytes splits into: ceil(file_size / part_size).
 *
 * @throws std::invalid_argument if part_size is 0
 */
uint64_t partCount(uint64_t file_size, uint64_t part_size);

/**
 * Partition [0, file_size) into contiguous parts of part_size bytes.
 *
 * Part i (1-based) starts at (i - 1) * part_size; the last part holds the
 * remainder. An empty file yields no parts.
 *
 * @throws std::invalid_argument if part_size is 0
 * @throws std::length_error if the part count does not fit a part number (int)
 */
std::vector<Part> splitIntoParts(uint64_t file_size, uint64_t part_size);

}  // namespace uploader
}  // namespace mpupload

#endif  // MPUPLOAD_PART_CHUNKER_HPP
