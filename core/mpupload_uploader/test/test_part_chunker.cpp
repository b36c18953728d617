// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for the part chunker
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "part_chunker.hpp"

using namespace mpupload::uploader;

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;

// Parts must tile [0, file_size) with no gaps or overlaps, numbered 1..n.
void expectContiguousPartition(const std::vector<Part>& parts, uint64_t file_size) {
  uint64_t expected_offset = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    EXPECT_EQ(parts[i].number, static_cast<int>(i + 1));
    EXPECT_EQ(parts[i].offset, expected_offset);
    EXPECT_GT(parts[i].length, 0u);
    expected_offset += parts[i].length;
  }
  EXPECT_EQ(expected_offset, file_size);
}

}  // namespace

TEST(PartChunkerTest, ThreePartsWithRemainder) {
  const auto parts = splitIntoParts(20000000, 8388608);

  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], (Part{1, 0, 8388608}));
  EXPECT_EQ(parts[1], (Part{2, 8388608, 8388608}));
  EXPECT_EQ(parts[2], (Part{3, 16777216, 3222784}));
}

TEST(PartChunkerTest, ExactMultiple) {
  const auto parts = splitIntoParts(16 * kMiB, 8 * kMiB);

  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[1].length, 8 * kMiB);
  expectContiguousPartition(parts, 16 * kMiB);
}

TEST(PartChunkerTest, FileSmallerThanPartSize) {
  const auto parts = splitIntoParts(100, 8 * kMiB);

  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0], (Part{1, 0, 100}));
}

TEST(PartChunkerTest, OneByteParts) {
  const auto parts = splitIntoParts(5, 1);

  ASSERT_EQ(parts.size(), 5u);
  expectContiguousPartition(parts, 5);
  EXPECT_EQ(parts[4], (Part{5, 4, 1}));
}

TEST(PartChunkerTest, EmptyFileYieldsNoParts) {
  EXPECT_TRUE(splitIntoParts(0, 8 * kMiB).empty());
  EXPECT_EQ(partCount(0, 8 * kMiB), 0u);
}

TEST(PartChunkerTest, PartCountIsCeiling) {
  EXPECT_EQ(partCount(1, 8 * kMiB), 1u);
  EXPECT_EQ(partCount(8 * kMiB, 8 * kMiB), 1u);
  EXPECT_EQ(partCount(8 * kMiB + 1, 8 * kMiB), 2u);
  EXPECT_EQ(partCount(20000000, 8388608), 3u);
}

TEST(PartChunkerTest, PartitionIsCompleteForAssortedSizes) {
  const uint64_t sizes[] = {1, 7, 4095, 4096, 4097, 1000003};
  const uint64_t part_sizes[] = {1, 3, 4096, 65536};

  for (uint64_t file_size : sizes) {
    for (uint64_t part_size : part_sizes) {
      SCOPED_TRACE("file_size=" + std::to_string(file_size) +
                   " part_size=" + std::to_string(part_size));
      const auto parts = splitIntoParts(file_size, part_size);
      EXPECT_EQ(parts.size(), partCount(file_size, part_size));
      expectContiguousPartition(parts, file_size);
      for (size_t i = 0; i + 1 < parts.size(); ++i) {
        EXPECT_EQ(parts[i].length, part_size);
      }
    }
  }
}

TEST(PartChunkerTest, ZeroPartSizeThrows) {
  EXPECT_THROW(splitIntoParts(100, 0), std::invalid_argument);
  EXPECT_THROW(partCount(100, 0), std::invalid_argument);
}

TEST(PartChunkerTest, PartNumberOverflowThrows) {
  // 2^32 one-byte parts cannot be numbered with an int.
  EXPECT_THROW(splitIntoParts(uint64_t{1} << 32, 1), std::length_error);
  EXPECT_EQ(partCount(uint64_t{1} << 32, 1), uint64_t{1} << 32);
}
