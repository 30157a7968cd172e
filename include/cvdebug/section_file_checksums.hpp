//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file section_file_checksums.hpp
 * @brief Decoder of the DEBUG_S_FILECHKSMS subsection.
 *
 * Other subsections refer to a file by the byte offset of its entry in this table, see
 * DebugFileChecksumsSubsection::EntriesAtOffset.
 */

#ifndef CVDEBUG_SECTION_FILE_CHECKSUMS_H_
#define CVDEBUG_SECTION_FILE_CHECKSUMS_H_

#include <cstdint>
#include <optional>

#include "codeview_types.hpp"
#include "parse_buffer.hpp"

namespace cvdebug {

/// @brief Throws Error(kUnimplementedFileChecksumKind) for values above kSha256
FileChecksumKind ParseFileChecksumKind(uint8_t value);

struct FileChecksumHeader {
  uint32_t name_offset;
  uint8_t checksum_size;
  uint8_t checksum_kind;

  static FileChecksumHeader Parse(ParseBuffer& buf);
};

struct FileChecksumEntry {
  StringRef name;
  FileChecksum checksum;
};

class DebugFileChecksumsIterator {
 public:
  DebugFileChecksumsIterator() = default;
  explicit DebugFileChecksumsIterator(ParseBuffer buf) : buf_(buf) {}

  std::optional<FileChecksumEntry> Next();

 private:
  ParseBuffer buf_;
};

class DebugFileChecksumsSubsection {
 public:
  DebugFileChecksumsSubsection() = default;
  explicit DebugFileChecksumsSubsection(ByteSpan data) : data_(data) {}

  inline DebugFileChecksumsIterator Entries() const { return EntriesAtOffset(FileIndex{0}); }

  /**
   * @brief Iterates entries starting at the given byte offset into the table.
   * Throws Error(kInvalidFileChecksumOffset) if the offset lies beyond the table.
   */
  DebugFileChecksumsIterator EntriesAtOffset(FileIndex offset) const;

  inline ByteSpan GetData() const { return data_; }

 private:
  ByteSpan data_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_SECTION_FILE_CHECKSUMS_H_
