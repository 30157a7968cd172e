//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file section_lines.hpp
 * @brief Contains the decoder of the DEBUG_S_LINES subsection: blocks of bit-packed line number
 * records, optional column records, and the flattened LineIterator over a whole module.
 */

#ifndef CVDEBUG_SECTION_LINES_H_
#define CVDEBUG_SECTION_LINES_H_

#include <cstdint>
#include <optional>
#include <variant>

#include "codeview_types.hpp"
#include "debug_subsection.hpp"
#include "parse_buffer.hpp"

namespace cvdebug {

struct DebugLinesHeader {
  /// Section offset of this line contribution.
  SectionOffset offset;
  /// CV_LINES_HAVE_COLUMNS and reserved bits.
  uint16_t flags = 0;
  /// Code size of this line contribution.
  uint32_t code_size = 0;

  inline bool HasColumns() const { return (flags & CV_LINES_HAVE_COLUMNS) != 0; }

  static DebugLinesHeader Parse(ParseBuffer& buf);
};

enum class LineMarkerKind {
  /// A debugger should skip this address.
  kDoNotStepOnto,
  /// A debugger should not step into this address.
  kDoNotStepInto,
};

struct LineNumberEntry {
  /// Delta offset to the start of this line contribution.
  uint32_t offset;
  uint32_t start_line;
  uint32_t end_line;
  LineInfoKind kind;
};

struct LineMarkerEntry {
  uint32_t offset;
  LineMarkerKind kind;
};

using LineEntry = std::variant<LineNumberEntry, LineMarkerEntry>;

/**
 * @brief Raw line number record:
 *   unsigned long linenumStart:24;  // line where statement/expression starts
 *   unsigned long deltaLineEnd:7;   // delta to line where statement ends (optional)
 *   unsigned long fStatement  :1;   // true if a statement line number, else an expression
 */
struct LineNumberHeader {
  uint32_t offset;
  uint32_t flags;

  LineEntry Decode() const;

  static LineNumberHeader Parse(ParseBuffer& buf);
};

struct ColumnNumberEntry {
  uint16_t start_column;
  uint16_t end_column;

  static ColumnNumberEntry Parse(ParseBuffer& buf);
};

struct DebugLinesBlockHeader {
  /// Offset of the file checksum in the file checksums debug subsection.
  uint32_t file_index = 0;
  /// Number of line entries, and of column entries if the subsection has columns.
  uint32_t num_lines = 0;
  /// Total byte size of this block, including the header and all entries.
  uint32_t block_size = 0;

  inline uint64_t LineSize() const {
    return static_cast<uint64_t>(num_lines) * kLineNumberRecordSize;
  }
  inline uint64_t ColumnSize(const DebugLinesHeader& subsection) const {
    return subsection.HasColumns() ? static_cast<uint64_t>(num_lines) * kColumnNumberRecordSize
                                   : 0;
  }

  static DebugLinesBlockHeader Parse(ParseBuffer& buf);
};

class DebugLinesIterator {
 public:
  DebugLinesIterator() = default;
  explicit DebugLinesIterator(ByteSpan data) : buf_(data) {}

  std::optional<LineEntry> Next();

 private:
  ParseBuffer buf_;
};

class DebugColumnsIterator {
 public:
  DebugColumnsIterator() = default;
  explicit DebugColumnsIterator(ByteSpan data) : buf_(data) {}

  std::optional<ColumnNumberEntry> Next();

 private:
  ParseBuffer buf_;
};

struct DebugLinesBlock {
  DebugLinesBlockHeader header;
  ByteSpan line_data;
  ByteSpan column_data;

  inline FileIndex GetFileIndex() const { return FileIndex{header.file_index}; }
  inline DebugLinesIterator Lines() const { return DebugLinesIterator(line_data); }
  inline DebugColumnsIterator Columns() const { return DebugColumnsIterator(column_data); }
};

class DebugLinesBlockIterator {
 public:
  DebugLinesBlockIterator() = default;
  DebugLinesBlockIterator(const DebugLinesHeader& header, ByteSpan data)
      : header_(header), buf_(data) {}

  std::optional<DebugLinesBlock> Next();

  inline const DebugLinesHeader& GetHeader() const { return header_; }

 private:
  DebugLinesHeader header_;
  ParseBuffer buf_;
};

class DebugLinesSubsection {
 public:
  static DebugLinesSubsection Parse(ByteSpan data);

  inline const DebugLinesHeader& GetHeader() const { return header_; }
  inline DebugLinesBlockIterator Blocks() const { return DebugLinesBlockIterator(header_, data_); }

 private:
  DebugLinesHeader header_;
  ByteSpan data_;
};

/**
 * @brief Walks subsections, blocks, line records and column records of a module and returns one
 * LineInfo per line number record. Markers are skipped, length is never known at this level.
 */
class LineIterator {
 public:
  LineIterator() = default;
  /// @brief Iterates all DEBUG_S_LINES subsections of the module data
  explicit LineIterator(ByteSpan module_data) : sections_(module_data) {}
  /// @brief Iterates the blocks of a single lines subsection
  explicit LineIterator(const DebugLinesSubsection& lines) : blocks_(lines.Blocks()) {}

  std::optional<LineInfo> Next();

 private:
  DebugSubsectionIterator sections_;
  DebugLinesBlockIterator blocks_;
  DebugLinesBlockHeader block_header_;
  DebugLinesIterator lines_;
  DebugColumnsIterator columns_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_SECTION_LINES_H_
