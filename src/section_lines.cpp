//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/section_lines.hpp"

#include <spdlog/spdlog.h>

using namespace cvdebug;

DebugLinesHeader DebugLinesHeader::Parse(ParseBuffer& buf) {
  DebugLinesHeader header;
  header.offset.offset = buf.Parse<uint32_t>();
  header.offset.section = buf.Parse<uint16_t>();
  header.flags = buf.Parse<uint16_t>();
  header.code_size = buf.Parse<uint32_t>();
  return header;
}

LineNumberHeader LineNumberHeader::Parse(ParseBuffer& buf) {
  LineNumberHeader header;
  header.offset = buf.Parse<uint32_t>();
  header.flags = buf.Parse<uint32_t>();
  return header;
}

LineEntry LineNumberHeader::Decode() const {
  // The compiler generates special line numbers to hint the debugger. They are not line numbers.
  uint32_t start_line = flags & CV_LINE_START_MASK;
  switch (start_line) {
    case CV_LINE_DO_NOT_STEP_ONTO:
      return LineMarkerEntry{offset, LineMarkerKind::kDoNotStepOnto};
    case CV_LINE_DO_NOT_STEP_INTO:
      return LineMarkerEntry{offset, LineMarkerKind::kDoNotStepInto};
    default:
      break;
  }

  // Some producers store the truncated end line here instead of a delta. Take the high bits from
  // start_line and the low 7 bits from the record, which gives the end line in both cases.
  uint32_t line_delta = (flags >> CV_LINE_DELTA_SHIFT) & CV_LINE_DELTA_MASK;
  uint32_t end_line = (start_line & ~CV_LINE_DELTA_MASK) | line_delta;

  // The end line is assumed to be within 128 lines of the start line.
  if (end_line < start_line) {
    end_line += 1u << 7;
  }

  LineInfoKind kind =
      (flags & CV_LINE_STATEMENT_FLAG) ? LineInfoKind::kStatement : LineInfoKind::kExpression;

  return LineNumberEntry{offset, start_line, end_line, kind};
}

ColumnNumberEntry ColumnNumberEntry::Parse(ParseBuffer& buf) {
  ColumnNumberEntry entry;
  entry.start_column = buf.Parse<uint16_t>();
  entry.end_column = buf.Parse<uint16_t>();
  return entry;
}

DebugLinesBlockHeader DebugLinesBlockHeader::Parse(ParseBuffer& buf) {
  DebugLinesBlockHeader header;
  header.file_index = buf.Parse<uint32_t>();
  header.num_lines = buf.Parse<uint32_t>();
  header.block_size = buf.Parse<uint32_t>();
  return header;
}

std::optional<LineEntry> DebugLinesIterator::Next() {
  if (buf_.IsEmpty()) {
    return std::nullopt;
  }
  return LineNumberHeader::Parse(buf_).Decode();
}

std::optional<ColumnNumberEntry> DebugColumnsIterator::Next() {
  if (buf_.IsEmpty()) {
    return std::nullopt;
  }
  return ColumnNumberEntry::Parse(buf_);
}

std::optional<DebugLinesBlock> DebugLinesBlockIterator::Next() {
  if (buf_.IsEmpty()) {
    return std::nullopt;
  }

  auto header = DebugLinesBlockHeader::Parse(buf_);
  if (header.block_size < kDebugLinesBlockHeaderSize) {
    throw Error(ErrorKind::kInvalidStreamLength, header.block_size, "DebugLinesBlock");
  }

  // Load the whole block at once, there may be data after the columns we do not understand yet.
  ParseBuffer data(buf_.Take(header.block_size - kDebugLinesBlockHeaderSize));

  uint64_t line_size = header.LineSize();
  uint64_t column_size = header.ColumnSize(header_);
  if (line_size + column_size > data.Len()) {
    throw Error(ErrorKind::kInvalidStreamLength, header.block_size, "DebugLinesBlock");
  }

  DebugLinesBlock block;
  block.header = header;
  block.line_data = data.Take(line_size);
  block.column_data = data.Take(column_size);

  if (!data.IsEmpty()) {
    SPDLOG_WARN("Lines block for file 0x{:x} has {} unknown trailing bytes", header.file_index,
                data.Len());
  }

  SPDLOG_TRACE("Lines block: file 0x{:x}, {} lines, columns: {}", header.file_index,
               header.num_lines, header_.HasColumns());
  return block;
}

DebugLinesSubsection DebugLinesSubsection::Parse(ByteSpan data) {
  ParseBuffer buf(data);
  DebugLinesSubsection subsection;
  subsection.header_ = DebugLinesHeader::Parse(buf);
  subsection.data_ = buf.Remaining();
  return subsection;
}

std::optional<LineInfo> LineIterator::Next() {
  while (true) {
    if (auto entry = lines_.Next()) {
      // Column entries pair with line entries by position. Without columns the iterator is empty.
      auto column = columns_.Next();

      const auto* line_entry = std::get_if<LineNumberEntry>(&*entry);
      if (line_entry == nullptr) {
        continue;
      }

      LineInfo info;
      info.offset = blocks_.GetHeader().offset.WrappingAdd(line_entry->offset);
      info.length = std::nullopt;
      info.file_index = FileIndex{block_header_.file_index};
      info.line_start = line_entry->start_line;
      info.line_end = line_entry->end_line;
      if (column) {
        info.column_start = column->start_column;
        info.column_end = column->end_column;
      }
      info.kind = line_entry->kind;
      return info;
    }

    if (auto block = blocks_.Next()) {
      block_header_ = block->header;
      lines_ = block->Lines();
      columns_ = block->Columns();
      continue;
    }

    if (auto section = sections_.Next()) {
      if (section->kind == DebugSubsectionKind::kLines) {
        blocks_ = DebugLinesSubsection::Parse(section->data).Blocks();
      }
      continue;
    }

    return std::nullopt;
  }
}
