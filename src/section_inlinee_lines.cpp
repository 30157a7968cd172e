//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/section_inlinee_lines.hpp"

using namespace cvdebug;

DebugInlineeLinesHeader DebugInlineeLinesHeader::Parse(ParseBuffer& buf) {
  DebugInlineeLinesHeader header;
  header.signature = buf.Parse<uint32_t>();
  return header;
}

InlineeSourceLine InlineeSourceLine::Parse(ParseBuffer& buf,
                                           const DebugInlineeLinesHeader& header) {
  InlineeSourceLine source_line;
  source_line.inlinee = IdIndex(buf.Parse<uint32_t>());
  source_line.file_id = FileIndex{buf.Parse<uint32_t>()};
  source_line.line = buf.Parse<uint32_t>();

  if (header.HasExtraFiles()) {
    uint64_t file_count = buf.Parse<uint32_t>();
    source_line.extra_files = buf.Take(file_count * sizeof(uint32_t));
  }

  return source_line;
}

std::optional<InlineeSourceLine> DebugInlineeLinesIterator::Next() {
  if (buf_.IsEmpty()) {
    return std::nullopt;
  }
  return InlineeSourceLine::Parse(buf_, header_);
}

DebugInlineeLinesSubsection DebugInlineeLinesSubsection::Parse(ByteSpan data) {
  ParseBuffer buf(data);
  DebugInlineeLinesSubsection subsection;
  subsection.header_ = DebugInlineeLinesHeader::Parse(buf);
  subsection.data_ = buf.Remaining();
  return subsection;
}
