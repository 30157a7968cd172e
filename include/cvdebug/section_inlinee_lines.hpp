//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file section_inlinee_lines.hpp
 * @brief Decoder of the DEBUG_S_INLINEELINES subsection.
 */

#ifndef CVDEBUG_SECTION_INLINEE_LINES_H_
#define CVDEBUG_SECTION_INLINEE_LINES_H_

#include <cstdint>
#include <optional>

#include "codeview_types.hpp"
#include "parse_buffer.hpp"

namespace cvdebug {

struct DebugInlineeLinesHeader {
  uint32_t signature = CV_INLINEE_SOURCE_LINE_SIGNATURE;

  inline bool HasExtraFiles() const { return signature == CV_INLINEE_SOURCE_LINE_SIGNATURE_EX; }

  static DebugInlineeLinesHeader Parse(ParseBuffer& buf);
};

/// @brief Source location an inlined function starts at
struct InlineeSourceLine {
  IdIndex inlinee;
  FileIndex file_id;
  uint32_t line = 0;
  // TODO: add an iterator over the extra file offsets once a consumer needs them
  /// Raw u32 file offsets, only present with CV_INLINEE_SOURCE_LINE_SIGNATURE_EX.
  ByteSpan extra_files;

  static InlineeSourceLine Parse(ParseBuffer& buf, const DebugInlineeLinesHeader& header);

  friend bool operator==(const InlineeSourceLine& lhs, const InlineeSourceLine& rhs) {
    return lhs.inlinee == rhs.inlinee && lhs.file_id == rhs.file_id && lhs.line == rhs.line &&
           lhs.extra_files == rhs.extra_files;
  }
};

class DebugInlineeLinesIterator {
 public:
  DebugInlineeLinesIterator() = default;
  DebugInlineeLinesIterator(const DebugInlineeLinesHeader& header, ByteSpan data)
      : header_(header), buf_(data) {}

  std::optional<InlineeSourceLine> Next();

 private:
  DebugInlineeLinesHeader header_;
  ParseBuffer buf_;
};

class DebugInlineeLinesSubsection {
 public:
  DebugInlineeLinesSubsection() = default;

  static DebugInlineeLinesSubsection Parse(ByteSpan data);

  inline const DebugInlineeLinesHeader& GetHeader() const { return header_; }
  inline DebugInlineeLinesIterator Lines() const {
    return DebugInlineeLinesIterator(header_, data_);
  }

 private:
  DebugInlineeLinesHeader header_;
  ByteSpan data_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_SECTION_INLINEE_LINES_H_
