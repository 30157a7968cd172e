//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file inlinee_line_state_machine.hpp
 * @brief State machine that turns the binary annotations of an inline site into line records.
 *
 * Annotations update the code offset, line, column, file and range kind of the state. Annotations
 * for which BinaryAnnotation::EmitsLineInfo() holds start a new line record. The length of a
 * record is often only known when the next record starts, so records are returned one step
 * behind: a new record replaces the pending one, which is returned, and the last pending record
 * is returned once the annotations are exhausted.
 *
 * File changes are applied where they occur. Some compilers emit them at the wrong code offset or
 * omit them for headers included into inline functions; this is not corrected.
 */

#ifndef CVDEBUG_INLINEE_LINE_STATE_MACHINE_H_
#define CVDEBUG_INLINEE_LINE_STATE_MACHINE_H_

#include <cstdint>
#include <optional>

#include "binary_annotations.hpp"
#include "codeview_types.hpp"
#include "inline_site.hpp"
#include "section_inlinee_lines.hpp"

namespace cvdebug {

struct InlineeLineState {
  FileIndex file_index;
  SectionOffset code_offset;
  uint32_t code_offset_base = 0;
  std::optional<uint32_t> code_length;
  uint32_t line = 0;
  uint32_t line_length = 1;
  std::optional<uint32_t> column_start;
  std::optional<uint32_t> column_end;
  LineInfoKind kind = LineInfoKind::kStatement;
};

class InlineeLineIterator {
 public:
  InlineeLineIterator() = default;
  InlineeLineIterator(SectionOffset parent_offset, const InlineSiteSymbol& inline_site,
                      const InlineeSourceLine& inlinee_line);

  /**
   * @brief Next line record of the inline site, std::nullopt when all annotations are consumed.
   * Records are not guaranteed to be ordered by code offset.
   */
  std::optional<LineInfo> Next();

 private:
  void Apply(const BinaryAnnotation& annotation);
  void BackPatchLength(uint32_t length);
  LineInfo MakeLineInfo() const;

  BinaryAnnotationsIterator annotations_;
  InlineeLineState state_;
  std::optional<LineInfo> pending_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_INLINEE_LINE_STATE_MACHINE_H_
