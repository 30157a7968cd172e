//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file line_program.hpp
 * @brief Per-module entry points to line information: the line program of the module, its file
 * table, and the inlinees whose line records drive InlineeLineIterator.
 */

#ifndef CVDEBUG_LINE_PROGRAM_H_
#define CVDEBUG_LINE_PROGRAM_H_

#include <optional>

#include "codeview_types.hpp"
#include "inline_site.hpp"
#include "inlinee_line_state_machine.hpp"
#include "section_file_checksums.hpp"
#include "section_inlinee_lines.hpp"
#include "section_lines.hpp"

namespace cvdebug {

class FileIterator {
 public:
  FileIterator() = default;
  explicit FileIterator(DebugFileChecksumsIterator checksums) : checksums_(checksums) {}

  std::optional<FileInfo> Next();

 private:
  DebugFileChecksumsIterator checksums_;
};

class LineProgram {
 public:
  LineProgram() = default;

  /// @brief Locates the file checksums of the module. A module without them has an empty table.
  static LineProgram Parse(ByteSpan module_data);

  /// @brief All line records of the module, in subsection order
  inline LineIterator Lines() const { return LineIterator(data_); }

  /**
   * @brief Line records of the lines subsection that starts at the given code offset, usually the
   * offset of a procedure. Empty if no subsection starts there.
   */
  LineIterator LinesAtOffset(SectionOffset offset) const;

  inline FileIterator Files() const { return FileIterator(file_checksums_.Entries()); }

  /**
   * @brief File info of the checksum entry at the given byte offset.
   * Throws Error(kInvalidFileChecksumOffset) if there is no entry at that offset.
   */
  FileInfo GetFileInfo(FileIndex index) const;

 private:
  ByteSpan data_;
  DebugFileChecksumsSubsection file_checksums_;
};

/// @brief An inlined function with the source line it starts at
class Inlinee {
 public:
  Inlinee() = default;
  explicit Inlinee(const InlineeSourceLine& source_line) : source_line_(source_line) {}

  /// @brief Function id of this inlinee in the id stream (IPI)
  inline IdIndex Index() const { return source_line_.inlinee; }
  inline const InlineeSourceLine& GetSourceLine() const { return source_line_; }

  /**
   * @brief Line records of one call site of this inlinee.
   * @param parent_offset code offset of the procedure that contains inline_site
   */
  inline InlineeLineIterator Lines(SectionOffset parent_offset,
                                   const InlineSiteSymbol& inline_site) const {
    return InlineeLineIterator(parent_offset, inline_site, source_line_);
  }

 private:
  InlineeSourceLine source_line_;
};

class InlineeIterator {
 public:
  InlineeIterator() = default;

  /// @brief Iterates the inlinee lines subsection of the module, if there is one
  static InlineeIterator Parse(ByteSpan module_data);

  std::optional<Inlinee> Next();

 private:
  DebugInlineeLinesIterator inlinee_lines_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_LINE_PROGRAM_H_
