//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/line_program.hpp"

#include <spdlog/spdlog.h>

#include "cvdebug/debug_subsection.hpp"

using namespace cvdebug;

std::optional<FileInfo> FileIterator::Next() {
  auto entry = checksums_.Next();
  if (!entry) {
    return std::nullopt;
  }
  return FileInfo{entry->name, entry->checksum};
}

LineProgram LineProgram::Parse(ByteSpan module_data) {
  LineProgram program;
  program.data_ = module_data;

  auto checksums = FindDebugSubsection(module_data, DebugSubsectionKind::kFileChecksums);
  if (checksums) {
    program.file_checksums_ = DebugFileChecksumsSubsection(checksums->data);
  } else {
    SPDLOG_DEBUG("Module has no file checksums subsection");
  }

  return program;
}

LineIterator LineProgram::LinesAtOffset(SectionOffset offset) const {
  // Line subsections do not overlap, the first one at the offset is the only one.
  DebugSubsectionIterator sections(data_);
  while (auto section = sections.Next()) {
    if (section->kind != DebugSubsectionKind::kLines) {
      continue;
    }

    auto lines = DebugLinesSubsection::Parse(section->data);
    if (lines.GetHeader().offset == offset) {
      return LineIterator(lines);
    }
  }

  SPDLOG_DEBUG("No lines subsection at {:x}:{:x}", offset.section, offset.offset);
  return LineIterator();
}

FileInfo LineProgram::GetFileInfo(FileIndex index) const {
  auto entry = file_checksums_.EntriesAtOffset(index).Next();
  if (!entry) {
    throw Error(ErrorKind::kInvalidFileChecksumOffset, index.value);
  }
  return FileInfo{entry->name, entry->checksum};
}

InlineeIterator InlineeIterator::Parse(ByteSpan module_data) {
  InlineeIterator iterator;

  auto section = FindDebugSubsection(module_data, DebugSubsectionKind::kInlineeLines);
  if (section) {
    iterator.inlinee_lines_ = DebugInlineeLinesSubsection::Parse(section->data).Lines();
  }

  return iterator;
}

std::optional<Inlinee> InlineeIterator::Next() {
  auto source_line = inlinee_lines_.Next();
  if (!source_line) {
    return std::nullopt;
  }
  return Inlinee(*source_line);
}
