//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/module_debug_info.hpp"

#include <spdlog/spdlog.h>

#include "cvdebug/debug_subsection.hpp"
#include "utils/utils.h"

using namespace cvdebug;

ModuleDebugInfo::ModuleDebugInfo(const uint8_t* data, uint32_t size) : data_(data), size_(size) {
  utils::ConfigureLogging();

  if (!ModuleDebugInfo::IsValid(data_, size_)) {
    return;
  }
  this->initialized_ = true;
}

void ModuleDebugInfo::CheckSubsections(ByteSpan data) {
  uint32_t count = 0;
  DebugSubsectionIterator sections(data);
  while (sections.Next()) {
    ++count;
  }
  SPDLOG_DEBUG("Module debug data: {} bytes, {} subsections", data.size, count);
}

bool ModuleDebugInfo::IsValid(const uint8_t* data, uint32_t size) {
  if (data == nullptr || size == 0) return false;

  try {
    CheckSubsections(ByteSpan(data, size));
  } catch (const Error& error) {
    SPDLOG_DEBUG("Invalid module debug data: {}", error.what());
    return false;
  }
  return true;
}

bool ModuleDebugInfo::IsValid() const { return this->initialized_; }

std::vector<LineInfo> ModuleDebugInfo::GetLineInfo() const {
  std::vector<LineInfo> lines;
  auto iterator = GetLineProgram().Lines();
  while (auto line = iterator.Next()) {
    lines.push_back(*line);
  }
  return lines;
}

std::vector<LineInfo> ModuleDebugInfo::GetLineInfo(SectionOffset offset) const {
  std::vector<LineInfo> lines;
  auto iterator = GetLineProgram().LinesAtOffset(offset);
  while (auto line = iterator.Next()) {
    lines.push_back(*line);
  }
  return lines;
}

std::vector<FileInfo> ModuleDebugInfo::GetFileInfo() const {
  std::vector<FileInfo> files;
  auto iterator = GetLineProgram().Files();
  while (auto file = iterator.Next()) {
    files.push_back(*file);
  }
  return files;
}

std::vector<Inlinee> ModuleDebugInfo::GetInlineeList() const {
  std::vector<Inlinee> inlinees;
  auto iterator = GetInlinees();
  while (auto inlinee = iterator.Next()) {
    inlinees.push_back(*inlinee);
  }
  return inlinees;
}

std::vector<CrossModuleExport> ModuleDebugInfo::GetExportList() const {
  std::vector<CrossModuleExport> exports;
  auto iterator = GetExports().Exports();
  while (auto entry = iterator.Next()) {
    exports.push_back(*entry);
  }
  return exports;
}

std::vector<LineInfo> ModuleDebugInfo::GetInlineeLineInfo(
    SectionOffset parent_offset, const InlineSiteSymbol& inline_site) const {
  auto inlinees = GetInlinees();
  while (auto inlinee = inlinees.Next()) {
    if (inlinee->Index() != inline_site.inlinee) {
      continue;
    }

    std::vector<LineInfo> lines;
    auto iterator = inlinee->Lines(parent_offset, inline_site);
    while (auto line = iterator.Next()) {
      lines.push_back(*line);
    }
    return lines;
  }

  SPDLOG_DEBUG("No inlinee lines for function id 0x{:x}", inline_site.inlinee.value);
  return {};
}
