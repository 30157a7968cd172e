//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file module_debug_info.hpp
 * @brief This file contains the declaration of the C++ reader for the C13 debug data of a module.
 */

#ifndef CVDEBUG_MODULE_DEBUG_INFO_HPP_
#define CVDEBUG_MODULE_DEBUG_INFO_HPP_

#include <cstdint>
#include <vector>

#include "codeview_types.hpp"
#include "inline_site.hpp"
#include "line_program.hpp"
#include "section_cross_scope.hpp"

namespace cvdebug {

class ModuleDebugInfo {
 public:
  /**
   * @brief Constructs a ModuleDebugInfo object over the C13 debug data of one module.
   * Memory is managed by caller, but should be available until the ModuleDebugInfo object and
   * every iterator or table obtained from it are destroyed. The data is not copied.
   *
   * @param data A pointer to the concatenated debug subsections of the module.
   * @param size The size of the debug data.
   */
  ModuleDebugInfo(const uint8_t* data, uint32_t size);
  ~ModuleDebugInfo() = default;

  // copy ctor and move constructors
  ModuleDebugInfo(const ModuleDebugInfo& other) = delete;
  ModuleDebugInfo& operator=(const ModuleDebugInfo& other) = delete;
  ModuleDebugInfo(ModuleDebugInfo&& other) = delete;
  ModuleDebugInfo& operator=(ModuleDebugInfo&& other) = delete;

  /**
   * @brief Walks the subsection headers of the data once. Throws the framing error if a header
   * or body is truncated or a subsection kind is unknown.
   */
  static void CheckSubsections(ByteSpan data);
  static bool IsValid(const uint8_t* data, uint32_t size);
  bool IsValid() const;

  inline ByteSpan GetData() const { return ByteSpan(data_, size_); }

  inline LineProgram GetLineProgram() const { return LineProgram::Parse(GetData()); }
  inline InlineeIterator GetInlinees() const { return InlineeIterator::Parse(GetData()); }
  inline CrossModuleImports GetImports() const { return CrossModuleImports::Parse(GetData()); }
  inline CrossModuleExports GetExports() const { return CrossModuleExports::Parse(GetData()); }

  // Collectors. On error they throw and return nothing.
  std::vector<LineInfo> GetLineInfo() const;
  std::vector<LineInfo> GetLineInfo(SectionOffset offset) const;
  std::vector<FileInfo> GetFileInfo() const;
  std::vector<Inlinee> GetInlineeList() const;
  std::vector<CrossModuleExport> GetExportList() const;

  /**
   * @brief Line records of an inline site inside the procedure at parent_offset. Empty if the
   * module has no inlinee record for the function the site inlines.
   */
  std::vector<LineInfo> GetInlineeLineInfo(SectionOffset parent_offset,
                                           const InlineSiteSymbol& inline_site) const;

 private:
  const uint8_t* data_;
  const uint32_t size_;

  bool initialized_ = false;
};

}  // namespace cvdebug

#endif  // CVDEBUG_MODULE_DEBUG_INFO_HPP_
