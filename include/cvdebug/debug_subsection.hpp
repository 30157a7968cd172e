//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file debug_subsection.hpp
 * @brief Splits the C13 debug data of a module into typed subsections.
 */

#ifndef CVDEBUG_DEBUG_SUBSECTION_H_
#define CVDEBUG_DEBUG_SUBSECTION_H_

#include <cstdint>
#include <optional>

#include "codeview_def.hpp"
#include "codeview_types.hpp"
#include "parse_buffer.hpp"

namespace cvdebug {

enum class DebugSubsectionKind : uint32_t {
  // Native
  kSymbols = DEBUG_S_SYMBOLS,
  kLines = DEBUG_S_LINES,
  kStringTable = DEBUG_S_STRINGTABLE,
  kFileChecksums = DEBUG_S_FILECHKSMS,
  kFrameData = DEBUG_S_FRAMEDATA,
  kInlineeLines = DEBUG_S_INLINEELINES,
  kCrossScopeImports = DEBUG_S_CROSSSCOPEIMPORTS,
  kCrossScopeExports = DEBUG_S_CROSSSCOPEEXPORTS,

  // .NET
  kILLines = DEBUG_S_IL_LINES,
  kFuncMDTokenMap = DEBUG_S_FUNC_MDTOKEN_MAP,
  kTypeMDTokenMap = DEBUG_S_TYPE_MDTOKEN_MAP,
  kMergedAssemblyInput = DEBUG_S_MERGED_ASSEMBLYINPUT,

  kCoffSymbolRva = DEBUG_S_COFF_SYMBOL_RVA,
};

/**
 * @brief Maps a raw subsection kind to DebugSubsectionKind.
 * @return std::nullopt for DEBUG_S_IGNORE. Throws Error(kUnimplementedDebugSubsection) for any
 * value outside the known set.
 */
std::optional<DebugSubsectionKind> ParseDebugSubsectionKind(uint32_t value);

struct DebugSubsectionHeader {
  uint32_t kind;
  uint32_t len;

  static DebugSubsectionHeader Parse(ParseBuffer& buf);
};

struct DebugSubsection {
  DebugSubsectionKind kind;
  ByteSpan data;
};

class DebugSubsectionIterator {
 public:
  DebugSubsectionIterator() = default;
  explicit DebugSubsectionIterator(ByteSpan data) : buf_(data) {}

  /// @brief Next recognized subsection, std::nullopt at the end. Ignored subsections are skipped.
  std::optional<DebugSubsection> Next();

 private:
  ParseBuffer buf_;
};

/// @brief First subsection of the given kind in the module data, if any
std::optional<DebugSubsection> FindDebugSubsection(ByteSpan data, DebugSubsectionKind kind);

}  // namespace cvdebug

#endif  // CVDEBUG_DEBUG_SUBSECTION_H_
