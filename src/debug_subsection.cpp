//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/debug_subsection.hpp"

#include <spdlog/spdlog.h>

using namespace cvdebug;

std::optional<DebugSubsectionKind> cvdebug::ParseDebugSubsectionKind(uint32_t value) {
  switch (value) {
    case DEBUG_S_SYMBOLS:
    case DEBUG_S_LINES:
    case DEBUG_S_STRINGTABLE:
    case DEBUG_S_FILECHKSMS:
    case DEBUG_S_FRAMEDATA:
    case DEBUG_S_INLINEELINES:
    case DEBUG_S_CROSSSCOPEIMPORTS:
    case DEBUG_S_CROSSSCOPEEXPORTS:
    case DEBUG_S_IL_LINES:
    case DEBUG_S_FUNC_MDTOKEN_MAP:
    case DEBUG_S_TYPE_MDTOKEN_MAP:
    case DEBUG_S_MERGED_ASSEMBLYINPUT:
    case DEBUG_S_COFF_SYMBOL_RVA:
      return static_cast<DebugSubsectionKind>(value);
    case DEBUG_S_IGNORE:
      return std::nullopt;
    default:
      throw Error(ErrorKind::kUnimplementedDebugSubsection, value);
  }
}

DebugSubsectionHeader DebugSubsectionHeader::Parse(ParseBuffer& buf) {
  DebugSubsectionHeader header;
  header.kind = buf.Parse<uint32_t>();
  header.len = buf.Parse<uint32_t>();
  return header;
}

std::optional<DebugSubsection> DebugSubsectionIterator::Next() {
  while (!buf_.IsEmpty()) {
    size_t position = buf_.Pos();
    auto header = DebugSubsectionHeader::Parse(buf_);
    // the body is consumed before the kind is looked at, so unknown kinds never stall the walk
    ByteSpan data = buf_.Take(header.len);
    auto kind = ParseDebugSubsectionKind(header.kind);
    if (!kind) {
      SPDLOG_TRACE("Skipping ignored subsection at 0x{:x}, len {}", position, header.len);
      continue;
    }

    SPDLOG_TRACE("Subsection 0x{:x} at 0x{:x}, len {}", header.kind, position, header.len);
    return DebugSubsection{*kind, data};
  }

  return std::nullopt;
}

std::optional<DebugSubsection> cvdebug::FindDebugSubsection(ByteSpan data,
                                                            DebugSubsectionKind kind) {
  DebugSubsectionIterator sections(data);
  while (auto section = sections.Next()) {
    if (section->kind == kind) {
      return section;
    }
  }
  return std::nullopt;
}
