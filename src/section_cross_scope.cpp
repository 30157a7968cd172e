//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/section_cross_scope.hpp"

#include <spdlog/spdlog.h>

#include "cvdebug/debug_subsection.hpp"

using namespace cvdebug;

std::optional<CrossScopeImportModule> CrossScopeImportModuleIterator::Next() {
  if (buf_.IsEmpty()) {
    return std::nullopt;
  }

  ModuleRef name{buf_.Parse<uint32_t>()};
  uint64_t count = buf_.Parse<uint32_t>();
  // indices stay raw, they are converted when a reference is resolved
  ByteSpan imports = buf_.Take(count * sizeof(uint32_t));

  return CrossScopeImportModule(name, imports);
}

CrossModuleImports CrossModuleImports::Parse(ByteSpan module_data) {
  CrossModuleImports result;

  auto section = FindDebugSubsection(module_data, DebugSubsectionKind::kCrossScopeImports);
  if (!section) {
    return result;
  }

  CrossScopeImportModuleIterator modules(section->data);
  while (auto module = modules.Next()) {
    result.modules_.push_back(*module);
  }

  SPDLOG_DEBUG("Cross scope imports: {} modules", result.modules_.size());
  return result;
}

RawCrossScopeExport RawCrossScopeExport::Parse(ParseBuffer& buf) {
  RawCrossScopeExport raw;
  raw.local = buf.Parse<uint32_t>();
  raw.global = buf.Parse<uint32_t>();
  return raw;
}

CrossModuleExport RawCrossScopeExport::ToExport() const {
  if ((local & CV_CROSS_MODULE_FLAG) != 0) {
    return CrossModuleIdExport{Local<IdIndex>{IdIndex(local)}, IdIndex(global)};
  }
  return CrossModuleTypeExport{Local<TypeIndex>{TypeIndex(local)}, TypeIndex(global)};
}

std::optional<CrossModuleExport> CrossModuleExportIterator::Next() {
  if (buf_.IsEmpty()) {
    return std::nullopt;
  }
  return RawCrossScopeExport::Parse(buf_).ToExport();
}

CrossModuleExports CrossModuleExports::Parse(ByteSpan module_data) {
  CrossModuleExports result;

  auto section = FindDebugSubsection(module_data, DebugSubsectionKind::kCrossScopeExports);
  if (!section) {
    return result;
  }

  if (section->data.size % kCrossScopeExportRecordSize != 0) {
    throw Error(ErrorKind::kInvalidStreamLength, section->data.size,
                "DebugCrossScopeExportsSubsection");
  }

  result.raw_exports_ = section->data;
  SPDLOG_DEBUG("Cross scope exports: {} records", result.GetCount());
  return result;
}

RawCrossScopeExport CrossModuleExports::GetRaw(size_t index) const {
  RawCrossScopeExport raw;
  raw.local = ReadU32At(raw_exports_, index * 2);
  raw.global = ReadU32At(raw_exports_, index * 2 + 1);
  return raw;
}

std::optional<RawCrossScopeExport> CrossModuleExports::Find(uint32_t local) const {
  // Producers sort the table by local index.
  size_t low = 0;
  size_t high = GetCount();
  while (low < high) {
    size_t middle = low + (high - low) / 2;
    RawCrossScopeExport raw = GetRaw(middle);
    if (raw.local == local) {
      return raw;
    }
    if (raw.local < local) {
      low = middle + 1;
    } else {
      high = middle;
    }
  }
  return std::nullopt;
}

std::optional<CrossModuleExport> CrossModuleExports::ResolveExport(uint32_t local) const {
  auto raw = Find(local);
  if (!raw) {
    return std::nullopt;
  }
  return raw->ToExport();
}
