//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file cvdebug.cpp
 * @brief Implementation of the C interface over ModuleDebugInfo.
 */

#include "cvdebug/cvdebug.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <new>
#include <variant>

#include "cvdebug/module_debug_info.hpp"
#include "utils/enum_conversion_helper.h"
#include "utils/utils.h"

using namespace cvdebug;

constexpr const char* const kResultFallback = "INVALID";

inline constexpr static std::array kResultStrTable = {
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result, CVDEBUG_SUCCESS),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result, CVDEBUG_ERROR_BAD_ARGUMENT),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result, CVDEBUG_ERROR_UNEXPECTED_EOF),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result, CVDEBUG_ERROR_UNIMPLEMENTED_FORMAT),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result, CVDEBUG_ERROR_INVALID_STRUCTURE),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result,
                                             CVDEBUG_ERROR_NOT_A_CROSS_MODULE_REF),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result,
                                             CVDEBUG_ERROR_CROSS_MODULE_REF_NOT_FOUND),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result, CVDEBUG_DEBUG_INFO_NOT_FOUND),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(cvdebug_result, CVDEBUG_ERROR_INTERNAL),
};

constexpr const char* CvdebugResultTypeToStringImpl(cvdebug_result result_value) {
  switch (result_value) {
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_SUCCESS, kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_ERROR_BAD_ARGUMENT, kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_ERROR_UNEXPECTED_EOF, kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_ERROR_UNIMPLEMENTED_FORMAT, kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_ERROR_INVALID_STRUCTURE, kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_ERROR_NOT_A_CROSS_MODULE_REF, kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_ERROR_CROSS_MODULE_REF_NOT_FOUND,
                            kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_DEBUG_INFO_NOT_FOUND, kResultStrTable)
    CVDEBUG_ENUM_CONVERSION(cvdebug_result, CVDEBUG_ERROR_INTERNAL, kResultStrTable)
  }
  return kResultFallback;
}

static cvdebug_result ToResult(const Error& error) {
  switch (error.kind()) {
    case ErrorKind::kUnexpectedEof:
      return CVDEBUG_ERROR_UNEXPECTED_EOF;
    case ErrorKind::kUnimplementedDebugSubsection:
    case ErrorKind::kUnimplementedFileChecksumKind:
    case ErrorKind::kUnimplementedSymbolKind:
    case ErrorKind::kUnknownBinaryAnnotation:
      return CVDEBUG_ERROR_UNIMPLEMENTED_FORMAT;
    case ErrorKind::kInvalidStreamLength:
    case ErrorKind::kInvalidFileChecksumOffset:
    case ErrorKind::kInvalidCompressedAnnotation:
      return CVDEBUG_ERROR_INVALID_STRUCTURE;
    case ErrorKind::kNotACrossModuleRef:
      return CVDEBUG_ERROR_NOT_A_CROSS_MODULE_REF;
    case ErrorKind::kCrossModuleRefNotFound:
      return CVDEBUG_ERROR_CROSS_MODULE_REF_NOT_FOUND;
  }
  return CVDEBUG_ERROR_INTERNAL;
}

static CvLineMapping ToLineMapping(const LineInfo& line) {
  CvLineMapping mapping;
  mapping.offset = line.offset.offset;
  mapping.section = line.offset.section;
  mapping.has_length = line.length.has_value();
  mapping.length = line.length.value_or(0);
  mapping.file_index = line.file_index.value;
  mapping.line_start = line.line_start;
  mapping.line_end = line.line_end;
  mapping.column_start = line.column_start.value_or(0);
  mapping.column_end = line.column_end.value_or(0);
  mapping.is_statement = line.kind == LineInfoKind::kStatement;
  return mapping;
}

// Runs a decode call, converting exceptions to status codes.
template <typename F>
static cvdebug_result Guarded(const char* api, F&& call) {
  try {
    return call();
  } catch (const Error& error) {
    SPDLOG_DEBUG("{}: {}", api, error.what());
    return ToResult(error);
  } catch (const std::exception& exception) {
    SPDLOG_ERROR("{}: {}", api, exception.what());
    return CVDEBUG_ERROR_INTERNAL;
  }
}

static ModuleDebugInfo* GetModule(cvdebug_module_handle_t module) {
  if (module == nullptr) return nullptr;

  ModuleDebugInfo* module_ = reinterpret_cast<ModuleDebugInfo*>(module);
  if (module_->IsValid() == false) {
    return nullptr;
  }
  return module_;
}

cvdebug_result cvdebugModuleCreate(const uint8_t* data, uint32_t size,
                                   cvdebug_module_handle_t* module) {
  if (data == nullptr || size == 0 || module == nullptr) return CVDEBUG_ERROR_BAD_ARGUMENT;

  utils::ConfigureLogging();

  cvdebug_result status = Guarded("cvdebugModuleCreate", [&] {
    ModuleDebugInfo::CheckSubsections(ByteSpan(data, size));
    return CVDEBUG_SUCCESS;
  });
  if (status != CVDEBUG_SUCCESS) {
    return status;
  }

  ModuleDebugInfo* module_ = new (std::nothrow) ModuleDebugInfo(data, size);
  if (module_ == nullptr) return CVDEBUG_ERROR_INTERNAL;

  if (!module_->IsValid()) {
    delete module_;
    return CVDEBUG_ERROR_INTERNAL;
  }

  *module = reinterpret_cast<cvdebug_module_handle_t>(module_);
  return CVDEBUG_SUCCESS;
}

cvdebug_result cvdebugModuleDestroy(cvdebug_module_handle_t* module) {
  if (module == nullptr || *module == nullptr) return CVDEBUG_ERROR_BAD_ARGUMENT;

  ModuleDebugInfo* module_ = reinterpret_cast<ModuleDebugInfo*>(*module);
  if (module_->IsValid() == false) {
    return CVDEBUG_ERROR_BAD_ARGUMENT;
  }
  delete module_;
  *module = nullptr;
  return CVDEBUG_SUCCESS;
}

cvdebug_result cvdebugModuleIsValid(cvdebug_module_handle_t module, bool* is_valid) {
  if (is_valid == nullptr) return CVDEBUG_ERROR_BAD_ARGUMENT;

  if (module == nullptr) {
    *is_valid = false;
    return CVDEBUG_ERROR_BAD_ARGUMENT;
  }

  ModuleDebugInfo* module_ = reinterpret_cast<ModuleDebugInfo*>(module);

  *is_valid = module_->IsValid();
  return CVDEBUG_SUCCESS;
}

cvdebug_result cvdebugModuleGetLineMappings(cvdebug_module_handle_t module, uint32_t num_entries,
                                            CvLineMapping* mappings, uint32_t* num_mappings) {
  const ModuleDebugInfo* module_ = GetModule(module);
  if (module_ == nullptr) return CVDEBUG_ERROR_BAD_ARGUMENT;

  return Guarded("cvdebugModuleGetLineMappings", [&] {
    auto lines = module_->GetLineInfo();

    const uint32_t mapping_size = static_cast<uint32_t>(lines.size());
    if (num_mappings != nullptr) {
      *num_mappings = mapping_size;
    }
    if (mapping_size == 0) {
      return CVDEBUG_DEBUG_INFO_NOT_FOUND;
    }

    if (mappings == nullptr) {
      return CVDEBUG_SUCCESS;
    }

    if (num_entries == 0) {
      return CVDEBUG_ERROR_BAD_ARGUMENT;
    }

    const uint32_t entries_to_copy = std::min(num_entries, mapping_size);
    for (uint32_t i = 0; i < entries_to_copy; i++) {
      mappings[i] = ToLineMapping(lines[i]);
    }
    return CVDEBUG_SUCCESS;
  });
}

cvdebug_result cvdebugModuleGetFileInfo(cvdebug_module_handle_t module, uint32_t file_index,
                                        CvFileInfo* info) {
  const ModuleDebugInfo* module_ = GetModule(module);
  if (module_ == nullptr || info == nullptr) return CVDEBUG_ERROR_BAD_ARGUMENT;

  return Guarded("cvdebugModuleGetFileInfo", [&] {
    FileInfo file = module_->GetLineProgram().GetFileInfo(FileIndex{file_index});

    info->name_offset = file.name.value;
    info->checksum_kind = static_cast<uint32_t>(file.checksum.kind);
    info->checksum = file.checksum.bytes.IsEmpty() ? nullptr : file.checksum.bytes.data;
    info->checksum_size = static_cast<uint32_t>(file.checksum.bytes.size);
    return CVDEBUG_SUCCESS;
  });
}

cvdebug_result cvdebugModuleResolveImport(cvdebug_module_handle_t module,
                                          cvdebug_index_kind index_kind, uint32_t index,
                                          CvCrossModuleRef* ref) {
  const ModuleDebugInfo* module_ = GetModule(module);
  if (module_ == nullptr || ref == nullptr) return CVDEBUG_ERROR_BAD_ARGUMENT;

  return Guarded("cvdebugModuleResolveImport", [&] {
    auto imports = module_->GetImports();
    switch (index_kind) {
      case CVDEBUG_INDEX_TYPE: {
        auto resolved = imports.ResolveImport(TypeIndex(index));
        ref->module_name = resolved.module.value;
        ref->local_index = resolved.local.index.value;
        return CVDEBUG_SUCCESS;
      }
      case CVDEBUG_INDEX_ID: {
        auto resolved = imports.ResolveImport(IdIndex(index));
        ref->module_name = resolved.module.value;
        ref->local_index = resolved.local.index.value;
        return CVDEBUG_SUCCESS;
      }
    }
    return CVDEBUG_ERROR_BAD_ARGUMENT;
  });
}

cvdebug_result cvdebugModuleResolveExport(cvdebug_module_handle_t module, uint32_t local_index,
                                          CvCrossModuleExport* entry) {
  const ModuleDebugInfo* module_ = GetModule(module);
  if (module_ == nullptr || entry == nullptr) return CVDEBUG_ERROR_BAD_ARGUMENT;

  return Guarded("cvdebugModuleResolveExport", [&] {
    auto resolved = module_->GetExports().ResolveExport(local_index);
    if (!resolved) {
      return CVDEBUG_DEBUG_INFO_NOT_FOUND;
    }

    if (const auto* id_export = std::get_if<CrossModuleIdExport>(&*resolved)) {
      entry->is_id = true;
      entry->local_index = id_export->local.index.value;
      entry->global_index = id_export->global.value;
    } else {
      const auto& type_export = std::get<CrossModuleTypeExport>(*resolved);
      entry->is_id = false;
      entry->local_index = type_export.local.index.value;
      entry->global_index = type_export.global.value;
    }
    return CVDEBUG_SUCCESS;
  });
}

const char* cvdebugResultTypeToString(cvdebug_result result) {
  return CvdebugResultTypeToStringImpl(result);
}
