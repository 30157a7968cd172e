//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file section_cross_scope.hpp
 * @brief Cross module reference tables: DEBUG_S_CROSSSCOPEIMPORTS and DEBUG_S_CROSSSCOPEEXPORTS.
 *
 * A type or id index with the top bit set is a cross module reference. Bits 20-30 select a module
 * in the import table of the referencing module, bits 0-19 the import slot within it. The slot
 * holds the index local to the declaring module, which that module's export table maps to the
 * global index.
 */

#ifndef CVDEBUG_SECTION_CROSS_SCOPE_H_
#define CVDEBUG_SECTION_CROSS_SCOPE_H_

#include <cstdint>
#include <optional>
#include <vector>

#include "codeview_types.hpp"
#include "cvdebug_error.hpp"
#include "parse_buffer.hpp"

namespace cvdebug {

class CrossScopeImportModule {
 public:
  CrossScopeImportModule(ModuleRef name, ByteSpan imports) : name_(name), imports_(imports) {}

  inline ModuleRef GetName() const { return name_; }
  inline size_t GetCount() const { return imports_.size / sizeof(uint32_t); }

  /**
   * @brief Local index at the given import slot. The raw little-endian value is reinterpreted
   * as an index of type I, which the caller knows from the referencing index.
   */
  template <typename I>
  std::optional<Local<I>> Get(size_t import) const {
    if (import >= GetCount()) {
      return std::nullopt;
    }
    return Local<I>{I(ReadU32At(imports_, import))};
  }

 private:
  ModuleRef name_;
  ByteSpan imports_;
};

class CrossScopeImportModuleIterator {
 public:
  CrossScopeImportModuleIterator() = default;
  explicit CrossScopeImportModuleIterator(ByteSpan data) : buf_(data) {}

  std::optional<CrossScopeImportModule> Next();

 private:
  ParseBuffer buf_;
};

/// @brief Import table of a module, used to resolve its cross module references
class CrossModuleImports {
 public:
  CrossModuleImports() = default;

  /// @brief Decodes the imports subsection of the module data. Empty if there is none.
  static CrossModuleImports Parse(ByteSpan module_data);

  /**
   * @brief Resolves the declaring module and local index of a cross module reference.
   * Throws Error(kNotACrossModuleRef) if index is not a cross module reference, and
   * Error(kCrossModuleRefNotFound) if the module or slot it names is not in this table.
   */
  template <typename I>
  CrossModuleRef<I> ResolveImport(I index) const {
    uint32_t raw_index = index.value;
    if (!index.IsCrossModule()) {
      throw Error(ErrorKind::kNotACrossModuleRef, raw_index);
    }

    size_t module_index =
        (raw_index >> CV_CROSS_MODULE_MODULE_SHIFT) & CV_CROSS_MODULE_MODULE_MASK;
    size_t import_index = raw_index & CV_CROSS_MODULE_IMPORT_MASK;

    if (module_index >= modules_.size()) {
      throw Error(ErrorKind::kCrossModuleRefNotFound, raw_index);
    }
    const CrossScopeImportModule& module = modules_[module_index];
    auto local_index = module.Get<I>(import_index);
    if (!local_index) {
      throw Error(ErrorKind::kCrossModuleRefNotFound, raw_index);
    }

    return CrossModuleRef<I>{module.GetName(), *local_index};
  }

  inline const std::vector<CrossScopeImportModule>& GetModules() const { return modules_; }

 private:
  std::vector<CrossScopeImportModule> modules_;
};

/// @brief Export record: {local, global} as stored
struct RawCrossScopeExport {
  uint32_t local;
  uint32_t global;

  CrossModuleExport ToExport() const;

  static RawCrossScopeExport Parse(ParseBuffer& buf);
};

class CrossModuleExportIterator {
 public:
  CrossModuleExportIterator() = default;
  explicit CrossModuleExportIterator(ByteSpan data) : buf_(data) {}

  std::optional<CrossModuleExport> Next();

 private:
  ParseBuffer buf_;
};

/// @brief Types and ids this module exports to other modules, sorted by local index
class CrossModuleExports {
 public:
  CrossModuleExports() = default;

  /**
   * @brief Decodes the exports subsection of the module data. Empty if there is none.
   * Throws Error(kInvalidStreamLength) if the subsection is not a whole number of records.
   */
  static CrossModuleExports Parse(ByteSpan module_data);

  inline size_t GetCount() const { return raw_exports_.size / kCrossScopeExportRecordSize; }
  inline CrossModuleExportIterator Exports() const {
    return CrossModuleExportIterator(raw_exports_);
  }

  /**
   * @brief Global index of the given local index of this module, std::nullopt if the local index
   * is not exported.
   */
  template <typename I>
  std::optional<I> ResolveGlobal(Local<I> local_index) const {
    auto raw = Find(local_index.index.value);
    if (!raw) {
      return std::nullopt;
    }
    return I(raw->global);
  }

  /// @brief Export record for the raw local index, tagged Type or Id by its top bit
  std::optional<CrossModuleExport> ResolveExport(uint32_t local) const;

 private:
  RawCrossScopeExport GetRaw(size_t index) const;
  std::optional<RawCrossScopeExport> Find(uint32_t local) const;

  ByteSpan raw_exports_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_SECTION_CROSS_SCOPE_H_
