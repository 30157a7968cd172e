//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file codeview_types.hpp
 * @brief Value types produced by the CodeView debug subsection decoders.
 *
 * All types are plain values. Byte spans point into the module data handed to the decoders and
 * stay valid as long as that data does.
 */

#ifndef CVDEBUG_CODEVIEW_TYPES_H_
#define CVDEBUG_CODEVIEW_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <variant>
#include <vector>

#include "codeview_def.hpp"

namespace cvdebug {

/// @brief Non-owning view of bytes in the module data
struct ByteSpan {
  const uint8_t* data = nullptr;
  size_t size = 0;

  ByteSpan() = default;
  ByteSpan(const uint8_t* ptr, size_t len) : data(ptr), size(len) {}
  explicit ByteSpan(const std::vector<uint8_t>& bytes) : data(bytes.data()), size(bytes.size()) {}

  inline bool IsEmpty() const { return size == 0; }

  inline std::vector<uint8_t> ToVector() const {
    return size ? std::vector<uint8_t>(data, data + size) : std::vector<uint8_t>();
  }

  // Compares contents, not addresses.
  friend bool operator==(const ByteSpan& lhs, const ByteSpan& rhs) {
    return lhs.size == rhs.size &&
           (lhs.size == 0 || std::memcmp(lhs.data, rhs.data, lhs.size) == 0);
  }
  friend bool operator!=(const ByteSpan& lhs, const ByteSpan& rhs) { return !(lhs == rhs); }
};

/// @brief Section-relative code position, as stored in the PDB (offset first, then section)
struct SectionOffset {
  uint32_t offset = 0;
  uint16_t section = 0;

  inline SectionOffset WrappingAdd(uint32_t delta) const {
    return SectionOffset{static_cast<uint32_t>(offset + delta), section};
  }

  friend bool operator==(const SectionOffset& lhs, const SectionOffset& rhs) {
    return lhs.offset == rhs.offset && lhs.section == rhs.section;
  }
  friend bool operator!=(const SectionOffset& lhs, const SectionOffset& rhs) {
    return !(lhs == rhs);
  }
};

/// @brief Index into the type stream (TPI)
struct TypeIndex {
  uint32_t value = 0;

  TypeIndex() = default;
  explicit TypeIndex(uint32_t raw) : value(raw) {}

  inline bool IsCrossModule() const { return (value & CV_CROSS_MODULE_FLAG) != 0; }

  friend bool operator==(TypeIndex lhs, TypeIndex rhs) { return lhs.value == rhs.value; }
  friend bool operator!=(TypeIndex lhs, TypeIndex rhs) { return lhs.value != rhs.value; }
};

/// @brief Index into the id stream (IPI)
struct IdIndex {
  uint32_t value = 0;

  IdIndex() = default;
  explicit IdIndex(uint32_t raw) : value(raw) {}

  inline bool IsCrossModule() const { return (value & CV_CROSS_MODULE_FLAG) != 0; }

  friend bool operator==(IdIndex lhs, IdIndex rhs) { return lhs.value == rhs.value; }
  friend bool operator!=(IdIndex lhs, IdIndex rhs) { return lhs.value != rhs.value; }
};

/// @brief An index only meaningful inside the module that declares it
template <typename I>
struct Local {
  I index;

  friend bool operator==(const Local& lhs, const Local& rhs) { return lhs.index == rhs.index; }
  friend bool operator!=(const Local& lhs, const Local& rhs) { return !(lhs == rhs); }
};

/// @brief Byte offset of an entry in the file checksums subsection
struct FileIndex {
  uint32_t value = 0;

  friend bool operator==(FileIndex lhs, FileIndex rhs) { return lhs.value == rhs.value; }
  friend bool operator!=(FileIndex lhs, FileIndex rhs) { return lhs.value != rhs.value; }
};

/// @brief Offset into the string table
struct StringRef {
  uint32_t value = 0;

  friend bool operator==(StringRef lhs, StringRef rhs) { return lhs.value == rhs.value; }
  friend bool operator!=(StringRef lhs, StringRef rhs) { return lhs.value != rhs.value; }
};

/// @brief Reference to a module name in the string table
struct ModuleRef {
  uint32_t value = 0;

  friend bool operator==(ModuleRef lhs, ModuleRef rhs) { return lhs.value == rhs.value; }
  friend bool operator!=(ModuleRef lhs, ModuleRef rhs) { return lhs.value != rhs.value; }
};

enum class LineInfoKind : uint8_t {
  kExpression = 0,
  kStatement = 1,
};

/// @brief Mapping of a code range to a source line range
struct LineInfo {
  SectionOffset offset;
  std::optional<uint32_t> length;
  FileIndex file_index;
  uint32_t line_start = 0;
  uint32_t line_end = 0;
  std::optional<uint32_t> column_start;
  std::optional<uint32_t> column_end;
  LineInfoKind kind = LineInfoKind::kStatement;

  friend bool operator==(const LineInfo& lhs, const LineInfo& rhs) {
    return lhs.offset == rhs.offset && lhs.length == rhs.length &&
           lhs.file_index == rhs.file_index && lhs.line_start == rhs.line_start &&
           lhs.line_end == rhs.line_end && lhs.column_start == rhs.column_start &&
           lhs.column_end == rhs.column_end && lhs.kind == rhs.kind;
  }
  friend bool operator!=(const LineInfo& lhs, const LineInfo& rhs) { return !(lhs == rhs); }
};

enum class FileChecksumKind : uint8_t {
  kNone = 0,
  kMd5 = 1,
  kSha1 = 2,
  kSha256 = 3,
};

/// @brief Checksum of a source file. bytes is empty for kNone.
struct FileChecksum {
  FileChecksumKind kind = FileChecksumKind::kNone;
  ByteSpan bytes;

  friend bool operator==(const FileChecksum& lhs, const FileChecksum& rhs) {
    return lhs.kind == rhs.kind && lhs.bytes == rhs.bytes;
  }
  friend bool operator!=(const FileChecksum& lhs, const FileChecksum& rhs) {
    return !(lhs == rhs);
  }
};

struct FileInfo {
  StringRef name;
  FileChecksum checksum;

  friend bool operator==(const FileInfo& lhs, const FileInfo& rhs) {
    return lhs.name == rhs.name && lhs.checksum == rhs.checksum;
  }
  friend bool operator!=(const FileInfo& lhs, const FileInfo& rhs) { return !(lhs == rhs); }
};

/// @brief Result of resolving a cross module reference: the declaring module and its local index
template <typename I>
struct CrossModuleRef {
  ModuleRef module;
  Local<I> local;

  friend bool operator==(const CrossModuleRef& lhs, const CrossModuleRef& rhs) {
    return lhs.module == rhs.module && lhs.local == rhs.local;
  }
};

struct CrossModuleTypeExport {
  Local<TypeIndex> local;
  TypeIndex global;
};

struct CrossModuleIdExport {
  Local<IdIndex> local;
  IdIndex global;
};

/// @brief A type or id exported by a module. The top bit of the local index selects the space.
using CrossModuleExport = std::variant<CrossModuleTypeExport, CrossModuleIdExport>;

}  // namespace cvdebug

#endif  // CVDEBUG_CODEVIEW_TYPES_H_
