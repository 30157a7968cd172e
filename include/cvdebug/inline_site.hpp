//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file inline_site.hpp
 * @brief S_INLINESITE and S_INLINESITE2 symbol records.
 */

#ifndef CVDEBUG_INLINE_SITE_H_
#define CVDEBUG_INLINE_SITE_H_

#include <cstdint>
#include <optional>

#include "binary_annotations.hpp"
#include "codeview_types.hpp"

namespace cvdebug {

/// @brief Symbol offset of a record in the module symbol stream
struct SymbolIndex {
  uint32_t value = 0;

  friend bool operator==(SymbolIndex lhs, SymbolIndex rhs) { return lhs.value == rhs.value; }
  friend bool operator!=(SymbolIndex lhs, SymbolIndex rhs) { return lhs.value != rhs.value; }
};

/// @brief Call site of an inlined function inside a procedure or another inline site
struct InlineSiteSymbol {
  /// Enclosing inline site or procedure, std::nullopt for a zero pointer.
  std::optional<SymbolIndex> parent;
  /// Record past the S_INLINESITE_END of this site.
  SymbolIndex end;
  /// Function id of the inlinee, matched against the inlinee lines subsection.
  IdIndex inlinee;
  /// Invocation count, only in S_INLINESITE2 records.
  std::optional<uint32_t> invocations;
  BinaryAnnotations annotations;

  /**
   * @brief Decodes the body of a symbol record, the bytes after its {length, kind} prefix.
   * Throws Error(kUnimplementedSymbolKind) for kinds other than S_INLINESITE and S_INLINESITE2.
   */
  static InlineSiteSymbol Parse(uint16_t kind, ByteSpan body);
};

}  // namespace cvdebug

#endif  // CVDEBUG_INLINE_SITE_H_
