//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file binary_annotations.hpp
 * @brief Decoder of the compressed binary annotation stream of inline site records.
 *
 * Every annotation is an opcode followed by one or two operands, all stored as compressed
 * unsigned integers. The stream is padded with zero bytes, which decode as BA_OP_Invalid and end
 * the sequence.
 */

#ifndef CVDEBUG_BINARY_ANNOTATIONS_H_
#define CVDEBUG_BINARY_ANNOTATIONS_H_

#include <cstdint>
#include <optional>

#include "codeview_def.hpp"
#include "codeview_types.hpp"
#include "parse_buffer.hpp"

namespace cvdebug {

enum class BinaryAnnotationOpcode : uint8_t {
  kInvalid = BA_OP_Invalid,
  kCodeOffset = BA_OP_CodeOffset,
  kChangeCodeOffsetBase = BA_OP_ChangeCodeOffsetBase,
  kChangeCodeOffset = BA_OP_ChangeCodeOffset,
  kChangeCodeLength = BA_OP_ChangeCodeLength,
  kChangeFile = BA_OP_ChangeFile,
  kChangeLineOffset = BA_OP_ChangeLineOffset,
  kChangeLineEndDelta = BA_OP_ChangeLineEndDelta,
  kChangeRangeKind = BA_OP_ChangeRangeKind,
  kChangeColumnStart = BA_OP_ChangeColumnStart,
  kChangeColumnEndDelta = BA_OP_ChangeColumnEndDelta,
  kChangeCodeOffsetAndLineOffset = BA_OP_ChangeCodeOffsetAndLineOffset,
  kChangeCodeLengthAndCodeOffset = BA_OP_ChangeCodeLengthAndCodeOffset,
  kChangeColumnEnd = BA_OP_ChangeColumnEnd,
};

const char* BinaryAnnotationOpcodeToString(BinaryAnnotationOpcode opcode);

/**
 * @brief One decoded annotation.
 *
 * Operand usage by opcode:
 *   value  - the unsigned operand, or the code delta of kChangeCodeOffsetAndLineOffset, or the
 *            code length of kChangeCodeLengthAndCodeOffset
 *   value2 - the code offset delta of kChangeCodeLengthAndCodeOffset
 *   delta  - the signed operand of kChangeLineOffset, kChangeColumnEndDelta and the line delta of
 *            kChangeCodeOffsetAndLineOffset
 */
struct BinaryAnnotation {
  BinaryAnnotationOpcode opcode = BinaryAnnotationOpcode::kInvalid;
  uint32_t value = 0;
  uint32_t value2 = 0;
  int32_t delta = 0;

  /// @brief True for the annotations that close a code range and start a new line record
  bool EmitsLineInfo() const;

  static BinaryAnnotation Unsigned(BinaryAnnotationOpcode opcode, uint32_t value);
  static BinaryAnnotation Signed(BinaryAnnotationOpcode opcode, int32_t delta);
  static BinaryAnnotation CodeOffsetAndLineOffset(uint32_t code_delta, int32_t line_delta);
  static BinaryAnnotation CodeLengthAndCodeOffset(uint32_t code_length, uint32_t code_delta);

  friend bool operator==(const BinaryAnnotation& lhs, const BinaryAnnotation& rhs) {
    return lhs.opcode == rhs.opcode && lhs.value == rhs.value && lhs.value2 == rhs.value2 &&
           lhs.delta == rhs.delta;
  }
  friend bool operator!=(const BinaryAnnotation& lhs, const BinaryAnnotation& rhs) {
    return !(lhs == rhs);
  }
};

/**
 * @brief Reads a compressed unsigned integer (1, 2 or 4 bytes).
 * Throws Error(kInvalidCompressedAnnotation) on an invalid lead byte.
 */
uint32_t ReadCompressedUnsigned(ParseBuffer& buf);

/// @brief Decodes a signed operand: magnitude in bits 1-31, sign in bit 0
int32_t DecodeSignedOperand(uint32_t value);

class BinaryAnnotationsIterator {
 public:
  BinaryAnnotationsIterator() = default;
  explicit BinaryAnnotationsIterator(ByteSpan data) : buf_(data) {}

  /**
   * @brief Next annotation, std::nullopt at the end of the data or at the first BA_OP_Invalid.
   * Throws Error(kUnknownBinaryAnnotation) for opcodes above BA_OP_ChangeColumnEnd.
   */
  std::optional<BinaryAnnotation> Next();

 private:
  ParseBuffer buf_;
  bool done_ = false;
};

/// @brief Raw annotation bytes of an inline site
class BinaryAnnotations {
 public:
  BinaryAnnotations() = default;
  explicit BinaryAnnotations(ByteSpan data) : data_(data) {}

  inline BinaryAnnotationsIterator Iter() const { return BinaryAnnotationsIterator(data_); }
  inline ByteSpan GetData() const { return data_; }

 private:
  ByteSpan data_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_BINARY_ANNOTATIONS_H_
