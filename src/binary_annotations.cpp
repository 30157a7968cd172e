//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/binary_annotations.hpp"

#include <spdlog/spdlog.h>

using namespace cvdebug;

const char* cvdebug::BinaryAnnotationOpcodeToString(BinaryAnnotationOpcode opcode) {
  switch (opcode) {
    case BinaryAnnotationOpcode::kInvalid:
      return "Invalid";
    case BinaryAnnotationOpcode::kCodeOffset:
      return "CodeOffset";
    case BinaryAnnotationOpcode::kChangeCodeOffsetBase:
      return "ChangeCodeOffsetBase";
    case BinaryAnnotationOpcode::kChangeCodeOffset:
      return "ChangeCodeOffset";
    case BinaryAnnotationOpcode::kChangeCodeLength:
      return "ChangeCodeLength";
    case BinaryAnnotationOpcode::kChangeFile:
      return "ChangeFile";
    case BinaryAnnotationOpcode::kChangeLineOffset:
      return "ChangeLineOffset";
    case BinaryAnnotationOpcode::kChangeLineEndDelta:
      return "ChangeLineEndDelta";
    case BinaryAnnotationOpcode::kChangeRangeKind:
      return "ChangeRangeKind";
    case BinaryAnnotationOpcode::kChangeColumnStart:
      return "ChangeColumnStart";
    case BinaryAnnotationOpcode::kChangeColumnEndDelta:
      return "ChangeColumnEndDelta";
    case BinaryAnnotationOpcode::kChangeCodeOffsetAndLineOffset:
      return "ChangeCodeOffsetAndLineOffset";
    case BinaryAnnotationOpcode::kChangeCodeLengthAndCodeOffset:
      return "ChangeCodeLengthAndCodeOffset";
    case BinaryAnnotationOpcode::kChangeColumnEnd:
      return "ChangeColumnEnd";
  }
  return "Unknown";
}

bool BinaryAnnotation::EmitsLineInfo() const {
  return opcode == BinaryAnnotationOpcode::kChangeCodeOffset ||
         opcode == BinaryAnnotationOpcode::kChangeCodeOffsetAndLineOffset ||
         opcode == BinaryAnnotationOpcode::kChangeCodeLengthAndCodeOffset;
}

BinaryAnnotation BinaryAnnotation::Unsigned(BinaryAnnotationOpcode opcode, uint32_t value) {
  BinaryAnnotation annotation;
  annotation.opcode = opcode;
  annotation.value = value;
  return annotation;
}

BinaryAnnotation BinaryAnnotation::Signed(BinaryAnnotationOpcode opcode, int32_t delta) {
  BinaryAnnotation annotation;
  annotation.opcode = opcode;
  annotation.delta = delta;
  return annotation;
}

BinaryAnnotation BinaryAnnotation::CodeOffsetAndLineOffset(uint32_t code_delta,
                                                           int32_t line_delta) {
  BinaryAnnotation annotation;
  annotation.opcode = BinaryAnnotationOpcode::kChangeCodeOffsetAndLineOffset;
  annotation.value = code_delta;
  annotation.delta = line_delta;
  return annotation;
}

BinaryAnnotation BinaryAnnotation::CodeLengthAndCodeOffset(uint32_t code_length,
                                                           uint32_t code_delta) {
  BinaryAnnotation annotation;
  annotation.opcode = BinaryAnnotationOpcode::kChangeCodeLengthAndCodeOffset;
  annotation.value = code_length;
  annotation.value2 = code_delta;
  return annotation;
}

uint32_t cvdebug::ReadCompressedUnsigned(ParseBuffer& buf) {
  uint32_t b1 = buf.Parse<uint8_t>();

  if ((b1 & CV_COMPRESSED_1BYTE_FLAG) == 0) {
    return b1;
  }

  if ((b1 & CV_COMPRESSED_2BYTE_MASK) == CV_COMPRESSED_2BYTE_TAG) {
    uint32_t b2 = buf.Parse<uint8_t>();
    return ((b1 & 0x3f) << 8) | b2;
  }

  if ((b1 & CV_COMPRESSED_4BYTE_MASK) == CV_COMPRESSED_4BYTE_TAG) {
    uint32_t b2 = buf.Parse<uint8_t>();
    uint32_t b3 = buf.Parse<uint8_t>();
    uint32_t b4 = buf.Parse<uint8_t>();
    return ((b1 & 0x1f) << 24) | (b2 << 16) | (b3 << 8) | b4;
  }

  throw Error(ErrorKind::kInvalidCompressedAnnotation, b1);
}

int32_t cvdebug::DecodeSignedOperand(uint32_t value) {
  int32_t magnitude = static_cast<int32_t>(value >> 1);
  return (value & 1) ? -magnitude : magnitude;
}

std::optional<BinaryAnnotation> BinaryAnnotationsIterator::Next() {
  if (done_ || buf_.IsEmpty()) {
    return std::nullopt;
  }

  uint32_t op = ReadCompressedUnsigned(buf_);
  switch (op) {
    case BA_OP_Invalid:
      // Trailing padding
      done_ = true;
      return std::nullopt;
    case BA_OP_CodeOffset:
    case BA_OP_ChangeCodeOffsetBase:
    case BA_OP_ChangeCodeOffset:
    case BA_OP_ChangeCodeLength:
    case BA_OP_ChangeFile:
    case BA_OP_ChangeLineEndDelta:
    case BA_OP_ChangeRangeKind:
    case BA_OP_ChangeColumnStart:
    case BA_OP_ChangeColumnEnd:
      return BinaryAnnotation::Unsigned(static_cast<BinaryAnnotationOpcode>(op),
                                        ReadCompressedUnsigned(buf_));
    case BA_OP_ChangeLineOffset:
    case BA_OP_ChangeColumnEndDelta:
      return BinaryAnnotation::Signed(static_cast<BinaryAnnotationOpcode>(op),
                                      DecodeSignedOperand(ReadCompressedUnsigned(buf_)));
    case BA_OP_ChangeCodeOffsetAndLineOffset: {
      uint32_t operand = ReadCompressedUnsigned(buf_);
      return BinaryAnnotation::CodeOffsetAndLineOffset(operand & 0xf,
                                                       DecodeSignedOperand(operand >> 4));
    }
    case BA_OP_ChangeCodeLengthAndCodeOffset: {
      uint32_t code_length = ReadCompressedUnsigned(buf_);
      uint32_t code_delta = ReadCompressedUnsigned(buf_);
      return BinaryAnnotation::CodeLengthAndCodeOffset(code_length, code_delta);
    }
    default:
      SPDLOG_DEBUG("Unknown binary annotation opcode {} at 0x{:x}", op, buf_.Pos());
      throw Error(ErrorKind::kUnknownBinaryAnnotation, op);
  }
}
