//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/inlinee_line_state_machine.hpp"

#include <spdlog/spdlog.h>

#include <utility>

using namespace cvdebug;

// Signed delta against an unsigned base, truncated to 32 bits.
static inline uint32_t ApplyDelta(uint32_t base, int32_t delta) {
  return static_cast<uint32_t>(static_cast<int64_t>(base) + static_cast<int64_t>(delta));
}

// Code offset movement carried by a line-info-emitting annotation.
static uint32_t EmittedCodeDelta(const BinaryAnnotation& annotation) {
  if (annotation.opcode == BinaryAnnotationOpcode::kChangeCodeLengthAndCodeOffset) {
    return annotation.value2;
  }
  return annotation.value;
}

InlineeLineIterator::InlineeLineIterator(SectionOffset parent_offset,
                                         const InlineSiteSymbol& inline_site,
                                         const InlineeSourceLine& inlinee_line)
    : annotations_(inline_site.annotations.Iter()) {
  state_.file_index = inlinee_line.file_id;
  state_.code_offset = parent_offset;
  state_.line = inlinee_line.line;
}

void InlineeLineIterator::BackPatchLength(uint32_t length) {
  if (pending_ && !pending_->length && pending_->kind == state_.kind) {
    pending_->length = length;
  }
}

void InlineeLineIterator::Apply(const BinaryAnnotation& annotation) {
  switch (annotation.opcode) {
    case BinaryAnnotationOpcode::kCodeOffset:
      state_.code_offset.offset = annotation.value;
      break;
    case BinaryAnnotationOpcode::kChangeCodeOffsetBase:
      state_.code_offset_base = annotation.value;
      break;
    case BinaryAnnotationOpcode::kChangeCodeOffset:
      state_.code_offset = state_.code_offset.WrappingAdd(annotation.value);
      break;
    case BinaryAnnotationOpcode::kChangeCodeLength:
      BackPatchLength(annotation.value);
      state_.code_offset = state_.code_offset.WrappingAdd(annotation.value);
      break;
    case BinaryAnnotationOpcode::kChangeFile:
      state_.file_index = FileIndex{annotation.value};
      break;
    case BinaryAnnotationOpcode::kChangeLineOffset:
      state_.line = ApplyDelta(state_.line, annotation.delta);
      break;
    case BinaryAnnotationOpcode::kChangeLineEndDelta:
      state_.line_length = annotation.value;
      break;
    case BinaryAnnotationOpcode::kChangeRangeKind:
      if (annotation.value == 0) {
        state_.kind = LineInfoKind::kExpression;
      } else if (annotation.value == 1) {
        state_.kind = LineInfoKind::kStatement;
      }
      break;
    case BinaryAnnotationOpcode::kChangeColumnStart:
      state_.column_start = annotation.value;
      break;
    case BinaryAnnotationOpcode::kChangeColumnEndDelta:
      if (state_.column_end) {
        state_.column_end = ApplyDelta(*state_.column_end, annotation.delta);
      }
      break;
    case BinaryAnnotationOpcode::kChangeCodeOffsetAndLineOffset:
      state_.code_offset = state_.code_offset.WrappingAdd(annotation.value);
      state_.line = ApplyDelta(state_.line, annotation.delta);
      break;
    case BinaryAnnotationOpcode::kChangeCodeLengthAndCodeOffset:
      state_.code_length = annotation.value;
      state_.code_offset = state_.code_offset.WrappingAdd(annotation.value2);
      break;
    case BinaryAnnotationOpcode::kChangeColumnEnd:
      state_.column_end = annotation.value;
      break;
    case BinaryAnnotationOpcode::kInvalid:
      break;
  }
}

LineInfo InlineeLineIterator::MakeLineInfo() const {
  LineInfo info;
  info.offset = state_.code_offset.WrappingAdd(state_.code_offset_base);
  info.length = state_.code_length;
  info.file_index = state_.file_index;
  info.line_start = state_.line;
  info.line_end = state_.line + state_.line_length;
  info.column_start = state_.column_start;
  info.column_end = state_.column_end;
  info.kind = state_.kind;
  return info;
}

std::optional<LineInfo> InlineeLineIterator::Next() {
  while (auto annotation = annotations_.Next()) {
    SPDLOG_TRACE("Inlinee annotation {}: {} {} {}",
                 BinaryAnnotationOpcodeToString(annotation->opcode), annotation->value,
                 annotation->value2, annotation->delta);
    Apply(*annotation);

    if (!annotation->EmitsLineInfo()) {
      continue;
    }

    // The pending range ends where this annotation moved the code offset.
    BackPatchLength(EmittedCodeDelta(*annotation));

    LineInfo info = MakeLineInfo();

    // Code length only applies to the record it was set for.
    state_.code_length = std::nullopt;

    std::optional<LineInfo> previous = std::exchange(pending_, info);
    if (previous) {
      return previous;
    }
  }

  return std::exchange(pending_, std::nullopt);
}
