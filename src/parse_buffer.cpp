//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/parse_buffer.hpp"

using namespace cvdebug;

ByteSpan ParseBuffer::Take(size_t size) {
  if (size > Len()) {
    throw Error(ErrorKind::kUnexpectedEof, size - Len());
  }
  ByteSpan span(data_ + pos_, size);
  pos_ += size;
  return span;
}

void ParseBuffer::Align(size_t alignment) {
  if (alignment == 0) {
    return;
  }
  size_t diff = pos_ % alignment;
  if (diff > 0) {
    size_t padding = alignment - diff;
    if (Len() < padding) {
      throw Error(ErrorKind::kUnexpectedEof, padding - Len());
    }
    pos_ += padding;
  }
}
