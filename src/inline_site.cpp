//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/inline_site.hpp"

#include "cvdebug/parse_buffer.hpp"

using namespace cvdebug;

InlineSiteSymbol InlineSiteSymbol::Parse(uint16_t kind, ByteSpan body) {
  if (kind != S_INLINESITE && kind != S_INLINESITE2) {
    throw Error(ErrorKind::kUnimplementedSymbolKind, kind);
  }

  ParseBuffer buf(body);
  InlineSiteSymbol symbol;

  uint32_t parent = buf.Parse<uint32_t>();
  if (parent != 0) {
    symbol.parent = SymbolIndex{parent};
  }
  symbol.end = SymbolIndex{buf.Parse<uint32_t>()};
  symbol.inlinee = IdIndex(buf.Parse<uint32_t>());
  if (kind == S_INLINESITE2) {
    symbol.invocations = buf.Parse<uint32_t>();
  }
  symbol.annotations = BinaryAnnotations(buf.Remaining());

  return symbol;
}
