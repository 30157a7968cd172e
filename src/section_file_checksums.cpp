//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/section_file_checksums.hpp"

#include <spdlog/spdlog.h>

using namespace cvdebug;

FileChecksumKind cvdebug::ParseFileChecksumKind(uint8_t value) {
  switch (value) {
    case 0:
      return FileChecksumKind::kNone;
    case 1:
      return FileChecksumKind::kMd5;
    case 2:
      return FileChecksumKind::kSha1;
    case 3:
      return FileChecksumKind::kSha256;
    default:
      throw Error(ErrorKind::kUnimplementedFileChecksumKind, value);
  }
}

FileChecksumHeader FileChecksumHeader::Parse(ParseBuffer& buf) {
  FileChecksumHeader header;
  header.name_offset = buf.Parse<uint32_t>();
  header.checksum_size = buf.Parse<uint8_t>();
  header.checksum_kind = buf.Parse<uint8_t>();
  return header;
}

std::optional<FileChecksumEntry> DebugFileChecksumsIterator::Next() {
  if (buf_.IsEmpty()) {
    return std::nullopt;
  }

  auto header = FileChecksumHeader::Parse(buf_);
  ByteSpan checksum_data = buf_.Take(header.checksum_size);

  FileChecksumEntry entry;
  entry.name = StringRef{header.name_offset};
  entry.checksum.kind = ParseFileChecksumKind(header.checksum_kind);
  if (entry.checksum.kind != FileChecksumKind::kNone) {
    entry.checksum.bytes = checksum_data;
  }

  buf_.Align(4);
  return entry;
}

DebugFileChecksumsIterator DebugFileChecksumsSubsection::EntriesAtOffset(FileIndex offset) const {
  ParseBuffer buf(data_);
  if (offset.value > buf.Len()) {
    throw Error(ErrorKind::kInvalidFileChecksumOffset, offset.value);
  }
  buf.Take(offset.value);
  SPDLOG_TRACE("File checksums at offset 0x{:x} of 0x{:x}", offset.value, data_.size);
  return DebugFileChecksumsIterator(buf);
}
