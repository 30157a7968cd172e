//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#ifndef CVDEBUG_CVDEBUG_ERROR_H_
#define CVDEBUG_CVDEBUG_ERROR_H_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cvdebug {

enum class ErrorKind {
  kUnexpectedEof,
  kUnimplementedDebugSubsection,
  kUnimplementedFileChecksumKind,
  kUnimplementedSymbolKind,
  kInvalidStreamLength,
  kInvalidFileChecksumOffset,
  kInvalidCompressedAnnotation,
  kUnknownBinaryAnnotation,
  kNotACrossModuleRef,
  kCrossModuleRefNotFound,
};

const char* ErrorKindToString(ErrorKind kind);

/**
 * @brief Decode failure. value() carries the raw value that could not be decoded (subsection kind,
 * checksum kind, index, offset...) or the number of missing bytes for kUnexpectedEof.
 */
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, uint64_t value, const std::string& context = std::string());

  inline ErrorKind kind() const { return kind_; }
  inline uint64_t value() const { return value_; }

 private:
  ErrorKind kind_;
  uint64_t value_;
};

}  // namespace cvdebug

#endif  // CVDEBUG_CVDEBUG_ERROR_H_
