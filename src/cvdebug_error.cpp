//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#include "cvdebug/cvdebug_error.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>

#include "utils/enum_conversion_helper.h"

using namespace cvdebug;

constexpr const char* const kErrorKindFallback = "INVALID";

inline constexpr static std::array kErrorKindStrTable = {
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kUnexpectedEof,
                                            "unexpected end of data"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kUnimplementedDebugSubsection,
                                            "unimplemented debug subsection"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kUnimplementedFileChecksumKind,
                                            "unimplemented file checksum kind"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kUnimplementedSymbolKind,
                                            "unimplemented symbol kind"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kInvalidStreamLength,
                                            "invalid stream length"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kInvalidFileChecksumOffset,
                                            "invalid file checksum offset"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kInvalidCompressedAnnotation,
                                            "invalid compressed annotation"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kUnknownBinaryAnnotation,
                                            "unknown binary annotation"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kNotACrossModuleRef,
                                            "not a cross module reference"),
    CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(ErrorKind, ErrorKind::kCrossModuleRefNotFound,
                                            "cross module reference not found"),
};

const char* cvdebug::ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kUnexpectedEof, kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kUnimplementedDebugSubsection,
                            kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kUnimplementedFileChecksumKind,
                            kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kUnimplementedSymbolKind, kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kInvalidStreamLength, kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kInvalidFileChecksumOffset, kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kInvalidCompressedAnnotation,
                            kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kUnknownBinaryAnnotation, kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kNotACrossModuleRef, kErrorKindStrTable)
    CVDEBUG_ENUM_CONVERSION(ErrorKind, ErrorKind::kCrossModuleRefNotFound, kErrorKindStrTable)
  }
  return kErrorKindFallback;
}

static std::string FormatErrorMessage(ErrorKind kind, uint64_t value, const std::string& context) {
  if (context.empty()) {
    return fmt::format("{} (0x{:x})", ErrorKindToString(kind), value);
  }
  return fmt::format("{}: {} (0x{:x})", context, ErrorKindToString(kind), value);
}

Error::Error(ErrorKind kind, uint64_t value, const std::string& context)
    : std::runtime_error(FormatErrorMessage(kind, value, context)), kind_(kind), value_(value) {}
