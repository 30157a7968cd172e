//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#ifndef CVDEBUG_CVDEBUG_MAPPING_H_
#define CVDEBUG_CVDEBUG_MAPPING_H_

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif  // __cplusplus

typedef struct CvLineMapping {
  uint32_t offset;        // section-relative code offset
  uint16_t section;       // code section index
  bool has_length;        // false if the code length of the record is unknown
  uint32_t length;        // code length in bytes, 0 if has_length is false
  uint32_t file_index;    // byte offset of the file in the file checksums table
  uint32_t line_start;
  uint32_t line_end;
  uint32_t column_start;  // 0 if the module has no column information
  uint32_t column_end;    // 0 if the module has no column information
  bool is_statement;      // false for expressions
} CvLineMapping;

typedef struct CvFileInfo {
  uint32_t name_offset;     // offset of the file name in the string table
  uint32_t checksum_kind;   // 0 - none, 1 - MD5, 2 - SHA1, 3 - SHA256
  const uint8_t* checksum;  // pointer to the checksum in the original data, nullptr if none
  uint32_t checksum_size;
} CvFileInfo;

typedef struct CvCrossModuleRef {
  uint32_t module_name;  // offset of the declaring module name in the string table
  uint32_t local_index;  // index local to the declaring module
} CvCrossModuleRef;

typedef struct CvCrossModuleExport {
  bool is_id;  // true for an id (IPI) index, false for a type (TPI) index
  uint32_t local_index;
  uint32_t global_index;
} CvCrossModuleExport;

#ifdef __cplusplus
}  // extern "C"
#endif  // __cplusplus

#endif  // CVDEBUG_CVDEBUG_MAPPING_H_
