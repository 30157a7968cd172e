//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file codeview_def.hpp
 * @brief Constants of the CodeView C13 debug subsection format.
 */

#ifndef CVDEBUG_CODEVIEW_DEF_H_
#define CVDEBUG_CODEVIEW_DEF_H_

#include <stdint.h>

namespace cvdebug {

#define DEBUG_S_IGNORE 0x80000000

#define DEBUG_S_SYMBOLS 0xf1
#define DEBUG_S_LINES 0xf2
#define DEBUG_S_STRINGTABLE 0xf3
#define DEBUG_S_FILECHKSMS 0xf4
#define DEBUG_S_FRAMEDATA 0xf5
#define DEBUG_S_INLINEELINES 0xf6
#define DEBUG_S_CROSSSCOPEIMPORTS 0xf7
#define DEBUG_S_CROSSSCOPEEXPORTS 0xf8

#define DEBUG_S_IL_LINES 0xf9
#define DEBUG_S_FUNC_MDTOKEN_MAP 0xfa
#define DEBUG_S_TYPE_MDTOKEN_MAP 0xfb
#define DEBUG_S_MERGED_ASSEMBLYINPUT 0xfc

#define DEBUG_S_COFF_SYMBOL_RVA 0xfd

#define CV_LINES_HAVE_COLUMNS 0x0001

#define CV_INLINEE_SOURCE_LINE_SIGNATURE 0x0
#define CV_INLINEE_SOURCE_LINE_SIGNATURE_EX 0x1

// linenumStart values reserved for debugger hints
#define CV_LINE_DO_NOT_STEP_ONTO 0xfeefee
#define CV_LINE_DO_NOT_STEP_INTO 0xf00f00

#define CV_LINE_START_MASK 0x00ffffffu
#define CV_LINE_DELTA_SHIFT 24
#define CV_LINE_DELTA_MASK 0x7fu
#define CV_LINE_STATEMENT_FLAG 0x80000000u

#define CV_CROSS_MODULE_FLAG 0x80000000u
#define CV_CROSS_MODULE_MODULE_SHIFT 20
#define CV_CROSS_MODULE_MODULE_MASK 0x7ffu
#define CV_CROSS_MODULE_IMPORT_MASK 0x000fffffu

#define S_INLINESITE 0x114d
#define S_INLINESITE2 0x115d

// Binary annotation opcodes of inline site records
#define BA_OP_Invalid 0
#define BA_OP_CodeOffset 1
#define BA_OP_ChangeCodeOffsetBase 2
#define BA_OP_ChangeCodeOffset 3
#define BA_OP_ChangeCodeLength 4
#define BA_OP_ChangeFile 5
#define BA_OP_ChangeLineOffset 6
#define BA_OP_ChangeLineEndDelta 7
#define BA_OP_ChangeRangeKind 8
#define BA_OP_ChangeColumnStart 9
#define BA_OP_ChangeColumnEndDelta 10
#define BA_OP_ChangeCodeOffsetAndLineOffset 11
#define BA_OP_ChangeCodeLengthAndCodeOffset 12
#define BA_OP_ChangeColumnEnd 13

// Compressed annotation operands
#define CV_COMPRESSED_1BYTE_FLAG 0x80
#define CV_COMPRESSED_2BYTE_TAG 0x80
#define CV_COMPRESSED_2BYTE_MASK 0xc0
#define CV_COMPRESSED_4BYTE_TAG 0xc0
#define CV_COMPRESSED_4BYTE_MASK 0xe0

// On-disk record sizes. Records are decoded field by field, these only
// describe how many bytes each one occupies.
constexpr uint32_t kDebugSubsectionHeaderSize = 8;    // kind, len
constexpr uint32_t kDebugLinesHeaderSize = 12;        // offset, section, flags, code_size
constexpr uint32_t kDebugLinesBlockHeaderSize = 12;   // file_index, num_lines, block_size
constexpr uint32_t kLineNumberRecordSize = 8;         // offset, flags
constexpr uint32_t kColumnNumberRecordSize = 4;       // start_column, end_column
constexpr uint32_t kFileChecksumHeaderSize = 6;       // name_offset, size, kind
constexpr uint32_t kCrossScopeExportRecordSize = 8;   // local, global

}  // namespace cvdebug

#endif  // CVDEBUG_CODEVIEW_DEF_H_
