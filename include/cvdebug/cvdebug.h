//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file cvdebug.h
 * @brief This file contains the declaration of C functions for reading module debug data.
 */

#ifndef CVDEBUG_CVDEBUG_H_
#define CVDEBUG_CVDEBUG_H_

#include <stdbool.h>
#include <stdint.h>

#include "cvdebug_mapping.h"

#ifdef __cplusplus
extern "C" {
#endif  // __cplusplus

typedef enum {
  CVDEBUG_SUCCESS = 0,                           //!< success
  CVDEBUG_ERROR_BAD_ARGUMENT = 1,                //!< invalid argument
  CVDEBUG_ERROR_UNEXPECTED_EOF = 2,              //!< debug data is truncated
  CVDEBUG_ERROR_UNIMPLEMENTED_FORMAT = 3,        //!< unknown subsection, checksum or record kind
  CVDEBUG_ERROR_INVALID_STRUCTURE = 4,           //!< malformed debug data
  CVDEBUG_ERROR_NOT_A_CROSS_MODULE_REF = 5,      //!< index is not a cross module reference
  CVDEBUG_ERROR_CROSS_MODULE_REF_NOT_FOUND = 6,  //!< reference not in the import table
  CVDEBUG_DEBUG_INFO_NOT_FOUND = 16,             //!< no debug info for the request
  CVDEBUG_ERROR_INTERNAL = 200,                  //!< internal error
} cvdebug_result;

typedef enum {
  CVDEBUG_INDEX_TYPE = 0,  //!< index into the type stream (TPI)
  CVDEBUG_INDEX_ID = 1,    //!< index into the id stream (IPI)
} cvdebug_index_kind;

typedef void* cvdebug_module_handle_t;

/**
 * @brief Create module reader
 * @param data - pointer to the C13 debug data of the module
 * @param size - size of data
 * @param module - pointer to module handle
 * @return CVDEBUG_SUCCESS if success, CVDEBUG_ERROR_BAD_ARGUMENT if invalid argument, or the
 * status of the framing error if the subsections of the data cannot be walked
 */
cvdebug_result cvdebugModuleCreate(/*IN*/ const uint8_t* data, /*IN*/ uint32_t size,
                                   /*OUT*/ cvdebug_module_handle_t* module);

/**
 * @brief Delete module reader
 * @param module - pointer to module handle to delete
 */
cvdebug_result cvdebugModuleDestroy(/*IN*/ cvdebug_module_handle_t* module);

/**
 * @brief Check if module reader is valid
 * @param module - module handle to check
 * @param is_valid - pointer to bool, where result is stored
 * @return CVDEBUG_SUCCESS if success, CVDEBUG_ERROR_BAD_ARGUMENT if invalid argument
 */
cvdebug_result cvdebugModuleIsValid(/*IN*/ cvdebug_module_handle_t module,
                                    /*OUT*/ bool* is_valid);

/**
 * @brief Get line records of all line subsections of the module
 * @param module - module handle.
 * @param num_entries - number of entries in mappings array. If mappings is nullptr, only
 * num_mappings is set. Should be greater than 0 in case mappings is not nullptr.
 * @param mappings - array of CvLineMapping structures. Size of array should be at least
 * num_entries. The number of records returned is minimum of num_entries and the actual number of
 * records.
 * @param num_mappings - number of found records. If num_mappings is nullptr, this argument is
 * ignored.
 * @return CVDEBUG_SUCCESS if success, CVDEBUG_ERROR_BAD_ARGUMENT if invalid argument,
 * CVDEBUG_DEBUG_INFO_NOT_FOUND if the module has no line records, or the status of the decode error
 */
cvdebug_result cvdebugModuleGetLineMappings(/*IN*/ cvdebug_module_handle_t module,
                                            /*IN*/ uint32_t num_entries,
                                            /*OUT*/ CvLineMapping* mappings,
                                            /*OUT*/ uint32_t* num_mappings);

/**
 * @brief Get the file of a line record
 * @param module - module handle.
 * @param file_index - file_index of a CvLineMapping, a byte offset into the file checksums table
 * @param info - pointer to store file info. The checksum points into the original data.
 * @return CVDEBUG_SUCCESS if success, CVDEBUG_ERROR_BAD_ARGUMENT if invalid argument,
 * CVDEBUG_ERROR_INVALID_STRUCTURE if there is no file at file_index
 */
cvdebug_result cvdebugModuleGetFileInfo(/*IN*/ cvdebug_module_handle_t module,
                                        /*IN*/ uint32_t file_index, /*OUT*/ CvFileInfo* info);

/**
 * @brief Resolve a cross module reference through the import table of the module
 * @param module - module handle.
 * @param index_kind - index space of index
 * @param index - type or id index with the cross module bit set
 * @param ref - pointer to store the declaring module and its local index
 * @return CVDEBUG_SUCCESS if success, CVDEBUG_ERROR_BAD_ARGUMENT if invalid argument,
 * CVDEBUG_ERROR_NOT_A_CROSS_MODULE_REF or CVDEBUG_ERROR_CROSS_MODULE_REF_NOT_FOUND
 */
cvdebug_result cvdebugModuleResolveImport(/*IN*/ cvdebug_module_handle_t module,
                                          /*IN*/ cvdebug_index_kind index_kind,
                                          /*IN*/ uint32_t index,
                                          /*OUT*/ CvCrossModuleRef* ref);

/**
 * @brief Look up a local index in the export table of the module
 * @param module - module handle.
 * @param local_index - index local to this module
 * @param entry - pointer to store the export record
 * @return CVDEBUG_SUCCESS if success, CVDEBUG_ERROR_BAD_ARGUMENT if invalid argument,
 * CVDEBUG_DEBUG_INFO_NOT_FOUND if the index is not exported
 */
cvdebug_result cvdebugModuleResolveExport(/*IN*/ cvdebug_module_handle_t module,
                                          /*IN*/ uint32_t local_index,
                                          /*OUT*/ CvCrossModuleExport* entry);

/**
 * @brief Returns a human readable name of a result value
 */
const char* cvdebugResultTypeToString(cvdebug_result result);

#ifdef __cplusplus
}  // extern "C"
#endif  // __cplusplus

#endif  // CVDEBUG_CVDEBUG_H_
