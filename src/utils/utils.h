//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#ifndef CVDEBUG_UTILS_UTILS_H_
#define CVDEBUG_UTILS_UTILS_H_

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <stdlib.h>

#include <iostream>
#include <mutex>
#include <string>

#define CVDEBUG_LOG_LEVEL_ENV "CVDEBUG_LOG_LEVEL"

namespace cvdebug::utils {

inline std::string GetEnv(const char* name) {
  if (name == nullptr) {
    return std::string();
  }
#if defined(_WIN32)
  char* value = nullptr;
  errno_t status = _dupenv_s(&value, nullptr, name);
  if (status != 0 || value == nullptr) {
    return std::string();
  }
  std::string result(value);
  free(value);
  return result;
#else
  const char* value = getenv(name);
  if (value == nullptr) {
    return std::string();
  }
  return std::string(value);
#endif
}

inline void SetGlobalSpdLogPattern() {
  // https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
  spdlog::set_pattern("CVDEBUG:[%H:%M][%^-%l-%$]%P:%t %s:%# %v");
}

// Runtime level is warn unless CVDEBUG_LOG_LEVEL=<level> (trace/debug/info..) says otherwise.
// Messages below SPDLOG_ACTIVE_LEVEL are compiled out: build with CVDEBUG_ENABLE_LOGGING=ON to
// get debug and trace output.
inline void ConfigureLogging() {
  static std::once_flag configured;
  std::call_once(configured, [] {
    try {
      spdlog::set_level(spdlog::level::warn);
      std::string env_string = GetEnv(CVDEBUG_LOG_LEVEL_ENV);
      if (!env_string.empty()) {
        spdlog::cfg::helpers::load_levels(env_string);
      }
      SetGlobalSpdLogPattern();
    } catch (const spdlog::spdlog_ex& exception) {
      std::cerr << "Failed to configure logging: " << exception.what() << std::endl;
    }
  });
}

}  // namespace cvdebug::utils

#endif  // CVDEBUG_UTILS_UTILS_H_
