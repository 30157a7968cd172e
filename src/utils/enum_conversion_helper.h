//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

#ifndef CVDEBUG_UTILS_ENUM_CONVERSION_HELPER_H_
#define CVDEBUG_UTILS_ENUM_CONVERSION_HELPER_H_

#include <cstdlib>
#include <optional>

namespace cvdebug::utils {

template <typename E, typename T>
struct EnumContainer {
  E value_;
  T conversion_;
};

template <typename E>
using EnumToString = EnumContainer<E, const char*>;

// Lookup an enum value index from the table evaluated at compile time.
template <typename E, typename C>
inline constexpr std::optional<std::size_t> EnumIdx(E my_enum, C container) {
  std::size_t count = 0;
  for (const auto& enum_container : container) {
    if (my_enum == enum_container.value_) {
      return count;
    }
    count++;
  }
  return std::nullopt;
}

#define CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(enum_type, enum_value, enum_string) \
  cvdebug::utils::EnumToString<enum_type> { enum_value, enum_string }
#define CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_DEFAULT(enum_type, enum_value) \
  CVDEBUG_ASSOCIATE_ENUM_MEMBER_TO_STRING(enum_type, enum_value, #enum_value)
#define CVDEBUG_ENUM_CONVERSION(enum_type, enum_value, container)             \
  case enum_value: {                                                          \
    constexpr auto enum_idx = cvdebug::utils::EnumIdx(enum_value, container); \
    static_assert(enum_idx != std::nullopt);                                  \
    return container[*enum_idx].conversion_;                                  \
  }

}  // namespace cvdebug::utils

#endif  // CVDEBUG_UTILS_ENUM_CONVERSION_HELPER_H_
