//==============================================================
// Copyright (C) Intel Corporation
//
// SPDX-License-Identifier: MIT
// =============================================================

/**
 * @file parse_buffer.hpp
 * @brief Bounds-checked little-endian cursor over module debug data.
 */

#ifndef CVDEBUG_PARSE_BUFFER_H_
#define CVDEBUG_PARSE_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "codeview_types.hpp"
#include "cvdebug_error.hpp"

namespace cvdebug {

class ParseBuffer {
 public:
  ParseBuffer() = default;
  ParseBuffer(const uint8_t* data, size_t size) : data_(data), size_(size) {}
  explicit ParseBuffer(ByteSpan span) : data_(span.data), size_(span.size) {}

  inline bool IsEmpty() const { return pos_ >= size_; }
  inline size_t Len() const { return size_ - pos_; }
  inline size_t Pos() const { return pos_; }

  /**
   * @brief Returns the next size bytes and advances past them.
   * Throws Error(kUnexpectedEof) and leaves the cursor in place if fewer bytes remain.
   */
  ByteSpan Take(size_t size);

  /// @brief Remaining bytes, without advancing
  inline ByteSpan Remaining() const { return ByteSpan(data_ + pos_, Len()); }

  /**
   * @brief Advances to the next multiple of alignment, counted from the start of the buffer.
   */
  void Align(size_t alignment);

  template <typename T>
  T Parse() {
    static_assert(std::is_integral<T>::value, "Only integers are parsed directly");
    using U = typename std::make_unsigned<T>::type;
    ByteSpan bytes = Take(sizeof(T));
    U value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
      value |= static_cast<U>(static_cast<U>(bytes.data[i]) << (8 * i));
    }
    return static_cast<T>(value);
  }

 private:
  const uint8_t* data_ = nullptr;
  size_t size_ = 0;
  size_t pos_ = 0;
};

/// @brief Reads a little-endian u32 at index * 4 in the span. The caller checks bounds.
inline uint32_t ReadU32At(ByteSpan span, size_t index) {
  const uint8_t* ptr = span.data + index * sizeof(uint32_t);
  return static_cast<uint32_t>(ptr[0]) | (static_cast<uint32_t>(ptr[1]) << 8) |
         (static_cast<uint32_t>(ptr[2]) << 16) | (static_cast<uint32_t>(ptr[3]) << 24);
}

}  // namespace cvdebug

#endif  // CVDEBUG_PARSE_BUFFER_H_
