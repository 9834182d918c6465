// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <ostream>
#include <string_view>

namespace kressler::bounded_containers {

/**
 * Failure categories reported by bound checks and the byte codec.
 */
enum class errc {
  bound_exceeded,        // construction or insertion past the bound
  decode_size_exceeded,  // length prefix declares more elements than allowed
  not_enough_data,       // input ended before the value was complete
  invalid_compact,       // malformed or non-canonical compact integer
  invalid_value,         // bytes do not form a valid value of the type
  trailing_data,         // decode_all left unread bytes
};

/**
 * Error value returned through std::expected.
 *
 * Messages are string literals with static storage duration so that errors
 * can be created and copied without allocation. Two errors compare equal
 * when both code and message match.
 */
class error {
 public:
  constexpr error(errc code, const char* message) noexcept
      : code_(code), message_(message) {}

  [[nodiscard]] constexpr errc code() const noexcept { return code_; }
  [[nodiscard]] constexpr const char* message() const noexcept {
    return message_;
  }

  friend bool operator==(const error& lhs, const error& rhs) noexcept {
    return lhs.code_ == rhs.code_ &&
           std::string_view(lhs.message_) == std::string_view(rhs.message_);
  }

  friend std::ostream& operator<<(std::ostream& os, const error& err) {
    return os << err.message_;
  }

 private:
  errc code_;
  const char* message_;
};

namespace messages {
inline constexpr const char* decode_size_exceeded =
    "BoundedMap exceeds its limit";
inline constexpr const char* collect_too_long = "iterator length too big";
inline constexpr const char* json_bound_exceeded =
    "map exceeds the size of the bounds";
inline constexpr const char* json_conversion_failed =
    "failed to create a BoundedMap from the provided map";
}  // namespace messages

}  // namespace kressler::bounded_containers
