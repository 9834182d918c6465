// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// codec.ipp - Implementation details for codec
// This file is included at the end of codec.hpp
// DO NOT include this file directly

#include <algorithm>
#include <bit>
#include <cstring>
#include <stdexcept>

namespace kressler::bounded_containers {

namespace detail {
inline constexpr error not_enough_data(errc::not_enough_data,
                                       "not enough data to fill buffer");
inline constexpr error compact_out_of_range(
    errc::invalid_compact, "out of range compact integer");
inline constexpr error compact_not_canonical(
    errc::invalid_compact, "non-canonical compact integer");

inline constexpr std::uint64_t single_byte_limit = 1ull << 6;
inline constexpr std::uint64_t two_byte_limit = 1ull << 14;
inline constexpr std::uint64_t four_byte_limit = 1ull << 30;
}  // namespace detail

// ============================================================================
// Inputs
// ============================================================================

inline std::expected<void, error> slice_input::read(
    std::span<std::uint8_t> out) noexcept {
  if (out.size() > data_.size()) {
    return std::unexpected(detail::not_enough_data);
  }
  if (!out.empty()) {
    std::memcpy(out.data(), data_.data(), out.size());
  }
  data_ = data_.subspan(out.size());
  return {};
}

template <Input I>
std::expected<void, error> prepend_input<I>::read(
    std::span<std::uint8_t> out) {
  // Serve from the reattached prefix first, then fall through to the inner
  // input for whatever is left
  std::size_t from_prefix = std::min(prefix_.size(), out.size());
  if (from_prefix > 0) {
    std::memcpy(out.data(), prefix_.data(), from_prefix);
    prefix_ = prefix_.subspan(from_prefix);
  }
  if (from_prefix == out.size()) {
    return {};
  }
  return inner_.read(out.subspan(from_prefix));
}

template <Input I>
std::optional<std::size_t> prepend_input<I>::remaining_len() const {
  auto inner = inner_.remaining_len();
  if (!inner) {
    return std::nullopt;
  }
  return *inner + prefix_.size();
}

template <Input I>
std::expected<std::uint8_t, error> read_byte(I& in) {
  std::uint8_t byte = 0;
  if (auto r = in.read(std::span<std::uint8_t>(&byte, 1)); !r) {
    return std::unexpected(r.error());
  }
  return byte;
}

// ============================================================================
// Compact integers
// ============================================================================

constexpr std::size_t compact_len(std::uint64_t value) noexcept {
  if (value < detail::single_byte_limit) {
    return 1;
  }
  if (value < detail::two_byte_limit) {
    return 2;
  }
  if (value < detail::four_byte_limit) {
    return 4;
  }
  std::size_t bytes = (static_cast<std::size_t>(std::bit_width(value)) + 7) / 8;
  return 1 + std::max<std::size_t>(bytes, 4);
}

inline void encode_compact(std::uint64_t value, byte_buffer& out) {
  auto put_le = [&out](std::uint64_t bits, std::size_t bytes) {
    for (std::size_t i = 0; i < bytes; ++i) {
      out.push_back(static_cast<std::uint8_t>(bits >> (i * 8)));
    }
  };

  if (value < detail::single_byte_limit) {
    out.push_back(static_cast<std::uint8_t>(value << 2));
  } else if (value < detail::two_byte_limit) {
    put_le((value << 2) | 0b01, 2);
  } else if (value < detail::four_byte_limit) {
    put_le((value << 2) | 0b10, 4);
  } else {
    std::size_t bytes = compact_len(value) - 1;
    out.push_back(static_cast<std::uint8_t>(((bytes - 4) << 2) | 0b11));
    put_le(value, bytes);
  }
}

template <std::unsigned_integral T, Input I>
std::expected<T, error> decode_compact(I& in) {
  auto first = read_byte(in);
  if (!first) {
    return std::unexpected(first.error());
  }

  // Reads `count` more little-endian bytes above the ones already in `bits`
  auto read_le = [&in](std::uint64_t& bits, std::size_t offset,
                       std::size_t count) -> std::expected<void, error> {
    std::uint8_t buf[8] = {};
    if (auto r = in.read(std::span<std::uint8_t>(buf, count)); !r) {
      return r;
    }
    for (std::size_t i = 0; i < count; ++i) {
      bits |= static_cast<std::uint64_t>(buf[i]) << ((offset + i) * 8);
    }
    return {};
  };

  std::uint64_t value = 0;
  switch (*first & 0b11) {
    case 0b00:
      value = *first >> 2;
      break;
    case 0b01: {
      std::uint64_t bits = *first;
      if (auto r = read_le(bits, 1, 1); !r) {
        return std::unexpected(r.error());
      }
      value = bits >> 2;
      if (value < detail::single_byte_limit) {
        return std::unexpected(detail::compact_not_canonical);
      }
      break;
    }
    case 0b10: {
      std::uint64_t bits = *first;
      if (auto r = read_le(bits, 1, 3); !r) {
        return std::unexpected(r.error());
      }
      value = bits >> 2;
      if (value < detail::two_byte_limit) {
        return std::unexpected(detail::compact_not_canonical);
      }
      break;
    }
    default: {
      std::size_t bytes = static_cast<std::size_t>(*first >> 2) + 4;
      if (bytes > sizeof(T) || bytes > sizeof(std::uint64_t)) {
        return std::unexpected(detail::compact_out_of_range);
      }
      if (auto r = read_le(value, 0, bytes); !r) {
        return std::unexpected(r.error());
      }
      // Big-integer mode must not be used for values that fit a shorter mode,
      // and must not carry a zero top byte
      if (value < detail::four_byte_limit) {
        return std::unexpected(detail::compact_not_canonical);
      }
      if (bytes > 4 && (value >> ((bytes - 1) * 8)) == 0) {
        return std::unexpected(detail::compact_not_canonical);
      }
      break;
    }
  }

  if (value > std::numeric_limits<T>::max()) {
    return std::unexpected(detail::compact_out_of_range);
  }
  return static_cast<T>(value);
}

inline void encode_length(std::size_t n, byte_buffer& out) {
  if (n > std::numeric_limits<std::uint32_t>::max()) {
    throw std::length_error("Cannot encode: collection length exceeds u32");
  }
  encode_compact(n, out);
}

// ============================================================================
// Entry points
// ============================================================================

template <Decodable T>
std::expected<T, error> decode_all(std::span<const std::uint8_t> bytes) {
  slice_input in(bytes);
  auto value = codec<T>::decode(in);
  if (!value) {
    return value;
  }
  if (!in.remaining().empty()) {
    return std::unexpected(
        error(errc::trailing_data, "input has trailing bytes after value"));
  }
  return value;
}

template <typename T, Input I>
  requires Decodable<T>
std::expected<void, error> skip(I& in) {
  if constexpr (requires { codec<T>::skip(in); }) {
    return codec<T>::skip(in);
  } else {
    auto value = codec<T>::decode(in);
    if (!value) {
      return std::unexpected(value.error());
    }
    return {};
  }
}

}  // namespace kressler::bounded_containers
