// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace kressler::bounded_containers {

/**
 * Binary codec for the SCALE-style wire format used by bounded containers.
 *
 * Layout rules:
 * - Fixed-width integers are little endian.
 * - bool is a single byte, 0 or 1.
 * - std::monostate (the unit value) occupies no bytes.
 * - Collections (strings, vectors, ordered maps) are a compact u32 element
 *   count followed by the elements; maps emit entries in ascending key order.
 *
 * Compact integers use the two low bits of the first byte as a mode:
 *   0b00  single byte,  value < 2^6
 *   0b01  two bytes,    value < 2^14
 *   0b10  four bytes,   value < 2^30
 *   0b11  big integer,  upper six bits hold (byte count - 4), bytes follow
 * Decoding rejects encodings that are not the shortest form.
 */

using byte_buffer = std::vector<std::uint8_t>;

/**
 * A source of bytes for decoding.
 *
 * read() fills the whole buffer or fails with errc::not_enough_data.
 * remaining_len() reports how many bytes are left when known; decoders use it
 * to avoid reserving memory for lengths the input cannot possibly satisfy.
 */
template <typename I>
concept Input = requires(I& in, const I& cin, std::span<std::uint8_t> buf) {
  { in.read(buf) } -> std::same_as<std::expected<void, error>>;
  { cin.remaining_len() } -> std::same_as<std::optional<std::size_t>>;
};

/**
 * Input over a contiguous byte range. Reading shrinks the viewed range, so
 * remaining() always shows exactly what has not been consumed.
 */
class slice_input {
 public:
  explicit slice_input(std::span<const std::uint8_t> data) noexcept
      : data_(data) {}

  inline std::expected<void, error> read(
      std::span<std::uint8_t> out) noexcept;

  [[nodiscard]] std::optional<std::size_t> remaining_len() const noexcept {
    return data_.size();
  }

  [[nodiscard]] std::span<const std::uint8_t> remaining() const noexcept {
    return data_;
  }

 private:
  std::span<const std::uint8_t> data_;
};

/**
 * Presents already-consumed prefix bytes followed by the rest of an inner
 * input, so a decoder can run as if the prefix had never been read.
 *
 * The prefix span must outlive the adapter.
 */
template <Input I>
class prepend_input {
 public:
  prepend_input(std::span<const std::uint8_t> prefix, I& inner) noexcept
      : prefix_(prefix), inner_(inner) {}

  std::expected<void, error> read(std::span<std::uint8_t> out);

  [[nodiscard]] std::optional<std::size_t> remaining_len() const;

 private:
  std::span<const std::uint8_t> prefix_;
  I& inner_;
};

/**
 * Reads a single byte from any input.
 */
template <Input I>
std::expected<std::uint8_t, error> read_byte(I& in);

/**
 * Wrapper selecting the compact encoding for an unsigned integer.
 */
template <std::unsigned_integral T>
struct compact {
  T value{};

  friend bool operator==(const compact&, const compact&) = default;
};

/**
 * Number of bytes the compact encoding of value occupies.
 */
constexpr std::size_t compact_len(std::uint64_t value) noexcept;

/**
 * Appends the compact encoding of value.
 */
inline void encode_compact(std::uint64_t value, byte_buffer& out);

/**
 * Decodes a compact integer that must fit in T.
 */
template <std::unsigned_integral T, Input I>
std::expected<T, error> decode_compact(I& in);

/**
 * Appends the length prefix of a collection with n elements.
 *
 * @throws std::length_error if n does not fit in a u32
 */
inline void encode_length(std::size_t n, byte_buffer& out);

/**
 * Codec trait. Specializations provide:
 *   static void encode_to(const T&, byte_buffer&);
 *   template <Input I> static std::expected<T, error> decode(I&);
 * and optionally
 *   static constexpr std::size_t max_encoded_len();
 *   static std::expected<std::size_t, error>
 *       decode_length(std::span<const std::uint8_t>);
 *   template <Input I> static std::expected<void, error> skip(I&);
 */
template <typename T>
struct codec;

template <typename T>
concept Encodable = requires(const T& value, byte_buffer& out) {
  codec<T>::encode_to(value, out);
};

template <typename T>
concept Decodable = requires(slice_input& in) {
  { codec<T>::template decode<slice_input>(in) } ->
      std::same_as<std::expected<T, error>>;
};

template <typename T>
concept HasMaxEncodedLen = requires {
  { codec<T>::max_encoded_len() } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept HasDecodeLength = requires(std::span<const std::uint8_t> bytes) {
  { codec<T>::decode_length(bytes) } ->
      std::same_as<std::expected<std::size_t, error>>;
};

/**
 * Unbounded ordered map types the codec understands (std::map,
 * absl::btree_map and look-alikes).
 */
template <typename M>
concept OrderedMap = requires(M& m, typename M::key_type key,
                              typename M::mapped_type value) {
  typename M::key_compare;
  typename M::allocator_type;
  m.insert_or_assign(std::move(key), std::move(value));
  { m.size() } -> std::convertible_to<std::size_t>;
};

// ============================================================================
// Primitive codecs
// ============================================================================

template <typename T>
  requires std::integral<T> && (!std::same_as<T, bool>)
struct codec<T> {
  static void encode_to(const T& value, byte_buffer& out) {
    using U = std::make_unsigned_t<T>;
    auto bits = static_cast<U>(value);
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      out.push_back(static_cast<std::uint8_t>(bits >> (i * 8)));
    }
  }

  template <Input I>
  static std::expected<T, error> decode(I& in) {
    using U = std::make_unsigned_t<T>;
    std::uint8_t buf[sizeof(T)];
    if (auto r = in.read(buf); !r) {
      return std::unexpected(r.error());
    }
    U bits = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      bits |= static_cast<U>(static_cast<U>(buf[i]) << (i * 8));
    }
    return static_cast<T>(bits);
  }

  static constexpr std::size_t max_encoded_len() { return sizeof(T); }
};

template <>
struct codec<bool> {
  static void encode_to(const bool& value, byte_buffer& out) {
    out.push_back(value ? 1 : 0);
  }

  template <Input I>
  static std::expected<bool, error> decode(I& in) {
    auto byte = read_byte(in);
    if (!byte) {
      return std::unexpected(byte.error());
    }
    switch (*byte) {
      case 0:
        return false;
      case 1:
        return true;
      default:
        return std::unexpected(
            error(errc::invalid_value, "invalid bool representation"));
    }
  }

  static constexpr std::size_t max_encoded_len() { return 1; }
};

// Unit value: nothing on the wire
template <>
struct codec<std::monostate> {
  static void encode_to(const std::monostate&, byte_buffer&) {}

  template <Input I>
  static std::expected<std::monostate, error> decode(I&) {
    return std::monostate{};
  }

  static constexpr std::size_t max_encoded_len() { return 0; }
};

template <std::unsigned_integral T>
struct codec<compact<T>> {
  static void encode_to(const compact<T>& value, byte_buffer& out) {
    encode_compact(value.value, out);
  }

  template <Input I>
  static std::expected<compact<T>, error> decode(I& in) {
    auto value = decode_compact<T>(in);
    if (!value) {
      return std::unexpected(value.error());
    }
    return compact<T>{*value};
  }

  static constexpr std::size_t max_encoded_len() {
    return compact_len(std::numeric_limits<T>::max());
  }
};

// ============================================================================
// Collection codecs
// ============================================================================

namespace detail {

// Largest buffer a decoder allocates ahead of the bytes that fill it
inline constexpr std::size_t max_preallocation = 4 * 1024;

/**
 * Reads the compact u32 length prefix at the start of bytes without
 * consuming anything from the caller's input.
 */
inline std::expected<std::size_t, error> peek_length_prefix(
    std::span<const std::uint8_t> bytes) {
  slice_input in(bytes);
  auto len = decode_compact<std::uint32_t>(in);
  if (!len) {
    return std::unexpected(len.error());
  }
  return static_cast<std::size_t>(*len);
}

/**
 * Caps a declared element count by what the input could still hold.
 */
template <Input I>
std::size_t reservation_for(const I& in, std::size_t declared) {
  auto remaining = in.remaining_len();
  if (!remaining) {
    return 0;
  }
  return declared < *remaining ? declared : *remaining;
}

}  // namespace detail

template <>
struct codec<std::string> {
  static void encode_to(const std::string& value, byte_buffer& out) {
    encode_length(value.size(), out);
    out.insert(out.end(), value.begin(), value.end());
  }

  template <Input I>
  static std::expected<std::string, error> decode(I& in) {
    auto len = decode_compact<std::uint32_t>(in);
    if (!len) {
      return std::unexpected(len.error());
    }
    if (auto remaining = in.remaining_len(); remaining && *remaining < *len) {
      return std::unexpected(
          error(errc::not_enough_data, "not enough data to fill buffer"));
    }
    // Grow only as bytes arrive, so a declared length alone never decides
    // how much is allocated
    std::string result;
    while (result.size() < *len) {
      std::size_t offset = result.size();
      std::size_t chunk =
          std::min<std::size_t>(*len - offset, detail::max_preallocation);
      result.resize(offset + chunk);
      auto* data = reinterpret_cast<std::uint8_t*>(result.data()) + offset;
      if (auto r = in.read(std::span<std::uint8_t>(data, chunk)); !r) {
        return std::unexpected(r.error());
      }
    }
    return result;
  }

  static std::expected<std::size_t, error> decode_length(
      std::span<const std::uint8_t> bytes) {
    return detail::peek_length_prefix(bytes);
  }
};

template <typename T, typename Alloc>
struct codec<std::vector<T, Alloc>> {
  static void encode_to(const std::vector<T, Alloc>& value, byte_buffer& out) {
    encode_length(value.size(), out);
    for (const auto& element : value) {
      codec<T>::encode_to(element, out);
    }
  }

  template <Input I>
  static std::expected<std::vector<T, Alloc>, error> decode(I& in) {
    auto len = decode_compact<std::uint32_t>(in);
    if (!len) {
      return std::unexpected(len.error());
    }
    std::vector<T, Alloc> result;
    result.reserve(detail::reservation_for(in, *len));
    for (std::uint32_t i = 0; i < *len; ++i) {
      auto element = codec<T>::decode(in);
      if (!element) {
        return std::unexpected(element.error());
      }
      result.push_back(std::move(*element));
    }
    return result;
  }

  static std::expected<std::size_t, error> decode_length(
      std::span<const std::uint8_t> bytes) {
    return detail::peek_length_prefix(bytes);
  }
};

template <typename A, typename B>
struct codec<std::pair<A, B>> {
  static void encode_to(const std::pair<A, B>& value, byte_buffer& out) {
    codec<A>::encode_to(value.first, out);
    codec<B>::encode_to(value.second, out);
  }

  template <Input I>
  static std::expected<std::pair<A, B>, error> decode(I& in) {
    auto first = codec<A>::decode(in);
    if (!first) {
      return std::unexpected(first.error());
    }
    auto second = codec<B>::decode(in);
    if (!second) {
      return std::unexpected(second.error());
    }
    return std::pair<A, B>(std::move(*first), std::move(*second));
  }

  static constexpr std::size_t max_encoded_len()
    requires HasMaxEncodedLen<A> && HasMaxEncodedLen<B>
  {
    return codec<A>::max_encoded_len() + codec<B>::max_encoded_len();
  }
};

/**
 * Ordered maps encode exactly like a vector of (key, value) pairs in
 * ascending key order. When decoding, a repeated key keeps the last value.
 */
template <OrderedMap M>
struct codec<M> {
  using key_type = typename M::key_type;
  using mapped_type = typename M::mapped_type;

  static void encode_to(const M& value, byte_buffer& out) {
    encode_length(value.size(), out);
    for (const auto& [key, mapped] : value) {
      codec<key_type>::encode_to(key, out);
      codec<mapped_type>::encode_to(mapped, out);
    }
  }

  template <Input I>
  static std::expected<M, error> decode(I& in) {
    auto len = decode_compact<std::uint32_t>(in);
    if (!len) {
      return std::unexpected(len.error());
    }
    M result;
    for (std::uint32_t i = 0; i < *len; ++i) {
      auto key = codec<key_type>::decode(in);
      if (!key) {
        return std::unexpected(key.error());
      }
      auto mapped = codec<mapped_type>::decode(in);
      if (!mapped) {
        return std::unexpected(mapped.error());
      }
      result.insert_or_assign(std::move(*key), std::move(*mapped));
    }
    return result;
  }

  static std::expected<std::size_t, error> decode_length(
      std::span<const std::uint8_t> bytes) {
    return detail::peek_length_prefix(bytes);
  }
};

// ============================================================================
// Entry points
// ============================================================================

template <Encodable T>
void encode_to(const T& value, byte_buffer& out) {
  codec<T>::encode_to(value, out);
}

template <Encodable T>
byte_buffer encode(const T& value) {
  byte_buffer out;
  codec<T>::encode_to(value, out);
  return out;
}

template <Encodable T>
std::size_t encoded_size(const T& value) {
  return encode(value).size();
}

/**
 * Decodes one T from the front of the input. On failure the input has been
 * advanced by however much the decoder consumed before failing.
 */
template <typename T, Input I>
  requires Decodable<T>
std::expected<T, error> decode(I& in) {
  return codec<T>::decode(in);
}

/**
 * Decodes one T from the front of bytes. Anything after the value is left
 * unread; use decode_all to reject it.
 */
template <Decodable T>
std::expected<T, error> decode(std::span<const std::uint8_t> bytes) {
  slice_input in(bytes);
  return codec<T>::decode(in);
}

/**
 * Decodes one T and requires that it spans all of bytes.
 */
template <Decodable T>
std::expected<T, error> decode_all(std::span<const std::uint8_t> bytes);

/**
 * Advances the input past one encoded T.
 */
template <typename T, Input I>
  requires Decodable<T>
std::expected<void, error> skip(I& in);

/**
 * Worst-case encoded size of any value of T.
 */
template <HasMaxEncodedLen T>
constexpr std::size_t max_encoded_len() {
  return codec<T>::max_encoded_len();
}

/**
 * Element count of an encoded collection, read from its length prefix.
 */
template <HasDecodeLength T>
std::expected<std::size_t, error> decode_length(
    std::span<const std::uint8_t> bytes) {
  return codec<T>::decode_length(bytes);
}

}  // namespace kressler::bounded_containers

#include "codec.ipp"
