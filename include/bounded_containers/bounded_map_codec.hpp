// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <span>

#include "bounded_map.hpp"
#include "codec.hpp"

namespace kressler::bounded_containers {

namespace detail {
constexpr std::size_t saturating_add(std::size_t a, std::size_t b) noexcept {
  return a > std::numeric_limits<std::size_t>::max() - b
             ? std::numeric_limits<std::size_t>::max()
             : a + b;
}

constexpr std::size_t saturating_mul(std::size_t a, std::size_t b) noexcept {
  if (a == 0 || b == 0) {
    return 0;
  }
  return a > std::numeric_limits<std::size_t>::max() / b
             ? std::numeric_limits<std::size_t>::max()
             : a * b;
}
}  // namespace detail

/**
 * Wire support for bounded_map.
 *
 * The encoding is exactly the inner map's: a compact u32 count followed by
 * the entries in ascending key order. The bound is never written.
 *
 * Decoding checks the count against the bound before reading a single entry.
 * An oversized count fails with errc::decode_size_exceeded having consumed
 * only the count itself, so a hostile length cannot make the decoder read or
 * allocate anything on its behalf. A count within the bound is re-encoded and
 * put back in front of the input, and the inner map's own decoder runs over
 * the reassembled stream.
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
struct codec<bounded_map<Key, Value, Bound, Compare, MapT>> {
  using map_type = bounded_map<Key, Value, Bound, Compare, MapT>;
  using inner_map_type = typename map_type::inner_map_type;

  static void encode_to(const map_type& value, byte_buffer& out) {
    codec<inner_map_type>::encode_to(value.as_inner(), out);
  }

  template <Input I>
  static std::expected<map_type, error> decode(I& in) {
    auto len = decode_compact<std::uint32_t>(in);
    if (!len) {
      return std::unexpected(len.error());
    }
    if (*len > Bound::get()) {
      return std::unexpected(
          error(errc::decode_size_exceeded, messages::decode_size_exceeded));
    }

    byte_buffer prefix;
    encode_compact(*len, prefix);
    prepend_input<I> reassembled(prefix, in);
    auto inner = codec<inner_map_type>::decode(reassembled);
    if (!inner) {
      return std::unexpected(inner.error());
    }
    // The inner decoder reads exactly *len entries and repeated keys can only
    // shrink the result, so inner->size() <= *len <= bound()
    auto bounded = map_type::try_from(std::move(*inner));
    if (!bounded) {
      return std::unexpected(
          error(errc::decode_size_exceeded, messages::decode_size_exceeded));
    }
    return std::move(*bounded);
  }

  /**
   * Skipping does not materialize the map, so it defers to the inner map.
   */
  template <Input I>
  static std::expected<void, error> skip(I& in) {
    return kressler::bounded_containers::skip<inner_map_type>(in);
  }

  /**
   * bound * (max key length + max value length) + length of the prefix for
   * bound, saturating instead of overflowing.
   */
  static constexpr std::size_t max_encoded_len()
    requires HasMaxEncodedLen<Key> && HasMaxEncodedLen<Value>
  {
    std::size_t entry = detail::saturating_add(codec<Key>::max_encoded_len(),
                                               codec<Value>::max_encoded_len());
    return detail::saturating_add(
        detail::saturating_mul(map_type::bound(), entry),
        compact_len(Bound::get()));
  }

  static std::expected<std::size_t, error> decode_length(
      std::span<const std::uint8_t> bytes) {
    return codec<inner_map_type>::decode_length(bytes);
  }
};

}  // namespace kressler::bounded_containers
