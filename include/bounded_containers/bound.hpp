// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <concepts>
#include <cstdint>

namespace kressler::bounded_containers {

/**
 * A bound supplier yields the maximum element count of a bounded container.
 *
 * Suppliers are types, not values: the bound is resolved through the type
 * each time it is needed and is never stored per container instance. A
 * supplier must return the same value for the lifetime of the process (or at
 * least for the lifetime of every container instantiated with it).
 */
template <typename S>
concept BoundSupplier = requires {
  { S::get() } -> std::convertible_to<std::uint32_t>;
};

/**
 * Compile-time constant bound.
 *
 * @code
 * bounded_map<uint32_t, std::string, const_bound<16>> names;
 * @endcode
 */
template <std::uint32_t N>
struct const_bound {
  static constexpr std::uint32_t value = N;
  static constexpr std::uint32_t get() noexcept { return N; }
};

/**
 * Bound resolved from configuration at start-up.
 *
 * The value is written once, before any container using this supplier is
 * created, and read on every bound check afterwards. Tag only distinguishes
 * independent configuration slots.
 *
 * @code
 * struct max_peers_tag {};
 * using max_peers = configurable_bound<max_peers_tag>;
 * max_peers::configure(options.max_peers);
 * @endcode
 */
template <typename Tag, std::uint32_t Default = 0>
class configurable_bound {
 public:
  static std::uint32_t get() noexcept { return value_; }

  /**
   * Sets the bound.
   *
   * Precondition: no container using this supplier is alive. Lowering the
   * value under a live map would leave it holding more than bound()
   * entries; raising it would let a live map outgrow what its producers
   * sized it for.
   */
  static void configure(std::uint32_t value) noexcept { value_ = value; }

 private:
  inline static std::uint32_t value_ = Default;
};

/**
 * Constant bound under its own type.
 *
 * Two named bounds with the same value but different tags are distinct
 * types, so bounded containers of different configurations can still be
 * compared by bound value rather than by type.
 *
 * @code
 * struct max_peers_tag {};
 * using max_peers = named_bound<max_peers_tag, 25>;
 * @endcode
 */
template <typename Tag, std::uint32_t N>
struct named_bound {
  static constexpr std::uint32_t get() noexcept { return N; }
};

}  // namespace kressler::bounded_containers
