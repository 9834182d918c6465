// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <ranges>
#include <type_traits>
#include <utility>

#include "bound.hpp"
#include "error.hpp"

namespace kressler::bounded_containers {

// Concept for comparators usable with the wrapped ordered map
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

namespace detail {

template <typename T>
concept Streamable = requires(std::ostream& os, const T& value) { os << value; };

template <typename F, typename Key, typename Value>
using map_result_t =
    std::remove_cvref_t<std::invoke_result_t<F&, const Key&, Value&&>>;

template <typename R>
struct expected_traits;

template <typename T, typename E>
struct expected_traits<std::expected<T, E>> {
  using value_type = T;
  using error_type = E;
};

template <typename F, typename Key, typename Value>
using try_map_value_t =
    typename expected_traits<map_result_t<F, Key, Value>>::value_type;

template <typename F, typename Key, typename Value>
using try_map_error_t =
    typename expected_traits<map_result_t<F, Key, Value>>::error_type;

}  // namespace detail

/**
 * An ordered map with an upper limit on its number of entries.
 *
 * Wraps an unbounded ordered map (std::map by default, absl::btree_map or any
 * map template with the same interface via MapT) and guarantees
 * size() <= bound() for every reachable instance. Every operation that can
 * grow the map checks the bound and reports failure through its return value;
 * operations that cannot grow it (removal, retain, value mutation) run
 * unchecked.
 *
 * Read operations forward directly to the inner map and add no work.
 *
 * The bound is not stored: it comes from Bound::get() every time it is needed,
 * so all instances of one instantiation share it and sizeof(bounded_map)
 * equals sizeof(inner_map_type).
 *
 * @tparam Key The key type
 * @tparam Value The mapped type
 * @tparam Bound Supplier of the maximum element count (see bound.hpp)
 * @tparam Compare Key comparison (defaults to std::less<Key>)
 * @tparam MapT Template of the wrapped unbounded map (defaults to std::map)
 *
 * Example:
 * @code
 * bounded_map<uint32_t, std::string, const_bound<2>> names;
 * names.try_insert(1, "one");
 * names.try_insert(2, "two");
 * auto rejected = names.try_insert(3, "three");
 * // !rejected, rejected.error() == {3, "three"}, names unchanged
 * @endcode
 */
template <typename Key, typename Value, BoundSupplier Bound,
          typename Compare = std::less<Key>,
          template <typename...> class MapT = std::map>
class bounded_map {
 public:
  using inner_map_type = MapT<Key, Value, Compare>;
  using key_type = Key;
  using mapped_type = Value;
  using value_type = typename inner_map_type::value_type;
  using size_type = std::size_t;
  using key_compare = Compare;
  using bound_type = Bound;
  using iterator = typename inner_map_type::iterator;
  using const_iterator = typename inner_map_type::const_iterator;
  using reverse_iterator = typename inner_map_type::reverse_iterator;
  using const_reverse_iterator =
      typename inner_map_type::const_reverse_iterator;

  // Same key, bound and map configuration with a different mapped type
  template <typename T>
  using rebind_value = bounded_map<Key, T, Bound, Compare, MapT>;

  static_assert(ComparatorCompatible<Key, Compare>,
                "Compare must be a default-constructible strict weak ordering "
                "over Key");

  /**
   * Creates an empty map. Does not allocate.
   */
  bounded_map() = default;

  bounded_map(const bounded_map&) = default;
  bounded_map& operator=(const bounded_map&) = default;
  bounded_map(bounded_map&&) noexcept = default;
  bounded_map& operator=(bounded_map&&) noexcept = default;

  /**
   * The maximum number of entries, as reported by the bound supplier.
   */
  [[nodiscard]] static constexpr size_type bound() noexcept {
    return static_cast<size_type>(Bound::get());
  }

  /**
   * Wraps an existing unbounded map if it fits within the bound.
   *
   * @param map The map to adopt
   * @return The bounded map, or the untouched input map if
   *         map.size() > bound()
   */
  static std::expected<bounded_map, inner_map_type> try_from(
      inner_map_type map);

  /**
   * Builds a bounded map from a list of entries. Repeated keys keep the last
   * value.
   *
   * @return The bounded map, or errc::bound_exceeded if the list holds more
   *         than bound() entries
   */
  static std::expected<bounded_map, error> try_from(
      std::initializer_list<std::pair<Key, Value>> entries) {
    return try_collect(entries);
  }

  /**
   * Builds a bounded map from a sized range of (key, value) entries.
   *
   * The range's size is checked before any element is read, so an oversized
   * range is rejected without being traversed. Repeated keys keep the last
   * value.
   *
   * @return The bounded map, or errc::bound_exceeded if
   *         std::ranges::size(range) > bound()
   */
  template <std::ranges::sized_range R>
  static std::expected<bounded_map, error> try_collect(R&& range);

  // ==========================================================================
  // Read access (forwarded to the inner map)
  // ==========================================================================

  [[nodiscard]] size_type size() const noexcept { return inner_.size(); }
  [[nodiscard]] bool empty() const noexcept { return inner_.empty(); }

  /**
   * Returns true when no new key can be inserted.
   */
  [[nodiscard]] bool is_full() const noexcept { return size() >= bound(); }

  key_compare key_comp() const { return inner_.key_comp(); }

  const_iterator find(const Key& key) const { return inner_.find(key); }
  iterator find(const Key& key) { return inner_.find(key); }

  bool contains(const Key& key) const { return inner_.contains(key); }
  size_type count(const Key& key) const { return inner_.count(key); }

  /**
   * Returns the value for key.
   * Throws std::out_of_range if the key does not exist.
   */
  const Value& at(const Key& key) const { return inner_.at(key); }
  Value& at(const Key& key) { return inner_.at(key); }

  const_iterator lower_bound(const Key& key) const {
    return inner_.lower_bound(key);
  }
  const_iterator upper_bound(const Key& key) const {
    return inner_.upper_bound(key);
  }
  std::pair<const_iterator, const_iterator> equal_range(const Key& key) const {
    return inner_.equal_range(key);
  }

  const_iterator begin() const { return inner_.begin(); }
  const_iterator end() const { return inner_.end(); }
  const_iterator cbegin() const { return inner_.cbegin(); }
  const_iterator cend() const { return inner_.cend(); }
  const_reverse_iterator rbegin() const { return inner_.rbegin(); }
  const_reverse_iterator rend() const { return inner_.rend(); }

  /**
   * Borrows the inner map for read-only use.
   */
  const inner_map_type& as_inner() const noexcept { return inner_; }

  // ==========================================================================
  // Value mutation (cannot change the key set)
  // ==========================================================================

  /**
   * Mutable iteration. Keys are const in the inner map's value_type, so only
   * values can change through these iterators.
   */
  iterator begin() { return inner_.begin(); }
  iterator end() { return inner_.end(); }

  /**
   * Range over the entries with mutable values, in ascending key order.
   */
  std::ranges::subrange<iterator> iter_mut() {
    return std::ranges::subrange<iterator>(inner_.begin(), inner_.end());
  }

  /**
   * Returns a pointer to the value for key, or nullptr if absent.
   */
  Value* get_mut(const Key& key);

  /**
   * Returns a pointer to the value for key, or nullptr if absent.
   */
  const Value* get(const Key& key) const;

  // ==========================================================================
  // Checked mutation
  // ==========================================================================

  /**
   * Inserts or overwrites an entry.
   *
   * - Existing key: always succeeds. The stored key object is kept, the value
   *   is replaced and the previous value returned. size() is unchanged.
   * - New key with size() < bound(): inserted, returns std::nullopt.
   * - New key on a full map: nothing happens and the (key, value) pair is
   *   handed back as the error so the caller can reuse it without copying.
   *
   * Complexity: O(log n)
   */
  std::expected<std::optional<Value>, std::pair<Key, Value>> try_insert(
      Key key, Value value);

  /**
   * Removes key, returning its value if it was present.
   */
  std::optional<Value> remove(const Key& key);

  /**
   * Removes key, returning the stored key and value if it was present.
   */
  std::optional<std::pair<Key, Value>> remove_entry(const Key& key);

  /**
   * Removes the entry at pos, returning the iterator following it.
   */
  iterator erase(const_iterator pos) { return inner_.erase(pos); }

  /**
   * Removes all entries.
   */
  void clear() noexcept { inner_.clear(); }

  /**
   * Keeps only the entries for which pred(key, value) returns true.
   * pred may modify the values of entries it keeps.
   *
   * Complexity: O(n)
   */
  template <typename Pred>
  void retain(Pred pred);

  /**
   * Applies mutate to the raw inner map, then checks the bound once.
   *
   * The inner map may exceed the bound while mutate runs. If it still does
   * afterwards, the mutated contents are discarded (this map is left empty)
   * and std::nullopt is returned; no partially applied map ever escapes.
   *
   * @param mutate Callable as mutate(inner_map_type&)
   */
  template <typename F>
  std::optional<bounded_map> try_mutate(F mutate) &&;

  /**
   * Consumes the map, transforming each value with f(key, std::move(value)).
   *
   * Every source entry produces exactly one result entry under the same key,
   * so the result has the same size and cannot violate the bound.
   */
  template <typename F>
  rebind_value<detail::map_result_t<F, Key, Value>> map(F f) &&;

  /**
   * Consumes the map, transforming each value with a fallible
   * f(key, std::move(value)) -> std::expected<T, E>.
   *
   * Stops at the first failure and returns its error unchanged; no partially
   * transformed map is returned. This map is left empty either way.
   */
  template <typename F>
  std::expected<rebind_value<detail::try_map_value_t<F, Key, Value>>,
                detail::try_map_error_t<F, Key, Value>>
  try_map(F f) &&;

  /**
   * Releases the inner map.
   */
  inner_map_type into_inner() && { return std::move(inner_); }

  void swap(bounded_map& other) noexcept { inner_.swap(other.inner_); }

  // ==========================================================================
  // Comparison and hashing
  // ==========================================================================

  /**
   * Bounded maps of any two bound configurations are equal when their bound
   * values agree and they hold the same entries.
   */
  template <BoundSupplier OtherBound>
  friend bool operator==(
      const bounded_map& lhs,
      const bounded_map<Key, Value, OtherBound, Compare, MapT>& rhs) {
    return bound() ==
               bounded_map<Key, Value, OtherBound, Compare, MapT>::bound() &&
           lhs.inner_ == rhs.as_inner();
  }

  /**
   * Comparison against the unbounded map looks at the entries only.
   */
  friend bool operator==(const bounded_map& lhs, const inner_map_type& rhs) {
    return lhs.inner_ == rhs;
  }

  /**
   * Lexicographic ordering over the entries.
   */
  friend auto operator<=>(const bounded_map& lhs, const bounded_map& rhs)
    requires std::three_way_comparable<value_type>
  {
    return std::lexicographical_compare_three_way(
        lhs.inner_.begin(), lhs.inner_.end(), rhs.inner_.begin(),
        rhs.inner_.end());
  }

  /**
   * absl::Hash support. Only the entries contribute, never the bound.
   */
  template <typename H>
  friend H AbslHashValue(H state, const bounded_map& map) {
    for (const auto& [key, value] : map.inner_) {
      state = H::combine(std::move(state), key, value);
    }
    return H::combine(std::move(state), map.inner_.size());
  }

  /**
   * Debug output: BoundedMap({k: v, ...}, bound)
   */
  friend std::ostream& operator<<(std::ostream& os, const bounded_map& map)
    requires detail::Streamable<Key> && detail::Streamable<Value>
  {
    os << "BoundedMap({";
    bool first = true;
    for (const auto& [key, value] : map.inner_) {
      if (!first) {
        os << ", ";
      }
      first = false;
      os << key << ": " << value;
    }
    return os << "}, " << bound() << ")";
  }

 private:
  template <typename, typename, BoundSupplier, typename,
            template <typename...> class>
  friend class bounded_map;

  explicit bounded_map(inner_map_type inner) : inner_(std::move(inner)) {}

  /**
   * Adopts a map without checking the bound.
   * Callers must guarantee inner.size() <= bound().
   */
  static bounded_map unchecked_from(inner_map_type inner) {
    return bounded_map(std::move(inner));
  }

  inner_map_type inner_;
};

template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
void swap(bounded_map<Key, Value, Bound, Compare, MapT>& lhs,
          bounded_map<Key, Value, Bound, Compare, MapT>& rhs) noexcept {
  lhs.swap(rhs);
}

/**
 * Collects a sized range of (key, value) entries into BoundedMap.
 *
 * @code
 * auto doubled = try_collect<bounded_map<int, int, const_bound<8>>>(
 *     source | std::views::transform([](auto e) {
 *       return std::pair(e.first, e.second * 2);
 *     }));
 * @endcode
 */
template <typename BoundedMap, std::ranges::sized_range R>
std::expected<BoundedMap, error> try_collect(R&& range) {
  return BoundedMap::try_collect(std::forward<R>(range));
}

}  // namespace kressler::bounded_containers

// Include implementation
#include "bounded_map.ipp"
