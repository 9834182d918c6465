// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// bounded_map.ipp - Implementation details for bounded_map
// This file is included at the end of bounded_map.hpp
// DO NOT include this file directly

namespace kressler::bounded_containers {

// ============================================================================
// Construction
// ============================================================================

/**
 * Adopts map when it fits. The size check is O(1); on failure the map is
 * returned to the caller unchanged.
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
auto bounded_map<Key, Value, Bound, Compare, MapT>::try_from(
    inner_map_type map) -> std::expected<bounded_map, inner_map_type> {
  if (map.size() > bound()) {
    return std::unexpected(std::move(map));
  }
  return bounded_map(std::move(map));
}

/**
 * Decides from std::ranges::size alone, before touching any element.
 * Complexity: O(n log n) where n is the size of the range
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
template <std::ranges::sized_range R>
auto bounded_map<Key, Value, Bound, Compare, MapT>::try_collect(R&& range)
    -> std::expected<bounded_map, error> {
  if (static_cast<size_type>(std::ranges::size(range)) > bound()) {
    return std::unexpected(
        error(errc::bound_exceeded, messages::collect_too_long));
  }

  inner_map_type inner;
  for (auto&& entry : range) {
    inner.insert_or_assign(std::get<0>(std::forward<decltype(entry)>(entry)),
                           std::get<1>(std::forward<decltype(entry)>(entry)));
  }
  // Repeated keys collapse, so the map holds at most size(range) <= bound()
  // entries
  return unchecked_from(std::move(inner));
}

// ============================================================================
// Value access
// ============================================================================

template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
Value* bounded_map<Key, Value, Bound, Compare, MapT>::get_mut(const Key& key) {
  auto it = inner_.find(key);
  return it == inner_.end() ? nullptr : &it->second;
}

template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
const Value* bounded_map<Key, Value, Bound, Compare, MapT>::get(
    const Key& key) const {
  auto it = inner_.find(key);
  return it == inner_.end() ? nullptr : &it->second;
}

// ============================================================================
// Checked mutation
// ============================================================================

/**
 * A single lower_bound lookup serves both the overwrite and the insert path:
 * the overwrite path never needs the bound, and the insert path reuses the
 * position as its hint.
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
std::expected<std::optional<Value>, std::pair<Key, Value>>
bounded_map<Key, Value, Bound, Compare, MapT>::try_insert(Key key,
                                                          Value value) {
  auto it = inner_.lower_bound(key);
  if (it != inner_.end() && !inner_.key_comp()(key, it->first)) {
    // Key already present: keep the stored key, replace the value
    Value previous = std::exchange(it->second, std::move(value));
    return std::optional<Value>(std::move(previous));
  }

  if (inner_.size() >= bound()) {
    return std::unexpected(
        std::pair<Key, Value>(std::move(key), std::move(value)));
  }

  inner_.emplace_hint(it, std::move(key), std::move(value));
  return std::optional<Value>();
}

template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
std::optional<Value> bounded_map<Key, Value, Bound, Compare, MapT>::remove(
    const Key& key) {
  auto it = inner_.find(key);
  if (it == inner_.end()) {
    return std::nullopt;
  }
  std::optional<Value> removed(std::move(it->second));
  inner_.erase(it);
  return removed;
}

template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
std::optional<std::pair<Key, Value>>
bounded_map<Key, Value, Bound, Compare, MapT>::remove_entry(const Key& key) {
  auto it = inner_.find(key);
  if (it == inner_.end()) {
    return std::nullopt;
  }
  auto node = inner_.extract(it);
  return std::pair<Key, Value>(std::move(node.key()),
                               std::move(node.mapped()));
}

template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
template <typename Pred>
void bounded_map<Key, Value, Bound, Compare, MapT>::retain(Pred pred) {
  static_assert(std::predicate<Pred&, const Key&, Value&>,
                "retain predicate must be callable as pred(const Key&, "
                "Value&) -> bool");
  for (auto it = inner_.begin(); it != inner_.end();) {
    if (std::invoke(pred, std::as_const(it->first), it->second)) {
      ++it;
    } else {
      it = inner_.erase(it);
    }
  }
}

template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
template <typename F>
std::optional<bounded_map<Key, Value, Bound, Compare, MapT>>
bounded_map<Key, Value, Bound, Compare, MapT>::try_mutate(F mutate) && {
  static_assert(std::invocable<F&, inner_map_type&>,
                "try_mutate callable must accept the inner map by reference");
  // mutate works on a detached map, so this object is empty (and within its
  // bound) whether mutate returns, fails the check or throws
  inner_map_type working = std::move(inner_);
  inner_.clear();
  std::invoke(mutate, working);
  if (working.size() > bound()) {
    return std::nullopt;
  }
  return std::optional<bounded_map>(unchecked_from(std::move(working)));
}

/**
 * Each entry is extracted, its value transformed, and the key node moved into
 * the result at the end position. Keys arrive in ascending order and each
 * source key yields exactly one result key, so result.size() equals the
 * original size(), which was <= bound(). Any change that could drop, duplicate
 * or synthesize keys here must go back through a checked constructor.
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
template <typename F>
auto bounded_map<Key, Value, Bound, Compare, MapT>::map(F f) &&
    -> rebind_value<detail::map_result_t<F, Key, Value>> {
  using result_map = rebind_value<detail::map_result_t<F, Key, Value>>;

  typename result_map::inner_map_type out;
  while (!inner_.empty()) {
    auto node = inner_.extract(inner_.begin());
    auto mapped =
        std::invoke(f, std::as_const(node.key()), std::move(node.mapped()));
    out.emplace_hint(out.end(), std::move(node.key()), std::move(mapped));
  }
  return result_map::unchecked_from(std::move(out));
}

/**
 * Same key-preservation argument as map(): on success every source key maps to
 * exactly one result key.
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
template <typename F>
auto bounded_map<Key, Value, Bound, Compare, MapT>::try_map(F f) &&
    -> std::expected<rebind_value<detail::try_map_value_t<F, Key, Value>>,
                     detail::try_map_error_t<F, Key, Value>> {
  using result_map = rebind_value<detail::try_map_value_t<F, Key, Value>>;

  typename result_map::inner_map_type out;
  while (!inner_.empty()) {
    auto node = inner_.extract(inner_.begin());
    auto mapped =
        std::invoke(f, std::as_const(node.key()), std::move(node.mapped()));
    if (!mapped) {
      inner_.clear();
      return std::unexpected(std::move(mapped).error());
    }
    out.emplace_hint(out.end(), std::move(node.key()), std::move(*mapped));
  }
  return result_map::unchecked_from(std::move(out));
}

}  // namespace kressler::bounded_containers
