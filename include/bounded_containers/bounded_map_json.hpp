// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <charconv>
#include <concepts>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <system_error>

#include "bounded_map.hpp"

namespace kressler::bounded_containers {

/**
 * Thrown when JSON text cannot be turned into a bounded container.
 */
class deserialize_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * Conversion between map keys and JSON object member names.
 *
 * Integers use their decimal form, strings are used as-is. Specialize for
 * other key types.
 */
template <typename Key>
struct json_key;

template <std::integral Key>
  requires(!std::same_as<Key, bool>)
struct json_key<Key> {
  static std::string to_string(const Key& key) { return std::to_string(key); }

  static Key from_string(const std::string& text) {
    Key key{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, key);
    if (ec != std::errc() || ptr != last) {
      throw deserialize_error("invalid map key: " + text);
    }
    return key;
  }
};

template <>
struct json_key<std::string> {
  static const std::string& to_string(const std::string& key) { return key; }
  static std::string from_string(const std::string& text) { return text; }
};

/**
 * Writes the map as a JSON object, exactly like the unbounded map's form.
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
void to_json(nlohmann::json& j,
             const bounded_map<Key, Value, Bound, Compare, MapT>& map) {
  j = nlohmann::json::object();
  for (const auto& [key, value] : map) {
    j[json_key<Key>::to_string(key)] = value;
  }
}

/**
 * Reads a JSON object into a bounded map.
 *
 * The member count is checked against the bound up front, and the running
 * count is checked again before each insertion, so the failure happens at the
 * first entry past the bound. Keys are read before their values.
 *
 * @throws deserialize_error if j is not an object, a key cannot be parsed, or
 *         the object has more members than the bound allows
 */
template <typename Key, typename Value, BoundSupplier Bound, typename Compare,
          template <typename...> class MapT>
void from_json(const nlohmann::json& j,
               bounded_map<Key, Value, Bound, Compare, MapT>& map) {
  using map_type = bounded_map<Key, Value, Bound, Compare, MapT>;

  if (!j.is_object()) {
    throw deserialize_error("expected a map");
  }
  const std::size_t max = map_type::bound();
  if (j.size() > max) {
    throw deserialize_error(messages::json_bound_exceeded);
  }

  typename map_type::inner_map_type values;
  for (auto it = j.begin(); it != j.end(); ++it) {
    // Members that name the same key collapse, so values never outgrows j
    Key key = json_key<Key>::from_string(it.key());
    values.insert_or_assign(std::move(key), it.value().template get<Value>());
  }

  auto bounded = map_type::try_from(std::move(values));
  if (!bounded) {
    throw deserialize_error(messages::json_conversion_failed);
  }
  map = std::move(*bounded);
}

}  // namespace kressler::bounded_containers
