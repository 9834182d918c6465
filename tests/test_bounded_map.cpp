// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>

#include <bounded_containers/bounded_map.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <map>
#include <random>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace kressler::bounded_containers;

// Helper types for testing different inner map implementations
template <template <typename...> class MapT>
struct Storage {
  template <typename K, typename V, typename B>
  using map = bounded_map<K, V, B, std::less<K>, MapT>;

  template <typename K, typename V>
  using inner = MapT<K, V, std::less<K>>;
};

using StdMapStorage = Storage<std::map>;
using AbslBtreeStorage = Storage<absl::btree_map>;

using unit = std::monostate;

template <typename Inner>
Inner map_from_keys(std::initializer_list<uint32_t> keys) {
  Inner map;
  for (auto key : keys) {
    map.insert_or_assign(key, typename Inner::mapped_type{});
  }
  return map;
}

template <typename BoundedMap>
BoundedMap bounded_from_keys(std::initializer_list<uint32_t> keys) {
  return BoundedMap::try_from(
             map_from_keys<typename BoundedMap::inner_map_type>(keys))
      .value();
}

TEMPLATE_TEST_CASE("bounded_map default constructor creates empty map",
                   "[bounded_map][constructor]", StdMapStorage,
                   AbslBtreeStorage) {
  using Map = typename TestType::template map<uint32_t, unit, const_bound<4>>;

  Map map;
  REQUIRE(map.empty());
  REQUIRE(map.size() == 0);
  REQUIRE(!map.is_full());
  REQUIRE(Map::bound() == 4);
  REQUIRE(map.begin() == map.end());
}

TEST_CASE("bounded_map carries no per-instance bound",
          "[bounded_map][layout]") {
  using Map = bounded_map<uint32_t, std::string, const_bound<16>>;
  STATIC_REQUIRE(sizeof(Map) == sizeof(Map::inner_map_type));
}

TEMPLATE_TEST_CASE("bounded_map try_from", "[bounded_map][constructor]",
                   StdMapStorage, AbslBtreeStorage) {
  using Map = typename TestType::template map<uint32_t, unit, const_bound<4>>;
  using Inner = typename Map::inner_map_type;

  SECTION("Map within bound is adopted") {
    auto result = Map::try_from(map_from_keys<Inner>({1, 2, 3}));
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 3);
    REQUIRE(*result == map_from_keys<Inner>({1, 2, 3}));
  }

  SECTION("Map exactly at bound is adopted") {
    auto result = Map::try_from(map_from_keys<Inner>({1, 2, 3, 4}));
    REQUIRE(result.has_value());
    REQUIRE(result->is_full());
  }

  SECTION("Oversized map is handed back unchanged") {
    auto result = Map::try_from(map_from_keys<Inner>({1, 2, 3, 4, 5}));
    REQUIRE(!result.has_value());
    REQUIRE(result.error() == map_from_keys<Inner>({1, 2, 3, 4, 5}));
  }

  SECTION("Zero bound only accepts the empty map") {
    using Zero = typename TestType::template map<uint32_t, unit, const_bound<0>>;
    REQUIRE(Zero::try_from(Inner{}).has_value());
    REQUIRE(!Zero::try_from(map_from_keys<Inner>({1})).has_value());
  }
}

TEMPLATE_TEST_CASE("bounded_map try_from entry list",
                   "[bounded_map][constructor]", StdMapStorage,
                   AbslBtreeStorage) {
  using Map =
      typename TestType::template map<uint32_t, uint32_t, const_bound<4>>;

  SECTION("List within bound") {
    auto result = Map::try_from({{2, 20}, {1, 10}, {3, 30}});
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 3);
    REQUIRE(result->begin()->first == 1);
    REQUIRE(result->at(3) == 30);
  }

  SECTION("Repeated keys keep the last value") {
    auto result = Map::try_from({{1, 10}, {1, 11}, {2, 20}});
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    REQUIRE(result->at(1) == 11);
  }

  SECTION("List longer than the bound") {
    auto result = Map::try_from({{1, 1}, {2, 2}, {3, 3}, {4, 4}, {5, 5}});
    REQUIRE(!result.has_value());
    REQUIRE(result.error().code() == errc::bound_exceeded);
  }
}

TEMPLATE_TEST_CASE("bounded_map try_insert", "[bounded_map][insert]",
                   StdMapStorage, AbslBtreeStorage) {
  using Map = typename TestType::template map<uint32_t, unit, const_bound<4>>;
  using Inner = typename Map::inner_map_type;

  auto bounded = bounded_from_keys<Map>({1, 2, 3});

  SECTION("Insert up to the bound, then reject new keys") {
    REQUIRE(!bounded.is_full());

    auto inserted = bounded.try_insert(0, unit{});
    REQUIRE(inserted.has_value());
    REQUIRE(!inserted->has_value());
    REQUIRE(bounded == map_from_keys<Inner>({1, 0, 2, 3}));
    REQUIRE(bounded.is_full());

    auto rejected = bounded.try_insert(9, unit{});
    REQUIRE(!rejected.has_value());
    REQUIRE(rejected.error().first == 9);
    REQUIRE(bounded == map_from_keys<Inner>({1, 0, 2, 3}));
    REQUIRE(bounded.size() == 4);
  }

  SECTION("Existing key on a full map overwrites") {
    using ValueMap =
        typename TestType::template map<uint32_t, std::string, const_bound<2>>;
    ValueMap names;
    REQUIRE(names.try_insert(1, "one").has_value());
    REQUIRE(names.try_insert(2, "two").has_value());
    REQUIRE(names.is_full());

    auto replaced = names.try_insert(1, "uno");
    REQUIRE(replaced.has_value());
    REQUIRE(replaced->has_value());
    REQUIRE(**replaced == "one");
    REQUIRE(names.size() == 2);
    REQUIRE(names.at(1) == "uno");
  }

  SECTION("Rejected pair is returned intact") {
    using ValueMap =
        typename TestType::template map<uint32_t, std::string, const_bound<1>>;
    ValueMap names;
    REQUIRE(names.try_insert(1, "one").has_value());

    std::string payload(256, 'x');
    auto rejected = names.try_insert(7, payload);
    REQUIRE(!rejected.has_value());
    REQUIRE(rejected.error().first == 7);
    REQUIRE(rejected.error().second == payload);
    REQUIRE(names.size() == 1);
    REQUIRE(!names.contains(7));
  }
}

// Key whose equality ignores the flag: overwriting must keep the stored key
struct Unequal {
  uint32_t id;
  bool flag;

  friend bool operator<(const Unequal& lhs, const Unequal& rhs) {
    return lhs.id < rhs.id;
  }
};

TEST_CASE("bounded_map overwrite keeps the stored key", "[bounded_map][insert]") {
  bounded_map<Unequal, uint32_t, const_bound<4>> map;
  for (uint32_t i = 0; i < 4; ++i) {
    REQUIRE(map.try_insert(Unequal{i, false}, i).has_value());
  }

  // Full: a distinct key is rejected
  REQUIRE(!map.try_insert(Unequal{5, false}, 5).has_value());

  // A key comparing equal replaces only the value
  REQUIRE(map.try_insert(Unequal{0, true}, 6).has_value());
  REQUIRE(map.size() == 4);
  auto it = map.find(Unequal{0, true});
  REQUIRE(it != map.end());
  REQUIRE(it->first.id == 0);
  REQUIRE(it->first.flag == false);
  REQUIRE(it->second == 6);
}

TEMPLATE_TEST_CASE("bounded_map removal", "[bounded_map][remove]",
                   StdMapStorage, AbslBtreeStorage) {
  using Map =
      typename TestType::template map<uint32_t, std::string, const_bound<3>>;

  Map map;
  REQUIRE(map.try_insert(1, "one").has_value());
  REQUIRE(map.try_insert(2, "two").has_value());
  REQUIRE(map.try_insert(3, "three").has_value());
  REQUIRE(map.is_full());

  SECTION("remove returns the value") {
    auto removed = map.remove(2);
    REQUIRE(removed == std::optional<std::string>("two"));
    REQUIRE(map.size() == 2);
    REQUIRE(!map.is_full());
    REQUIRE(!map.remove(2).has_value());
  }

  SECTION("remove_entry returns key and value") {
    auto removed = map.remove_entry(3);
    REQUIRE(removed.has_value());
    REQUIRE(removed->first == 3);
    REQUIRE(removed->second == "three");
    REQUIRE(!map.contains(3));
    REQUIRE(!map.remove_entry(42).has_value());
  }

  SECTION("Removal frees room for a new key") {
    REQUIRE(!map.try_insert(4, "four").has_value());
    map.remove(1);
    REQUIRE(map.try_insert(4, "four").has_value());
    REQUIRE(map.is_full());
  }

  SECTION("erase by iterator") {
    auto next = map.erase(map.find(1));
    REQUIRE(next != map.end());
    REQUIRE(next->first == 2);
    REQUIRE(map.size() == 2);
  }

  SECTION("clear empties the map") {
    map.clear();
    REQUIRE(map.empty());
  }
}

TEMPLATE_TEST_CASE("bounded_map retain", "[bounded_map][retain]",
                   StdMapStorage, AbslBtreeStorage) {
  using Map = typename TestType::template map<uint32_t, uint32_t, const_bound<8>>;

  auto map = Map::try_collect(std::vector<std::pair<uint32_t, uint32_t>>{
                                  {1, 10}, {2, 20}, {3, 30}, {4, 40}})
                 .value();

  map.retain([](const uint32_t& key, uint32_t& value) {
    value += 1;
    return key % 2 == 0;
  });

  REQUIRE(map.size() == 2);
  REQUIRE(map.at(2) == 21);
  REQUIRE(map.at(4) == 41);
  REQUIRE(!map.contains(1));
  REQUIRE(!map.contains(3));
}

TEMPLATE_TEST_CASE("bounded_map try_mutate", "[bounded_map][mutate]",
                   StdMapStorage, AbslBtreeStorage) {
  using Map = typename TestType::template map<uint32_t, unit, const_bound<7>>;

  auto bounded = bounded_from_keys<Map>({1, 2, 3, 4, 5, 6});

  SECTION("Mutation within bound is kept") {
    auto mutated =
        std::move(bounded).try_mutate([](auto& inner) { inner[7] = unit{}; });
    REQUIRE(mutated.has_value());
    REQUIRE(mutated->size() == 7);

    auto overflow = std::move(*mutated).try_mutate(
        [](auto& inner) { inner[8] = unit{}; });
    REQUIRE(!overflow.has_value());
  }

  SECTION("Temporary overflow is allowed if the result fits") {
    auto mutated = std::move(bounded).try_mutate([](auto& inner) {
      for (uint32_t k = 10; k < 20; ++k) {
        inner[k] = unit{};
      }
      for (uint32_t k = 10; k < 20; ++k) {
        inner.erase(k);
      }
      inner.erase(1u);
      inner[100] = unit{};
    });
    REQUIRE(mutated.has_value());
    REQUIRE(mutated->size() == 6);
    REQUIRE(mutated->contains(100));
    REQUIRE(!mutated->contains(1));
  }

  SECTION("Rejected mutation leaves no oversized map behind") {
    auto overflow = std::move(bounded).try_mutate([](auto& inner) {
      inner[7] = unit{};
      inner[8] = unit{};
    });
    REQUIRE(!overflow.has_value());
    REQUIRE(bounded.size() <= Map::bound());
  }

  SECTION("Throwing mutation leaves the map empty") {
    using Small = typename TestType::template map<uint32_t, unit, const_bound<2>>;
    auto small = bounded_from_keys<Small>({1});

    auto grow_then_throw = [](auto& inner) {
      for (uint32_t k = 10; k < 20; ++k) {
        inner[k] = unit{};
      }
      throw std::runtime_error("mutation failed");
    };
    REQUIRE_THROWS_AS(std::move(small).try_mutate(grow_then_throw),
                      std::runtime_error);
    REQUIRE(small.empty());
    REQUIRE(small.size() <= Small::bound());

    // The map is still usable and checks its bound as usual
    REQUIRE(small.try_insert(1, unit{}).has_value());
    REQUIRE(small.try_insert(2, unit{}).has_value());
    REQUIRE(!small.try_insert(3, unit{}).has_value());
    REQUIRE(small.size() == 2);
  }
}

TEMPLATE_TEST_CASE("bounded_map map", "[bounded_map][map]", StdMapStorage,
                   AbslBtreeStorage) {
  using Map = typename TestType::template map<uint32_t, uint32_t, const_bound<7>>;

  auto source = Map::try_collect(std::vector<std::pair<uint32_t, uint32_t>>{
                                     {1, 1}, {2, 2}, {3, 3}, {4, 4}})
                    .value();

  SECTION("Size is preserved") {
    auto copy = source;
    auto mapped = std::move(copy).map([](const uint32_t&, uint32_t) {
      return 5u;
    });
    REQUIRE(mapped.size() == source.size());
  }

  SECTION("Values are transformed per key") {
    auto doubled =
        std::move(source).map([](const uint32_t&, uint32_t v) { return v * 2; });
    auto expected = Map::try_collect(std::vector<std::pair<uint32_t, uint32_t>>{
                                         {1, 2}, {2, 4}, {3, 6}, {4, 8}})
                        .value();
    REQUIRE(doubled == expected);
  }

  SECTION("Value type can change") {
    auto names = std::move(source).map([](const uint32_t& k, uint32_t v) {
      return std::to_string(k) + ":" + std::to_string(v);
    });
    STATIC_REQUIRE(std::is_same_v<
                   decltype(names),
                   typename TestType::template map<uint32_t, std::string,
                                                   const_bound<7>>>);
    REQUIRE(names.at(3) == "3:3");
  }
}

TEMPLATE_TEST_CASE("bounded_map try_map", "[bounded_map][map]", StdMapStorage,
                   AbslBtreeStorage) {
  using Map = typename TestType::template map<uint8_t, uint8_t, const_bound<7>>;
  using Wide =
      typename TestType::template map<uint8_t, uint16_t, const_bound<7>>;

  auto source = Map::try_collect(std::vector<std::pair<uint8_t, uint8_t>>{
                                     {1, 1}, {2, 2}, {3, 3}, {4, 4}})
                    .value();

  SECTION("All transforms succeed") {
    auto widened = std::move(source).try_map(
        [](const uint8_t&, uint8_t v) -> std::expected<uint16_t, std::string> {
          return static_cast<uint16_t>(v * 100);
        });
    REQUIRE(widened.has_value());
    auto expected = Wide::try_collect(std::vector<std::pair<uint8_t, uint16_t>>{
                                          {1, 100}, {2, 200}, {3, 300}, {4, 400}})
                        .value();
    REQUIRE(*widened == expected);
    REQUIRE(widened->size() == 4);
  }

  SECTION("First failure short-circuits") {
    int calls = 0;
    auto result = std::move(source).try_map(
        [&calls](const uint8_t&, uint8_t v) -> std::expected<uint8_t, std::string> {
          ++calls;
          if (v * 100 > 255) {
            return std::unexpected("overflow");
          }
          return static_cast<uint8_t>(v * 100);
        });
    REQUIRE(!result.has_value());
    REQUIRE(result.error() == "overflow");
    // 1 * 100 fits, 2 * 100 fits, 3 * 100 fails and stops the walk
    REQUIRE(calls == 3);
  }
}

TEMPLATE_TEST_CASE("bounded_map value access", "[bounded_map][access]",
                   StdMapStorage, AbslBtreeStorage) {
  using Map = typename TestType::template map<uint8_t, uint8_t, const_bound<7>>;

  auto map = Map::try_collect(std::vector<std::pair<uint8_t, uint8_t>>{
                                  {1, 1}, {2, 2}, {3, 3}, {4, 4}})
                 .value();

  SECTION("iter_mut modifies values in place") {
    for (auto& [key, value] : map.iter_mut()) {
      value *= 2;
    }
    auto expected = Map::try_collect(std::vector<std::pair<uint8_t, uint8_t>>{
                                         {1, 2}, {2, 4}, {3, 6}, {4, 8}})
                        .value();
    REQUIRE(map == expected);
  }

  SECTION("get_mut returns a pointer into the map") {
    uint8_t* value = map.get_mut(3);
    REQUIRE(value != nullptr);
    *value = 42;
    REQUIRE(map.at(3) == 42);
    REQUIRE(map.get_mut(9) == nullptr);
  }

  SECTION("const lookups") {
    const auto& view = map;
    REQUIRE(view.get(2) != nullptr);
    REQUIRE(*view.get(2) == 2);
    REQUIRE(view.get(9) == nullptr);
    REQUIRE(view.count(4) == 1);
    REQUIRE(view.lower_bound(2)->first == 2);
    REQUIRE(view.upper_bound(2)->first == 3);
    REQUIRE_THROWS_AS(view.at(9), std::out_of_range);
  }

  SECTION("Iteration is in ascending key order") {
    std::vector<uint8_t> keys;
    for (const auto& [key, value] : std::as_const(map)) {
      keys.push_back(key);
    }
    REQUIRE(keys == std::vector<uint8_t>{1, 2, 3, 4});
    REQUIRE(map.rbegin()->first == 4);
  }
}

TEMPLATE_TEST_CASE("bounded_map try_collect", "[bounded_map][collect]",
                   StdMapStorage, AbslBtreeStorage) {
  using Map5 = typename TestType::template map<uint32_t, unit, const_bound<5>>;
  using Map4 = typename TestType::template map<uint32_t, unit, const_bound<4>>;
  using Map3 = typename TestType::template map<uint32_t, unit, const_bound<3>>;
  using Map1 = typename TestType::template map<uint32_t, unit, const_bound<1>>;

  auto source = bounded_from_keys<Map5>({1, 2, 3, 4});
  auto shifted = source | std::views::transform([](const auto& entry) {
                   return std::pair<uint32_t, unit>(entry.first + 1,
                                                    entry.second);
                 });

  auto keys_of = [](const auto& map) {
    std::vector<uint32_t> keys;
    for (const auto& [key, value] : map) {
      keys.push_back(key);
    }
    return keys;
  };

  SECTION("Collect into the same bound") {
    auto collected = try_collect<Map5>(shifted);
    REQUIRE(collected.has_value());
    REQUIRE(keys_of(*collected) == std::vector<uint32_t>{2, 3, 4, 5});
  }

  SECTION("Collect into a bound equal to the length") {
    auto collected = try_collect<Map4>(shifted);
    REQUIRE(collected.has_value());
    REQUIRE(keys_of(*collected) == std::vector<uint32_t>{2, 3, 4, 5});
  }

  SECTION("Reversed and sliced ranges are re-sorted") {
    auto collected = try_collect<Map5>(shifted | std::views::reverse |
                                       std::views::drop(2));
    REQUIRE(collected.has_value());
    REQUIRE(keys_of(*collected) == std::vector<uint32_t>{2, 3});

    auto taken = try_collect<Map5>(shifted | std::views::take(2));
    REQUIRE(taken.has_value());
    REQUIRE(keys_of(*taken) == std::vector<uint32_t>{2, 3});
  }

  SECTION("Oversized ranges are rejected") {
    auto too_long = try_collect<Map3>(shifted);
    REQUIRE(!too_long.has_value());
    REQUIRE(too_long.error().code() == errc::bound_exceeded);
    REQUIRE(std::string(too_long.error().message()) ==
            "iterator length too big");

    REQUIRE(!try_collect<Map1>(shifted | std::views::drop(2)).has_value());
  }

  SECTION("Rejection happens before any element is read") {
    int reads = 0;
    auto counted = source | std::views::transform([&reads](const auto& entry) {
                     ++reads;
                     return std::pair<uint32_t, unit>(entry.first,
                                                      entry.second);
                   });
    REQUIRE(!try_collect<Map3>(counted).has_value());
    REQUIRE(reads == 0);
  }
}

TEST_CASE("bounded_map equality", "[bounded_map][eq]") {
  auto make = [](auto tag, std::initializer_list<uint32_t> keys) {
    using Map = decltype(tag);
    return bounded_from_keys<Map>(keys);
  };

  SECTION("Same type") {
    using Map = bounded_map<uint32_t, unit, const_bound<7>>;
    REQUIRE(make(Map{}, {1, 2}) == make(Map{}, {1, 2}));
    REQUIRE(make(Map{}, {1, 2}) != make(Map{}, {1, 3}));
  }

  SECTION("Different supplier types with the same bound value") {
    struct b1_tag {};
    struct b2_tag {};
    using B1 = named_bound<b1_tag, 7>;
    using B2 = named_bound<b2_tag, 7>;
    auto b1 = make(bounded_map<uint32_t, unit, B1>{}, {1, 2});
    auto b2 = make(bounded_map<uint32_t, unit, B2>{}, {1, 2});
    REQUIRE(b1 == b2);
    REQUIRE(b2 == b1);
    REQUIRE(b1 == make(bounded_map<uint32_t, unit, const_bound<7>>{}, {1, 2}));
  }

  SECTION("Different bound values are never equal") {
    auto b7 = make(bounded_map<uint32_t, unit, const_bound<7>>{}, {1, 2});
    auto b8 = make(bounded_map<uint32_t, unit, const_bound<8>>{}, {1, 2});
    REQUIRE(b7 != b8);
  }

  SECTION("Against the unbounded map only contents matter") {
    using Map = bounded_map<uint32_t, unit, const_bound<7>>;
    auto bounded = make(Map{}, {1, 2, 3, 4, 5, 6});
    auto plain = map_from_keys<Map::inner_map_type>({1, 2, 3, 4, 5, 6});
    REQUIRE(bounded == plain);
    REQUIRE(plain == bounded);
    REQUIRE(bounded != map_from_keys<Map::inner_map_type>({1}));
  }
}

TEST_CASE("bounded_map ordering", "[bounded_map][ordering]") {
  using Map = bounded_map<uint32_t, uint32_t, const_bound<4>>;
  auto a = Map::try_collect(std::vector<std::pair<uint32_t, uint32_t>>{
                                {1, 1}, {2, 2}})
               .value();
  auto b = Map::try_collect(std::vector<std::pair<uint32_t, uint32_t>>{
                                {1, 1}, {2, 3}})
               .value();
  auto c = Map::try_collect(std::vector<std::pair<uint32_t, uint32_t>>{
                                {1, 1}})
               .value();

  REQUIRE(a < b);
  REQUIRE(c < a);
  REQUIRE(b > c);
  REQUIRE((a <=> a) == std::strong_ordering::equal);
}

TEST_CASE("bounded_map stream output", "[bounded_map][debug]") {
  using Map = bounded_map<uint32_t, uint32_t, const_bound<4>>;
  auto map = Map::try_collect(std::vector<std::pair<uint32_t, uint32_t>>{
                                  {1, 10}, {2, 20}})
                 .value();
  std::ostringstream os;
  os << map;
  REQUIRE(os.str() == "BoundedMap({1: 10, 2: 20}, 4)");
}

TEST_CASE("bounded_map with a configured bound", "[bounded_map][bound]") {
  struct test_slot {};
  using configured = configurable_bound<test_slot>;
  configured::configure(2);

  bounded_map<uint32_t, uint32_t, configured> map;
  REQUIRE(decltype(map)::bound() == 2);
  REQUIRE(map.try_insert(1, 1).has_value());
  REQUIRE(map.try_insert(2, 2).has_value());
  REQUIRE(!map.try_insert(3, 3).has_value());
}

TEMPLATE_TEST_CASE("bounded_map invariant under random operations",
                   "[bounded_map][random]", StdMapStorage, AbslBtreeStorage) {
  using Map = typename TestType::template map<int, int, const_bound<32>>;

  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> key_dist(0, 63);
  std::uniform_int_distribution<int> op_dist(0, 9);

  Map map;
  std::map<int, int> reference;

  for (int step = 0; step < 5000; ++step) {
    int key = key_dist(rng);
    int op = op_dist(rng);
    if (op < 6) {
      bool existed = reference.contains(key);
      auto result = map.try_insert(key, step);
      if (existed || reference.size() < Map::bound()) {
        REQUIRE(result.has_value());
        reference[key] = step;
      } else {
        REQUIRE(!result.has_value());
        REQUIRE(result.error() == std::pair<int, int>(key, step));
      }
    } else if (op < 9) {
      REQUIRE(map.remove(key).has_value() == (reference.erase(key) == 1));
    } else {
      map.retain([key](const int& k, int&) { return k < key; });
      std::erase_if(reference, [key](const auto& e) { return e.first >= key; });
    }

    REQUIRE(map.size() <= Map::bound());
    REQUIRE(map.size() == reference.size());
  }

  std::vector<std::pair<int, int>> contents(map.begin(), map.end());
  std::vector<std::pair<int, int>> expected(reference.begin(), reference.end());
  REQUIRE(contents == expected);
}
