// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <benchmark/benchmark.h>

#include <bounded_containers/bounded_map.hpp>
#include <bounded_containers/bounded_map_codec.hpp>
#include <cstdint>
#include <map>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace kressler::bounded_containers;

// Generate unique random keys for benchmarking
template <std::size_t Size>
std::vector<int> GenerateUniqueKeys() {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(1, 1000000);
  std::unordered_set<int> unique_keys;

  while (unique_keys.size() < Size) {
    unique_keys.insert(dist(rng));
  }

  return std::vector<int>(unique_keys.begin(), unique_keys.end());
}

template <std::size_t Size, template <typename...> class MapT>
using BenchBounded =
    bounded_map<int, int, const_bound<Size>, std::less<int>, MapT>;

// Map kinds for the read path comparison
template <std::size_t Size, template <typename...> class MapT>
struct Plain {
  using type = MapT<int, int, std::less<int>>;
  static type make(const std::vector<int>& keys) {
    type map;
    for (std::size_t i = 0; i < keys.size(); ++i) {
      map.emplace(keys[i], static_cast<int>(i));
    }
    return map;
  }
};

template <std::size_t Size, template <typename...> class MapT>
struct Bounded {
  using type = BenchBounded<Size, MapT>;
  static type make(const std::vector<int>& keys) {
    return type::try_from(Plain<Size, MapT>::make(keys)).value();
  }
};

// Lookup cost, which should not differ between a bounded map and its inner
// map
template <std::size_t Size, typename Kind>
static void BM_Find(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();
  auto map = Kind::make(keys);

  std::size_t idx = 0;
  for (auto _ : state) {
    auto it = map.find(keys[idx % Size]);
    benchmark::DoNotOptimize(it);
    ++idx;
  }
  state.SetItemsProcessed(state.iterations());
}

// Full in-order iteration
template <std::size_t Size, typename Kind>
static void BM_Iterate(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();
  auto map = Kind::make(keys);

  for (auto _ : state) {
    long sum = 0;
    for (const auto& [key, value] : map) {
      sum += value;
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetItemsProcessed(state.iterations() * Size);
}

// Remove + try_insert cycle on a full map. The second try_insert on a new key
// is rejected, which exercises the full-map path as well.
template <std::size_t Size, template <typename...> class MapT>
static void BM_TryInsert_Full(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size + 1>();
  BenchBounded<Size, MapT> map;
  for (std::size_t i = 0; i < Size; ++i) {
    benchmark::DoNotOptimize(map.try_insert(keys[i], static_cast<int>(i)));
  }

  for (auto _ : state) {
    map.remove(keys[Size - 1]);
    auto accepted = map.try_insert(keys[Size - 1], 1);
    auto rejected = map.try_insert(keys[Size], 2);
    benchmark::DoNotOptimize(accepted);
    benchmark::DoNotOptimize(rejected);
  }
  state.SetItemsProcessed(state.iterations() * 2);
}

// Decoding a payload that fits the bound
template <std::size_t Size>
static void BM_Decode(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<Size>();
  auto bytes = encode(Plain<Size, std::map>::make(keys));

  for (auto _ : state) {
    auto decoded = decode_all<BenchBounded<Size, std::map>>(bytes);
    benchmark::DoNotOptimize(decoded);
  }
  state.SetBytesProcessed(state.iterations() * bytes.size());
}

// Decoding a payload whose declared length exceeds the bound is rejected after
// the prefix, so its cost stays flat as the payload grows
template <std::size_t PayloadSize>
static void BM_Decode_RejectOversized(benchmark::State& state) {
  auto keys = GenerateUniqueKeys<PayloadSize>();
  auto bytes = encode(Plain<PayloadSize, std::map>::make(keys));

  for (auto _ : state) {
    auto decoded = decode_all<BenchBounded<16, std::map>>(bytes);
    benchmark::DoNotOptimize(decoded);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Find<64, Plain<64, std::map>>);
BENCHMARK(BM_Find<64, Bounded<64, std::map>>);
BENCHMARK(BM_Find<64, Plain<64, absl::btree_map>>);
BENCHMARK(BM_Find<64, Bounded<64, absl::btree_map>>);
BENCHMARK(BM_Find<4096, Plain<4096, std::map>>);
BENCHMARK(BM_Find<4096, Bounded<4096, std::map>>);
BENCHMARK(BM_Find<4096, Plain<4096, absl::btree_map>>);
BENCHMARK(BM_Find<4096, Bounded<4096, absl::btree_map>>);

BENCHMARK(BM_Iterate<4096, Plain<4096, std::map>>);
BENCHMARK(BM_Iterate<4096, Bounded<4096, std::map>>);
BENCHMARK(BM_Iterate<4096, Plain<4096, absl::btree_map>>);
BENCHMARK(BM_Iterate<4096, Bounded<4096, absl::btree_map>>);

BENCHMARK(BM_TryInsert_Full<64, std::map>);
BENCHMARK(BM_TryInsert_Full<64, absl::btree_map>);
BENCHMARK(BM_TryInsert_Full<4096, std::map>);
BENCHMARK(BM_TryInsert_Full<4096, absl::btree_map>);

BENCHMARK(BM_Decode<64>);
BENCHMARK(BM_Decode<4096>);

BENCHMARK(BM_Decode_RejectOversized<64>);
BENCHMARK(BM_Decode_RejectOversized<4096>);
BENCHMARK(BM_Decode_RejectOversized<65536>);

BENCHMARK_MAIN();
