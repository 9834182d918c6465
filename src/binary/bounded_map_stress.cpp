// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <bounded_containers/bounded_map.hpp>
#include <bounded_containers/bounded_map_codec.hpp>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <lyra/lyra.hpp>
#include <map>
#include <random>

using namespace kressler::bounded_containers;

namespace {
struct stress_bound_tag {};
using stress_bound = configurable_bound<stress_bound_tag>;
using stress_map = bounded_map<int, int, stress_bound>;
}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = std::chrono::system_clock::now().time_since_epoch().count();
  size_t target_iterations = 100;
  size_t ops = 10000;
  uint32_t min_bound = 1;
  uint32_t max_bound = 512;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(ops, "ops")["-n"]["--ops"]("Operations per iteration") |
      lyra::opt(min_bound, "min_bound")["--min-bound"](
          "Smallest bound to draw") |
      lyra::opt(max_bound, "max_bound")["--max-bound"](
          "Largest bound to draw");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    exit(1);
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_bound > max_bound) {
    std::cerr << "Error in command line: --min-bound exceeds --max-bound"
              << std::endl;
    exit(1);
  }

  std::uniform_int_distribution<uint32_t> bound_dist(min_bound, max_bound);
  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    uint32_t bound = bound_dist(rng);
    stress_bound::configure(bound);

    // Keys are drawn from a range a little wider than the bound so that both
    // overwrites and rejections happen often
    std::uniform_int_distribution<int> key_dist(0,
                                                static_cast<int>(bound) * 2);
    std::uniform_int_distribution<int> val_dist(
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    std::uniform_int_distribution<int> op_dist(0, 99);

    std::cout << "Iteration " << iter << " using bound " << bound << ", seed "
              << iter + seed << std::endl;

    std::map<int, int> reference;
    stress_map bounded;
    size_t rejected = 0;

    auto fail = [&](const char* what) -> void {
      std::cout << "Mismatch after " << what << " (bound " << bound
                << ", size " << bounded.size() << ", reference size "
                << reference.size() << ")" << std::endl;
      exit(1);
    };

    auto validate = [&](const char* what) -> void {
      if (bounded.size() > stress_map::bound()) {
        fail(what);
      }
      if (!(bounded == reference)) {
        fail(what);
      }
    };

    auto insert = [&]() -> void {
      int key = key_dist(rng);
      int val = val_dist(rng);
      bool present = reference.contains(key);
      auto inserted = bounded.try_insert(key, val);
      if (inserted) {
        if (!present && reference.size() >= bound) {
          fail("accepted insert into a full map");
        }
        reference.insert_or_assign(key, val);
      } else {
        if (present || reference.size() < bound) {
          fail("rejected insert");
        }
        if (inserted.error().first != key || inserted.error().second != val) {
          fail("returned pair");
        }
        ++rejected;
      }
    };

    auto remove = [&]() -> void {
      int key = key_dist(rng);
      auto removed = bounded.remove(key);
      auto it = reference.find(key);
      if (removed.has_value() != (it != reference.end())) {
        fail("remove");
      }
      if (it != reference.end()) {
        if (*removed != it->second) {
          fail("removed value");
        }
        reference.erase(it);
      }
    };

    auto retain = [&]() -> void {
      int modulus = 2 + key_dist(rng) % 5;
      bounded.retain([&](const int& key, int&) { return key % modulus != 0; });
      std::erase_if(reference,
                    [&](const auto& entry) { return entry.first % modulus == 0; });
    };

    auto mutate = [&]() -> void {
      int extra = key_dist(rng) % 4;
      int base = key_dist(rng);
      auto expected = reference;
      for (int i = 0; i < extra; ++i) {
        expected.insert_or_assign(base + i, i);
      }

      auto mutated = std::move(bounded).try_mutate([&](auto& inner) {
        for (int i = 0; i < extra; ++i) {
          inner.insert_or_assign(base + i, i);
        }
      });
      if (expected.size() <= bound) {
        if (!mutated) {
          fail("rejected mutation");
        }
        bounded = std::move(*mutated);
        reference = std::move(expected);
      } else {
        if (mutated) {
          fail("accepted oversized mutation");
        }
        // The moved-from map was cleared, start again from the reference
        auto restored = stress_map::try_from(
            stress_map::inner_map_type(reference.begin(), reference.end()));
        if (!restored) {
          fail("restore");
        }
        bounded = std::move(*restored);
      }
    };

    auto round_trip = [&]() -> void {
      auto decoded = decode_all<stress_map>(encode(bounded));
      if (!decoded || !(*decoded == bounded)) {
        fail("encode/decode");
      }
    };

    for (size_t op = 0; op < ops; ++op) {
      int choice = op_dist(rng);
      if (choice < 55) {
        insert();
        validate("insert");
      } else if (choice < 85) {
        remove();
        validate("remove");
      } else if (choice < 90) {
        retain();
        validate("retain");
      } else if (choice < 97) {
        mutate();
        validate("try_mutate");
      } else {
        round_trip();
      }
    }

    std::cout << "  final size " << bounded.size() << ", " << rejected
              << " inserts rejected" << std::endl;
  }
  return 0;
}
