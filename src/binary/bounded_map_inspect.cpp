// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <bounded_containers/bounded_map.hpp>
#include <bounded_containers/bounded_map_codec.hpp>
#include <bounded_containers/bounded_map_json.hpp>
#include <cstdint>
#include <iostream>
#include <lyra/lyra.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using namespace kressler::bounded_containers;

namespace {

struct inspect_bound_tag {};
using inspect_bound = configurable_bound<inspect_bound_tag>;
using inspect_map = bounded_map<uint32_t, uint32_t, inspect_bound>;

std::optional<byte_buffer> parse_hex(const std::string& text) {
  std::string digits = text;
  if (digits.starts_with("0x") || digits.starts_with("0X")) {
    digits.erase(0, 2);
  }
  if (digits.size() % 2 != 0) {
    return std::nullopt;
  }

  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  byte_buffer bytes;
  bytes.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    int hi = nibble(digits[i]);
    int lo = nibble(digits[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return bytes;
}

std::string to_hex(const byte_buffer& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out = "0x";
  for (auto byte : bytes) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0f]);
  }
  return out;
}

std::optional<inspect_map> read_hex(const std::string& text) {
  auto bytes = parse_hex(text);
  if (!bytes) {
    std::cerr << "Error: input is not valid hex" << std::endl;
    return std::nullopt;
  }
  auto map = decode_all<inspect_map>(*bytes);
  if (!map) {
    std::cerr << "Error decoding map: " << map.error() << std::endl;
    return std::nullopt;
  }
  return std::move(*map);
}

std::optional<inspect_map> read_json(const std::string& text) {
  try {
    return nlohmann::json::parse(text).get<inspect_map>();
  } catch (const deserialize_error& e) {
    std::cerr << "Error reading map: " << e.what() << std::endl;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "Error parsing JSON: " << e.what() << std::endl;
  }
  return std::nullopt;
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  uint32_t bound = 16;
  std::string hex;
  std::string json;
  std::string output = "hex";

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(bound, "bound")["-b"]["--bound"](
          "Maximum number of entries the map may hold") |
      lyra::opt(hex, "hex")["-x"]["--hex"](
          "SCALE-encoded u32 -> u32 map as hex") |
      lyra::opt(json, "json")["-j"]["--json"]("JSON object of u32 -> u32") |
      lyra::opt(output, "format")["-o"]["--output"](
          "Re-encode as hex or json (default hex)");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (hex.empty() == json.empty()) {
    std::cerr << "Error in command line: exactly one of --hex or --json is "
                 "required"
              << std::endl;
    return 1;
  }

  if (output != "hex" && output != "json") {
    std::cerr << "Error in command line: unknown output format " << output
              << std::endl;
    return 1;
  }

  inspect_bound::configure(bound);

  auto map = hex.empty() ? read_json(json) : read_hex(hex);
  if (!map) {
    return 1;
  }

  std::cout << "Entries: " << map->size() << " of " << inspect_map::bound()
            << (map->is_full() ? " (full)" : "") << std::endl;
  for (const auto& [key, value] : *map) {
    std::cout << "  " << key << " => " << value << std::endl;
  }

  if (output == "json") {
    std::cout << "JSON: " << nlohmann::json(*map).dump() << std::endl;
  } else {
    std::cout << "Encoded: " << to_hex(encode(*map)) << std::endl;
  }
  std::cout << "Max encoded length: " << max_encoded_len<inspect_map>()
            << " bytes" << std::endl;
  return 0;
}
