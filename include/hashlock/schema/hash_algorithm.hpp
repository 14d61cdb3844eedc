#pragma once

#include <hashlock/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: hash algorithm.
// Function a claim preimage is hashed with before it is compared to the
// escrow's stored commitment.
namespace hashlock::schema {

enum class hash_algorithm_t : uint8_t {
  sha256 = 0,
  blake3 = 1,
};

inline constexpr auto kHashAlgorithmMappings =
    enum_mappings_t<hash_algorithm_t, 2>{
        std::pair<std::string_view, hash_algorithm_t>{"sha256",
                                                      hash_algorithm_t::sha256},
        std::pair<std::string_view, hash_algorithm_t>{
            "blake3", hash_algorithm_t::blake3}};

inline constexpr std::optional<hash_algorithm_t>
try_hash_algorithm_from_string(const std::string_view value) {
  return from_string(value, kHashAlgorithmMappings);
}

inline constexpr std::string_view to_string(const hash_algorithm_t value) {
  return to_string(value, kHashAlgorithmMappings);
}

}  // namespace hashlock::schema
