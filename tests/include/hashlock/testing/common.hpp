#pragma once

#include <hashlock/crypto/commitment.hpp>
#include <hashlock/schema/hash_algorithm.hpp>
#include <hashlock/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace hashlock::testing {

inline hashlock::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = hashlock::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline hashlock::schema::account_id_t make_account(const uint8_t seed) {
  auto account = hashlock::schema::account_id_t{};
  account[0] = seed;
  account[31] = 0xA5;
  return account;
}

inline hashlock::schema::bytes_t make_secret(const std::string_view text) {
  return hashlock::schema::make_bytes(text);
}

/// Commitment that `secret` genuinely opens.
inline hashlock::schema::hash32_t make_commitment(
    const hashlock::schema::bytes_t& secret,
    const hashlock::schema::hash_algorithm_t algorithm =
        hashlock::schema::hash_algorithm_t::sha256) {
  return hashlock::crypto::commitment(
      algorithm, hashlock::schema::bytes_view_t{secret.data(), secret.size()});
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace hashlock::testing
