#pragma once
#include <hashlock/schema/primitives.hpp>

#include <cstdint>

namespace hashlock::schema {

template <uint16_t Version>
struct create_escrow;

template <>
struct create_escrow<1> final {
  uint16_t version{1};
  account_id_t recipient{};
  amount_t amount{};
  uint64_t blocks_ahead{};
  hash32_t secret_hash{};
};

using create_escrow_t = create_escrow<1>;

}  // namespace hashlock::schema
