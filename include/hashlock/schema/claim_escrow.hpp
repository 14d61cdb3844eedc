#pragma once
#include <hashlock/schema/primitives.hpp>

#include <cstdint>

namespace hashlock::schema {

template <uint16_t Version>
struct claim_escrow;

template <>
struct claim_escrow<1> final {
  uint16_t version{1};
  escrow_id_t escrow_id{};
  bytes_t secret;
};

using claim_escrow_t = claim_escrow<1>;

}  // namespace hashlock::schema
