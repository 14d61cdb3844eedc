#pragma once
#include <hashlock/schema/primitives.hpp>

#include <cstdint>

namespace hashlock::schema {

template <uint16_t Version>
struct refund_escrow;

template <>
struct refund_escrow<1> final {
  uint16_t version{1};
  escrow_id_t escrow_id{};
};

using refund_escrow_t = refund_escrow<1>;

}  // namespace hashlock::schema
