#pragma once
#include <hashlock/schema/primitives.hpp>

#include <cstdint>

// Schema type: escrow summary.
// Read projection of one escrow; a missing id yields `exists == false` with
// every other field left at its default.
namespace hashlock::schema {

template <uint16_t Version>
struct escrow_summary;

template <>
struct escrow_summary<1> final {
  uint16_t version{1};
  bool exists{};
  bool claimed{};
  bool refunded{};
  bool height_reached{};
  account_id_t sender{};
  account_id_t recipient{};
  amount_t amount{};
};

using escrow_summary_t = escrow_summary<1>;

}  // namespace hashlock::schema
