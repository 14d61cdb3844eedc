#pragma once

#include <hashlock/schema/transaction_event_attribute.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Emitted once per successful escrow transition (escrow_created,
// escrow_claimed, escrow_refunded, escrow_cancelled).
namespace hashlock::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace hashlock::schema
