#pragma once
#include <hashlock/schema/cancel_escrow.hpp>
#include <hashlock/schema/claim_escrow.hpp>
#include <hashlock/schema/create_escrow.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/refund_escrow.hpp>

#include <cstdint>
#include <variant>

namespace hashlock::schema {

using transaction_payload_t = std::variant<create_escrow_t,
                                           claim_escrow_t,
                                           refund_escrow_t,
                                           cancel_escrow_t>;

template <uint16_t Version>
struct transaction;

/// Host-submitted envelope. `signer` is the caller identity the host has
/// already authenticated.
template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace hashlock::schema
