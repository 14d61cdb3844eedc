#pragma once
#include <hashlock/schema/primitives.hpp>

#include <cstdint>

// Schema type: cancel escrow.
// Privileged pre-deadline cancellation; funds go back to the sender.
namespace hashlock::schema {

template <uint16_t Version>
struct cancel_escrow;

template <>
struct cancel_escrow<1> final {
  uint16_t version{1};
  escrow_id_t escrow_id{};
};

using cancel_escrow_t = cancel_escrow<1>;

}  // namespace hashlock::schema
