#pragma once

#include <hashlock/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: escrow status.
// Escrow lifecycle: open until exactly one terminal outcome is committed.
// Cancellation by the privileged owner lands on `refunded` as well.
namespace hashlock::schema {

enum class escrow_status_t : uint8_t {
  open = 0,
  claimed = 1,
  refunded = 2,
};

inline constexpr auto kEscrowStatusMappings = enum_mappings_t<escrow_status_t, 3>{
    std::pair<std::string_view, escrow_status_t>{"open", escrow_status_t::open},
    std::pair<std::string_view, escrow_status_t>{"claimed",
                                                 escrow_status_t::claimed},
    std::pair<std::string_view, escrow_status_t>{"refunded",
                                                 escrow_status_t::refunded}};

inline constexpr std::optional<escrow_status_t> try_escrow_status_from_string(
    const std::string_view value) {
  return from_string(value, kEscrowStatusMappings);
}

inline constexpr std::string_view to_string(const escrow_status_t value) {
  return to_string(value, kEscrowStatusMappings);
}

}  // namespace hashlock::schema
