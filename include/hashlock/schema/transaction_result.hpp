#pragma once

#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/transaction_error_code.hpp>
#include <hashlock/schema/transaction_event.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hashlock::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of one escrow transition. `code == 0` is success; any other value
/// is a `transaction_error_code` and guarantees nothing was changed.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<escrow_id_t> escrow_id;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

inline bool succeeded(const transaction_result_t& result) {
  return result.code == 0;
}

inline bool failed_with(const transaction_result_t& result,
                        const transaction_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace hashlock::schema
