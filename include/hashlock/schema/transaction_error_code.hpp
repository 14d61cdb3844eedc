#pragma once

#include <cstdint>

namespace hashlock::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  not_authorized = 100,
  not_found = 101,
  duplicate_id = 102,
  invalid_amount = 103,
  invalid_height = 104,
  insufficient_balance = 105,
  height_not_reached = 106,
  already_expired = 107,
  invalid_secret = 108,
  already_finalized = 109,
  transfer_failed = 110,
};

}  // namespace hashlock::schema
