#include <hashlock/execution/preconditions.hpp>

using namespace hashlock::schema;

namespace hashlock::execution {

bool is_finalized(const escrow_state_t& record) {
  return record.status != escrow_status_t::open;
}

bool height_reached(const escrow_state_t& record, const height_t height) {
  return height >= record.unlock_height;
}

bool can_claim(const escrow_state_t& record, const height_t height) {
  return !is_finalized(record) && height_reached(record, height);
}

bool can_refund(const escrow_state_t& record, const height_t height) {
  return !is_finalized(record) && height_reached(record, height);
}

bool can_cancel(const escrow_state_t& record, const height_t height) {
  return !is_finalized(record) && height < record.unlock_height;
}

}  // namespace hashlock::execution
