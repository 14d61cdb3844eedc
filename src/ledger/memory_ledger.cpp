#include <hashlock/ledger/memory_ledger.hpp>

#include <limits>

using namespace hashlock::schema;

namespace hashlock::ledger {

transfer_status_t memory_ledger::transfer(const account_id_t& from,
                                          const account_id_t& to,
                                          const amount_t amount) {
  auto from_balance = balance_of(from);
  if (from_balance < amount) {
    return transfer_status_t::insufficient_funds;
  }
  if (from == to || amount == 0) {
    return transfer_status_t::ok;
  }
  auto to_balance = balance_of(to);
  if (to_balance > std::numeric_limits<amount_t>::max() - amount) {
    return transfer_status_t::transfer_failed;
  }
  balances_[from] = from_balance - amount;
  balances_[to] = to_balance + amount;
  return transfer_status_t::ok;
}

amount_t memory_ledger::balance_of(const account_id_t& account) const {
  auto it = balances_.find(account);
  return it == std::end(balances_) ? amount_t{} : it->second;
}

bool memory_ledger::credit(const account_id_t& account, const amount_t amount) {
  auto balance = balance_of(account);
  if (balance > std::numeric_limits<amount_t>::max() - amount) {
    return false;
  }
  balances_[account] = balance + amount;
  return true;
}

}  // namespace hashlock::ledger
