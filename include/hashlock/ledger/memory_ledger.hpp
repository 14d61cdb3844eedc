#pragma once

#include <hashlock/ledger/ledger.hpp>

#include <map>

namespace hashlock::ledger {

/// In-process ledger for embedding and tests.
class memory_ledger final : public ledger {
 public:
  transfer_status_t transfer(const hashlock::schema::account_id_t& from,
                             const hashlock::schema::account_id_t& to,
                             hashlock::schema::amount_t amount) override;

  hashlock::schema::amount_t balance_of(
      const hashlock::schema::account_id_t& account) const override;

  /// Mint `amount` into `account`. Returns false on overflow.
  bool credit(const hashlock::schema::account_id_t& account,
              hashlock::schema::amount_t amount);

 private:
  std::map<hashlock::schema::account_id_t, hashlock::schema::amount_t>
      balances_;
};

}  // namespace hashlock::ledger
