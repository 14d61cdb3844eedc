#pragma once
#include <hashlock/schema/primitives.hpp>

namespace hashlock::storage {

/// Monotonic escrow identifier source.
///
/// Seeded from the persisted counter at startup; the counter itself is
/// written by `escrow_store::insert` in the same batch as the record, so an
/// identifier is only consumed once its record exists.
class id_allocator final {
 public:
  explicit id_allocator(hashlock::schema::escrow_id_t next = 1)
      : next_{next == 0 ? 1 : next} {}

  /// Identifier the next call to `next()` will return.
  hashlock::schema::escrow_id_t peek() const { return next_; }

  /// Return the next unused identifier and advance past it.
  hashlock::schema::escrow_id_t next() { return next_++; }

 private:
  hashlock::schema::escrow_id_t next_;
};

}  // namespace hashlock::storage
