#pragma once

#include <hashlock/schema/hash_algorithm.hpp>
#include <hashlock/schema/primitives.hpp>

namespace hashlock::crypto {

/// Hash a claim preimage with the configured algorithm.
hashlock::schema::hash32_t commitment(
    hashlock::schema::hash_algorithm_t algorithm,
    const hashlock::schema::bytes_view_t& secret);

/// True when `secret` hashes to `expected` under `algorithm`.
///
/// The comparison runs in constant time with respect to the digest bytes.
bool matches_commitment(hashlock::schema::hash_algorithm_t algorithm,
                        const hashlock::schema::bytes_view_t& secret,
                        const hashlock::schema::hash32_t& expected);

}  // namespace hashlock::crypto
