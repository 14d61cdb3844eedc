#pragma once

#include <hashlock/schema/escrow_state.hpp>
#include <hashlock/schema/primitives.hpp>

// Stateless transition guards over (record, current height).
//
// Claim and refund share the same height gate and differ only in who may
// call and what proof is needed. Cancel is legal strictly before the gate,
// so for any height exactly one of {cancel} or {claim, refund} is reachable.
namespace hashlock::execution {

bool is_finalized(const hashlock::schema::escrow_state_t& record);

bool height_reached(const hashlock::schema::escrow_state_t& record,
                    hashlock::schema::height_t height);

bool can_claim(const hashlock::schema::escrow_state_t& record,
               hashlock::schema::height_t height);

bool can_refund(const hashlock::schema::escrow_state_t& record,
                hashlock::schema::height_t height);

bool can_cancel(const hashlock::schema::escrow_state_t& record,
                hashlock::schema::height_t height);

}  // namespace hashlock::execution
