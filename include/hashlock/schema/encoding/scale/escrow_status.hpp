#pragma once

#include <hashlock/schema/escrow_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(hashlock::schema,
                             escrow_status_t,
                             hashlock::schema::escrow_status_t::open,
                             hashlock::schema::escrow_status_t::claimed,
                             hashlock::schema::escrow_status_t::refunded)
