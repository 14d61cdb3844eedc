#pragma once
#include <hashlock/schema/primitives.hpp>

#include <string_view>

namespace hashlock::blake3 {

hashlock::schema::hash32_t hash(const std::string_view& str);
hashlock::schema::hash32_t hash(const hashlock::schema::bytes_view_t& bytes);

}  // namespace hashlock::blake3
