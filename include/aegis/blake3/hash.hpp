#pragma once
#include <aegis/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace aegis::blake3 {

aegis::schema::hash32_t hash(const std::string_view& str);
aegis::schema::hash32_t hash(const aegis::schema::bytes_view_t& bytes);

}  // namespace aegis::blake3
