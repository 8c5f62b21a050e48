#pragma once
#include <anchor/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace anchor::blake3 {

anchor::schema::hash32_t hash(const std::string_view& str);
anchor::schema::hash32_t hash(const anchor::schema::bytes_view_t& bytes);

/// Hash of the concatenation of parts, without materializing it.
anchor::schema::hash32_t hash(
    std::initializer_list<anchor::schema::bytes_view_t> parts);

}  // namespace anchor::blake3
