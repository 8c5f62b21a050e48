#pragma once

#include <anchor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: pause scope.
// Protocol workflow: Independent pause flags. A call site checks every flag
// that gates it; flags compose by logical AND.
namespace anchor::schema {

enum class pause_scope_t : uint8_t {
  global = 0,
  voucher_creation = 1,
  cross_chain = 2,
};

inline constexpr auto kPauseScopeMappings = std::array{
    std::pair<std::string_view, pause_scope_t>{"global", pause_scope_t::global},
    std::pair<std::string_view, pause_scope_t>{"voucher_creation",
                                               pause_scope_t::voucher_creation},
    std::pair<std::string_view, pause_scope_t>{"cross_chain",
                                               pause_scope_t::cross_chain},
};

template <>
inline std::optional<pause_scope_t> try_from_string<pause_scope_t>(
    const std::string_view value) {
  return from_string(value, kPauseScopeMappings);
}

inline constexpr std::string_view to_string(const pause_scope_t value) {
  return name_of(value, kPauseScopeMappings);
}

}  // namespace anchor::schema
