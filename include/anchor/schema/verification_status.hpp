#pragma once

#include <anchor/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verification status.
// Protocol workflow: Derived propagation status of a qHash as seen by the
// registry. Never stored; computed from records and confirmations.
namespace anchor::schema {

enum class verification_status_t : uint8_t {
  not_found = 0,
  verified = 1,
  verified_crosschain_initiated = 2,
  verified_crosschain_propagating = 3,
  verified_crosschain_propagated = 4,
  verified_propagation_failed = 5,
};

inline constexpr auto kVerificationStatusMappings = std::array{
    std::pair<std::string_view, verification_status_t>{
        "not_found", verification_status_t::not_found},
    std::pair<std::string_view, verification_status_t>{
        "verified", verification_status_t::verified},
    std::pair<std::string_view, verification_status_t>{
        "verified_crosschain_initiated",
        verification_status_t::verified_crosschain_initiated},
    std::pair<std::string_view, verification_status_t>{
        "verified_crosschain_propagating",
        verification_status_t::verified_crosschain_propagating},
    std::pair<std::string_view, verification_status_t>{
        "verified_crosschain_propagated",
        verification_status_t::verified_crosschain_propagated},
    std::pair<std::string_view, verification_status_t>{
        "verified_propagation_failed",
        verification_status_t::verified_propagation_failed},
};

template <>
inline std::optional<verification_status_t>
try_from_string<verification_status_t>(const std::string_view value) {
  return from_string(value, kVerificationStatusMappings);
}

inline constexpr std::string_view to_string(const verification_status_t value) {
  return name_of(value, kVerificationStatusMappings);
}

}  // namespace anchor::schema
