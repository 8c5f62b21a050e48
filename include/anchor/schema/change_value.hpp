#pragma once
#include <anchor/schema/fee_schedule.hpp>
#include <anchor/schema/primitives.hpp>
#include <variant>

namespace anchor::schema {

// Parameter carried by a scheduled change. Addresses cover wallet and unit
// rotations, uint16_t carries basis points, amount_t carries single fees.
using change_value_t =
    std::variant<address_t, fee_schedule_t, uint16_t, amount_t>;

}  // namespace anchor::schema
