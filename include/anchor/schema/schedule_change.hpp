#pragma once
#include <anchor/schema/change_value.hpp>
#include <anchor/schema/timelock_action.hpp>

// Schema type: schedule change.
// Protocol workflow: Owner stages a sensitive configuration change. It can be
// executed once the target unit's delay has elapsed.
namespace anchor::schema {

template <uint16_t Version>
struct schedule_change;

template <>
struct schedule_change<1> final {
  uint16_t version{1};
  timelock_action_t action{};
  change_value_t value{};
};

using schedule_change_t = schedule_change<1>;

}  // namespace anchor::schema
