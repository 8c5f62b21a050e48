#pragma once
#include <anchor/schema/timelock_action.hpp>

namespace anchor::schema {

template <uint16_t Version>
struct execute_change;

template <>
struct execute_change<1> final {
  uint16_t version{1};
  timelock_action_t action{};
};

using execute_change_t = execute_change<1>;

}  // namespace anchor::schema
