#pragma once
#include <anchor/schema/change_value.hpp>
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/timelock_action.hpp>
#include <map>

// Schema type: timelock book.
// Protocol workflow: Proposal id -> unlock time, plus the single pending value
// slot per action type.
namespace anchor::schema {

template <uint16_t Version>
struct timelock_book;

template <>
struct timelock_book<1> final {
  uint16_t version{1};
  std::map<hash32_t, timestamp_seconds_t> unlock_times;
  std::map<timelock_action_t, change_value_t> pending;
};

using timelock_book_t = timelock_book<1>;

}  // namespace anchor::schema
