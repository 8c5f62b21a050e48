#pragma once
#include <anchor/schema/change_value.hpp>
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/schedule_change.hpp>
#include <anchor/schema/timelock_action.hpp>
#include <anchor/schema/timelock_book.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <functional>
#include <string_view>

// Schedule/execute primitive for sensitive parameter changes.
//
// A proposal id is hash(action name, value). Scheduling stores the unlock time
// under that id and makes the value the single pending value for the action.
// Executing recomputes the id from the pending value, requires the unlock time
// to have passed, applies the value and forgets the proposal.
namespace anchor::protocol {

inline constexpr anchor::schema::duration_seconds_t kOneDay = 24 * 60 * 60;

anchor::schema::hash32_t make_proposal_id(
    anchor::schema::timelock_action_t action,
    const anchor::schema::change_value_t& value);

/// Stage a change. A previously pending value for the same action is
/// superseded and its unlock entry removed.
anchor::schema::transaction_result_t schedule_change(
    anchor::schema::timelock_book_t& book,
    const anchor::schema::schedule_change_t& operation,
    anchor::schema::timestamp_seconds_t now,
    anchor::schema::duration_seconds_t delay,
    std::string_view codespace);

using change_applier_t =
    std::function<void(const anchor::schema::change_value_t& value,
                       anchor::schema::transaction_result_t& result)>;

/// Apply the pending change for action once its unlock time has passed.
anchor::schema::transaction_result_t execute_change(
    anchor::schema::timelock_book_t& book,
    anchor::schema::timelock_action_t action,
    anchor::schema::timestamp_seconds_t now,
    std::string_view codespace,
    const change_applier_t& apply);

}  // namespace anchor::protocol
