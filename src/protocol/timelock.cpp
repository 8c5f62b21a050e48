#include <spdlog/spdlog.h>
#include <anchor/blake3/hash.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/protocol/timelock.hpp>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <limits>

using namespace anchor::schema;

namespace anchor::protocol {

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

}  // namespace

hash32_t make_proposal_id(const timelock_action_t action,
                          const change_value_t& value) {
  auto encoder = encoder_t{};
  auto material = encoder.encode_all(std::string{to_string(action)}, value);
  return anchor::blake3::hash(bytes_view_t{material});
}

transaction_result_t schedule_change(timelock_book_t& book,
                                     const schedule_change_t& operation,
                                     const timestamp_seconds_t now,
                                     const duration_seconds_t delay,
                                     const std::string_view codespace) {
  if (now > std::numeric_limits<timestamp_seconds_t>::max() - delay) {
    return make_error(transaction_error_code::amount_overflow, codespace,
                      "unlock time overflows");
  }
  auto proposal_id = make_proposal_id(operation.action, operation.value);
  auto unlock_time = now + delay;

  auto result = transaction_result_t{};
  auto pending = book.pending.find(operation.action);
  if (pending != std::end(book.pending)) {
    auto stale_id = make_proposal_id(operation.action, pending->second);
    if (stale_id != proposal_id) {
      book.unlock_times.erase(stale_id);
      append_event(result, "timelock_superseded",
                   {{"action", std::string{to_string(operation.action)}},
                    {"proposal_id", to_string(stale_id)}});
    }
  }
  book.pending[operation.action] = operation.value;
  book.unlock_times[proposal_id] = unlock_time;

  spdlog::info("{}: scheduled {} unlocking at {}", codespace,
               to_string(operation.action), unlock_time);
  append_event(result, "timelock_scheduled",
               {{"action", std::string{to_string(operation.action)}},
                {"proposal_id", to_string(proposal_id)},
                {"unlock_time", std::to_string(unlock_time)}});
  result.data = make_bytes(bytes_view_t{proposal_id});
  return result;
}

transaction_result_t execute_change(timelock_book_t& book,
                                    const timelock_action_t action,
                                    const timestamp_seconds_t now,
                                    const std::string_view codespace,
                                    const change_applier_t& apply) {
  auto pending = book.pending.find(action);
  if (pending == std::end(book.pending)) {
    return make_error(transaction_error_code::proposal_unknown, codespace,
                      "no pending change for action",
                      std::string{to_string(action)});
  }
  auto proposal_id = make_proposal_id(action, pending->second);
  auto unlock = book.unlock_times.find(proposal_id);
  if (unlock == std::end(book.unlock_times)) {
    return make_error(transaction_error_code::proposal_unknown, codespace,
                      "unknown proposal", to_string(proposal_id));
  }
  if (now < unlock->second) {
    return make_error(transaction_error_code::timelock_not_expired, codespace,
                      "timelock not expired",
                      std::to_string(unlock->second));
  }

  auto result = transaction_result_t{};
  apply(pending->second, result);
  book.unlock_times.erase(unlock);
  book.pending.erase(pending);

  spdlog::info("{}: executed {}", codespace, to_string(action));
  append_event(result, "timelock_executed",
               {{"action", std::string{to_string(action)}},
                {"proposal_id", to_string(proposal_id)}});
  result.data = make_bytes(bytes_view_t{proposal_id});
  return result;
}

}  // namespace anchor::protocol
