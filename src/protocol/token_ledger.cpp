#include <spdlog/spdlog.h>
#include <anchor/common/critical.hpp>
#include <anchor/protocol/result.hpp>
#include <anchor/protocol/token_ledger.hpp>
#include <utility>

using namespace anchor::schema;

namespace anchor::protocol {

token_ledger::token_ledger(token_state_t state) : state_(std::move(state)) {}

const token_state_t& token_ledger::state() const {
  return state_;
}

amount_t token_ledger::balance_of(const address_t& owner) const {
  auto it = state_.balances.find(owner);
  return it == std::end(state_.balances) ? amount_t{} : it->second;
}

amount_t token_ledger::allowance(const address_t& owner,
                                 const address_t& spender) const {
  auto it = state_.allowances.find(std::pair{owner, spender});
  return it == std::end(state_.allowances) ? amount_t{} : it->second;
}

transaction_result_t token_ledger::approve(const call_context& context,
                                           const token_approve_t& operation) {
  if (is_zero(operation.spender)) {
    return make_error(transaction_error_code::invalid_address,
                      kTokenCodespace, "spender address is zero");
  }
  state_.allowances[std::pair{context.caller, operation.spender}] =
      operation.amount;
  auto result = transaction_result_t{};
  append_event(result, "approval",
               {{"owner", to_string(context.caller)},
                {"spender", to_string(operation.spender)},
                {"amount", to_string(operation.amount)}});
  return result;
}

transaction_result_t token_ledger::transfer(
    const call_context& context,
    const token_transfer_t& operation) {
  if (is_zero(operation.to)) {
    return make_error(transaction_error_code::invalid_address,
                      kTokenCodespace, "recipient address is zero");
  }
  if (!can_move(context.caller, operation.amount)) {
    return make_error(transaction_error_code::insufficient_balance,
                      kTokenCodespace, "insufficient balance",
                      to_string(context.caller));
  }
  auto result = transaction_result_t{};
  result.events.push_back(move(context.caller, operation.to, operation.amount));
  return result;
}

bool token_ledger::can_move(const address_t& from,
                            const amount_t& amount) const {
  return balance_of(from) >= amount;
}

bool token_ledger::can_move_from(const address_t& spender,
                                 const address_t& from,
                                 const amount_t& amount) const {
  return allowance(from, spender) >= amount && balance_of(from) >= amount;
}

transaction_event_t token_ledger::move(const address_t& from,
                                       const address_t& to,
                                       const amount_t& amount) {
  if (!can_move(from, amount)) {
    spdlog::error("token move of {} from {} exceeds balance",
                  to_string(amount), to_string(from));
    anchor::common::critical("token move exceeds balance");
  }
  state_.balances[from] -= amount;
  state_.balances[to] += amount;
  return make_event("transfer", {{"from", to_string(from)},
                                 {"to", to_string(to)},
                                 {"amount", to_string(amount)}});
}

transaction_event_t token_ledger::move_from(const address_t& spender,
                                            const address_t& from,
                                            const address_t& to,
                                            const amount_t& amount) {
  if (!can_move_from(spender, from, amount)) {
    spdlog::error("token move of {} from {} by {} exceeds allowance",
                  to_string(amount), to_string(from), to_string(spender));
    anchor::common::critical("token move exceeds allowance");
  }
  state_.allowances[std::pair{from, spender}] -= amount;
  return move(from, to, amount);
}

}  // namespace anchor::protocol
