#pragma once
#include <anchor/protocol/call_context.hpp>
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/token_approve.hpp>
#include <anchor/schema/token_state.hpp>
#include <anchor/schema/token_transfer.hpp>
#include <anchor/schema/transaction_event.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <vector>

namespace anchor::protocol {

/// Fee token on the hub chain.
///
/// External senders approve and transfer. Other units on the same chain move
/// value through the check/move pairs: callers check first, then move, so a
/// move that fails after a passing check is an invariant breach.
class token_ledger final {
 public:
  explicit token_ledger(anchor::schema::token_state_t state);

  const anchor::schema::token_state_t& state() const;

  anchor::schema::amount_t balance_of(
      const anchor::schema::address_t& owner) const;
  anchor::schema::amount_t allowance(
      const anchor::schema::address_t& owner,
      const anchor::schema::address_t& spender) const;

  anchor::schema::transaction_result_t approve(
      const call_context& context,
      const anchor::schema::token_approve_t& operation);
  anchor::schema::transaction_result_t transfer(
      const call_context& context,
      const anchor::schema::token_transfer_t& operation);

  bool can_move(const anchor::schema::address_t& from,
                const anchor::schema::amount_t& amount) const;
  bool can_move_from(const anchor::schema::address_t& spender,
                     const anchor::schema::address_t& from,
                     const anchor::schema::amount_t& amount) const;

  anchor::schema::transaction_event_t move(
      const anchor::schema::address_t& from,
      const anchor::schema::address_t& to,
      const anchor::schema::amount_t& amount);
  anchor::schema::transaction_event_t move_from(
      const anchor::schema::address_t& spender,
      const anchor::schema::address_t& from,
      const anchor::schema::address_t& to,
      const anchor::schema::amount_t& amount);

 private:
  anchor::schema::token_state_t state_;
};

}  // namespace anchor::protocol
