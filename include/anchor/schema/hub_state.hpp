#pragma once
#include <anchor/schema/hub_config.hpp>
#include <anchor/schema/relayer_set.hpp>
#include <anchor/schema/timelock_book.hpp>
#include <anchor/schema/voucher.hpp>
#include <map>
#include <utility>

namespace anchor::schema {

template <uint16_t Version>
struct hub_state;

template <>
struct hub_state<1> final {
  uint16_t version{1};
  hub_config_t config{};
  relayer_set_t relayers{};
  std::map<hash32_t, voucher_t> vouchers;
  std::map<std::pair<hash32_t, chain_id_t>, bool> fulfilled;
  // Mixed into voucher ids; incremented once per created voucher.
  uint64_t voucher_counter{};
  timelock_book_t timelock{};
};

using hub_state_t = hub_state<1>;

}  // namespace anchor::schema
