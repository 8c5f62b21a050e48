#pragma once
#include <anchor/schema/relayer_set.hpp>
#include <anchor/schema/spoke_config.hpp>
#include <anchor/schema/timelock_book.hpp>
#include <map>
#include <utility>

// Schema type: spoke state.
// Protocol workflow: Local anchor of hub vouchers on a destination chain:
// fulfillment flags, qHash lookup and processed batch digests.
namespace anchor::schema {

template <uint16_t Version>
struct spoke_state;

template <>
struct spoke_state<1> final {
  uint16_t version{1};
  spoke_config_t config{};
  relayer_set_t relayers{};
  std::map<std::pair<hash32_t, chain_id_t>, bool> fulfilled;
  std::map<hash32_t, hash32_t> anchors;
  std::map<hash32_t, hash32_t> batches;
  uint64_t fulfilled_count{};
  timelock_book_t timelock{};
};

using spoke_state_t = spoke_state<1>;

}  // namespace anchor::schema
