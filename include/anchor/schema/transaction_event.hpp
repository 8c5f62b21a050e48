#pragma once

#include <anchor/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Protocol workflow: Event stream item. Relayers watch these to drive spoke
// fulfillment and hub/registry confirmation.
namespace anchor::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace anchor::schema
