#pragma once

#include <anchor/schema/primitives.hpp>
#include <anchor/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace anchor::schema {

template <uint16_t Version>
struct transaction_result;

// Outcome of one transaction or unit operation. `code` 0 is success;
// otherwise it is a transaction_error_code and `info` names the offending
// identifier.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace anchor::schema
