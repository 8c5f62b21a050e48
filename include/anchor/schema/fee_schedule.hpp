#pragma once
#include <anchor/schema/primitives.hpp>

// Schema type: fee schedule.
// Protocol workflow: total fee = verification_fee + cross_chain_fee * chains.
namespace anchor::schema {

template <uint16_t Version>
struct fee_schedule;

template <>
struct fee_schedule<1> final {
  uint16_t version{1};
  amount_t verification_fee{};
  amount_t cross_chain_fee{};

  bool operator==(const fee_schedule<1>&) const = default;
};

using fee_schedule_t = fee_schedule<1>;

}  // namespace anchor::schema
