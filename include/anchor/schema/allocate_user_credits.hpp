#pragma once
#include <anchor/schema/primitives.hpp>

// Schema type: allocate user credits.
// Protocol workflow: Moves part of the caller's relayer pool into the slice
// reserved for one user.
namespace anchor::schema {

template <uint16_t Version>
struct allocate_user_credits;

template <>
struct allocate_user_credits<1> final {
  uint16_t version{1};
  address_t user{};
  amount_t amount{};
};

using allocate_user_credits_t = allocate_user_credits<1>;

}  // namespace anchor::schema
