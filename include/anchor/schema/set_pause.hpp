#pragma once
#include <anchor/schema/pause_scope.hpp>
#include <anchor/schema/primitives.hpp>
#include <string>

namespace anchor::schema {

template <uint16_t Version>
struct set_pause;

template <>
struct set_pause<1> final {
  uint16_t version{1};
  pause_scope_t scope{};
  bool paused{};
  std::string reason;
};

using set_pause_t = set_pause<1>;

}  // namespace anchor::schema
