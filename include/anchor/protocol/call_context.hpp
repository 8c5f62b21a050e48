#pragma once
#include <anchor/schema/primitives.hpp>
#include <cstdint>

namespace anchor::protocol {

/// Authenticated caller and block clock for one unit entry point.
struct call_context final {
  anchor::schema::address_t caller{};
  anchor::schema::timestamp_seconds_t timestamp{};
  uint64_t block_height{};
};

}  // namespace anchor::protocol
