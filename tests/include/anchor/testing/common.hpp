#pragma once

#include <anchor/protocol/call_context.hpp>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/transaction_result.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace anchor::testing {

using scale_encoder_t = anchor::schema::encoding::encoder<
    anchor::schema::encoding::scale_encoder_tag>;

inline anchor::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = anchor::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline anchor::schema::address_t make_account(const uint8_t seed) {
  auto out = anchor::schema::address_t{};
  out[0] = 0xAC;
  out[1] = seed;
  return out;
}

inline anchor::protocol::call_context make_context(
    const anchor::schema::address_t& caller,
    const anchor::schema::timestamp_seconds_t timestamp = 1'000,
    const uint64_t block_height = 1) {
  return anchor::protocol::call_context{
      .caller = caller, .timestamp = timestamp, .block_height = block_height};
}

inline const anchor::schema::transaction_event_t* find_event(
    const anchor::schema::transaction_result_t& result,
    const std::string_view type) {
  auto it = std::find_if(
      std::begin(result.events), std::end(result.events),
      [&](const anchor::schema::transaction_event_t& event) {
        return event.type == type;
      });
  return it == std::end(result.events) ? nullptr : &*it;
}

inline bool has_event(const anchor::schema::transaction_result_t& result,
                      const std::string_view type) {
  return find_event(result, type) != nullptr;
}

inline std::optional<std::string> event_attribute(
    const anchor::schema::transaction_result_t& result,
    const std::string_view type,
    const std::string_view key) {
  const auto* event = find_event(result, type);
  if (event == nullptr) {
    return std::nullopt;
  }
  for (const auto& attribute : event->attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace anchor::testing
