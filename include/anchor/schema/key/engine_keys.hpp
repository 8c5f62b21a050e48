#pragma once

#include <anchor/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

// Schema key type: engine keys.
// Protocol workflow: Canonical key prefixes for unit state blobs, sender
// nonces and transaction history.
namespace anchor::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRegistryKeyPrefix{"SYS|STATE|REGISTRY|"};
inline constexpr std::string_view kHubKeyPrefix{"SYS|STATE|HUB|"};
inline constexpr std::string_view kSpokeKeyPrefix{"SYS|STATE|SPOKE|"};
inline constexpr std::string_view kTokenKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

inline const std::array<std::string_view, 7> kEngineKeyspaces{
    kStatePrefix,   kNonceKeyPrefix, kRegistryKeyPrefix, kHubKeyPrefix,
    kSpokeKeyPrefix, kTokenKeyPrefix, kHistoryPrefix};

template <typename Encoder, typename T>
anchor::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
anchor::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

// Unit state blobs are keyed by the unit's own address so one database can
// hold several deployments.
template <typename Encoder>
anchor::schema::bytes_t make_registry_key(
    Encoder& encoder,
    const anchor::schema::address_t& self) {
  return make_prefixed_key(encoder, kRegistryKeyPrefix, self);
}

template <typename Encoder>
anchor::schema::bytes_t make_hub_key(Encoder& encoder,
                                     const anchor::schema::address_t& self) {
  return make_prefixed_key(encoder, kHubKeyPrefix, self);
}

template <typename Encoder>
anchor::schema::bytes_t make_spoke_key(Encoder& encoder,
                                       const anchor::schema::address_t& self) {
  return make_prefixed_key(encoder, kSpokeKeyPrefix, self);
}

template <typename Encoder>
anchor::schema::bytes_t make_token_key(Encoder& encoder,
                                       const anchor::schema::address_t& self) {
  return make_prefixed_key(encoder, kTokenKeyPrefix, self);
}

template <typename Encoder>
anchor::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const anchor::schema::address_t& sender) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, sender);
}

template <typename Encoder>
anchor::schema::bytes_t make_history_key(Encoder& encoder,
                                         uint64_t height,
                                         uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

template <typename Encoder>
std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    Encoder& encoder,
    const anchor::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, std::tuple<uint64_t, uint32_t>>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kHistoryPrefix) {
    return std::nullopt;
  }
  return std::pair<uint64_t, uint32_t>{
      std::get<0>(std::get<1>(decoded.value())),
      std::get<1>(std::get<1>(decoded.value()))};
}

}  // namespace anchor::schema::key
