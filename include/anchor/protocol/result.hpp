#pragma once
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/transaction_error_code.hpp>
#include <anchor/schema/transaction_event.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace anchor::protocol {

inline constexpr std::string_view kRegistryCodespace{"anchor.registry"};
inline constexpr std::string_view kHubCodespace{"anchor.hub"};
inline constexpr std::string_view kSpokeCodespace{"anchor.spoke"};
inline constexpr std::string_view kTokenCodespace{"anchor.token"};
inline constexpr std::string_view kEngineCodespace{"anchor.engine"};

using event_attributes_t =
    std::initializer_list<std::pair<std::string_view, std::string>>;

/// Rejection result. `info` names the offending identifier.
anchor::schema::transaction_result_t make_error(
    anchor::schema::transaction_error_code code,
    std::string_view codespace,
    std::string_view log,
    std::string info = {});

anchor::schema::transaction_event_t make_event(std::string_view type,
                                               event_attributes_t attributes);

void append_event(anchor::schema::transaction_result_t& result,
                  std::string_view type,
                  event_attributes_t attributes);

void append_events(anchor::schema::transaction_result_t& result,
                   const std::vector<anchor::schema::transaction_event_t>&
                       events);

inline bool succeeded(const anchor::schema::transaction_result_t& result) {
  return result.code == 0;
}

inline bool has_error(const anchor::schema::transaction_result_t& result,
                      anchor::schema::transaction_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

std::string to_string(const anchor::schema::amount_t& amount);
std::string to_string(const anchor::schema::hash32_t& hash);
std::string to_string(const anchor::schema::address_t& address);
std::string to_string(const std::vector<anchor::schema::chain_id_t>& chains);

/// Shared validation for target chain lists: no zero ids and no duplicates.
bool valid_target_chains(
    const std::vector<anchor::schema::chain_id_t>& chain_ids);

bool contains_chain(const std::vector<anchor::schema::chain_id_t>& chain_ids,
                    anchor::schema::chain_id_t chain_id);

}  // namespace anchor::protocol
