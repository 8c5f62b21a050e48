#include <anchor/protocol/result.hpp>
#include <algorithm>
#include <iterator>
#include <set>

namespace anchor::protocol {

anchor::schema::transaction_result_t make_error(
    const anchor::schema::transaction_error_code code,
    const std::string_view codespace,
    const std::string_view log,
    std::string info) {
  auto result = anchor::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

anchor::schema::transaction_event_t make_event(
    const std::string_view type,
    const event_attributes_t attributes) {
  auto event = anchor::schema::transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(anchor::schema::transaction_event_attribute_t{
        .key = std::string{key}, .value = value, .index = true});
  }
  return event;
}

void append_event(anchor::schema::transaction_result_t& result,
                  const std::string_view type,
                  const event_attributes_t attributes) {
  result.events.push_back(make_event(type, attributes));
}

void append_events(
    anchor::schema::transaction_result_t& result,
    const std::vector<anchor::schema::transaction_event_t>& events) {
  result.events.insert(std::end(result.events), std::begin(events),
                       std::end(events));
}

std::string to_string(const anchor::schema::amount_t& amount) {
  return amount.str();
}

std::string to_string(const anchor::schema::hash32_t& hash) {
  return anchor::schema::to_hex(anchor::schema::bytes_view_t{hash});
}

std::string to_string(const anchor::schema::address_t& address) {
  return anchor::schema::to_hex(anchor::schema::bytes_view_t{address});
}

std::string to_string(const std::vector<anchor::schema::chain_id_t>& chains) {
  auto out = std::string{};
  for (const auto chain : chains) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(chain);
  }
  return out;
}

bool valid_target_chains(
    const std::vector<anchor::schema::chain_id_t>& chain_ids) {
  auto seen = std::set<anchor::schema::chain_id_t>{};
  for (const auto chain_id : chain_ids) {
    if (chain_id == 0 || !seen.insert(chain_id).second) {
      return false;
    }
  }
  return true;
}

bool contains_chain(const std::vector<anchor::schema::chain_id_t>& chain_ids,
                    const anchor::schema::chain_id_t chain_id) {
  return std::find(std::begin(chain_ids), std::end(chain_ids), chain_id) !=
         std::end(chain_ids);
}

}  // namespace anchor::protocol
