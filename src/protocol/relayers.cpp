#include <spdlog/spdlog.h>
#include <anchor/protocol/relayers.hpp>
#include <anchor/protocol/result.hpp>

using namespace anchor::schema;

namespace anchor::protocol {

namespace {

bool lookup(const std::map<address_t, bool>& members,
            const address_t& account) {
  auto it = members.find(account);
  return it != std::end(members) && it->second;
}

}  // namespace

bool is_relayer(const relayer_set_t& set, const address_t& account) {
  return lookup(set.relayers, account);
}

bool is_trusted_relayer(const relayer_set_t& set, const address_t& account) {
  return lookup(set.trusted_relayers, account);
}

void seed_relayer(relayer_set_t& set, const address_t& account) {
  if (is_zero(account) || is_relayer(set, account) ||
      set.count >= kMaxRelayers) {
    return;
  }
  set.relayers[account] = true;
  set.trusted_relayers[account] = true;
  ++set.count;
}

transaction_result_t apply_set_relayer(relayer_set_t& set,
                                       const set_relayer_t& operation,
                                       const std::string_view codespace) {
  if (is_zero(operation.relayer)) {
    return make_error(transaction_error_code::invalid_address, codespace,
                      "relayer address is zero");
  }
  auto member = is_relayer(set, operation.relayer);
  if (operation.authorized) {
    if (member) {
      return make_error(transaction_error_code::relayer_exists, codespace,
                        "relayer already authorized",
                        to_string(operation.relayer));
    }
    if (set.count >= kMaxRelayers) {
      return make_error(transaction_error_code::relayer_limit_reached,
                        codespace, "relayer limit reached",
                        std::to_string(kMaxRelayers));
    }
    set.relayers[operation.relayer] = true;
    set.trusted_relayers[operation.relayer] = true;
    ++set.count;
  } else {
    if (!member) {
      return make_error(transaction_error_code::relayer_missing, codespace,
                        "relayer not authorized",
                        to_string(operation.relayer));
    }
    if (set.count <= kMinRelayers) {
      return make_error(transaction_error_code::last_relayer, codespace,
                        "cannot remove the last relayer",
                        to_string(operation.relayer));
    }
    set.relayers.erase(operation.relayer);
    set.trusted_relayers.erase(operation.relayer);
    --set.count;
  }

  spdlog::info("{}: relayer {} {}", codespace, to_string(operation.relayer),
               operation.authorized ? "authorized" : "revoked");
  auto result = transaction_result_t{};
  append_event(result, "relayer_updated",
               {{"relayer", to_string(operation.relayer)},
                {"authorized", operation.authorized ? "true" : "false"},
                {"relayer_count", std::to_string(set.count)}});
  return result;
}

}  // namespace anchor::protocol
