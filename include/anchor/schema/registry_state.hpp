#pragma once
#include <anchor/schema/credit_ledger.hpp>
#include <anchor/schema/registry_config.hpp>
#include <anchor/schema/registry_ledger.hpp>
#include <anchor/schema/relayer_set.hpp>
#include <anchor/schema/timelock_book.hpp>
#include <anchor/schema/verifier_directory.hpp>

// Schema type: registry state.
// Protocol workflow: Complete persisted state of the verification registry.
namespace anchor::schema {

template <uint16_t Version>
struct registry_state;

template <>
struct registry_state<1> final {
  uint16_t version{1};
  registry_config_t config{};
  relayer_set_t relayers{};
  registry_ledger_t ledger{};
  verifier_directory_t verifiers{};
  credit_ledger_t credits{};
  timelock_book_t timelock{};
};

using registry_state_t = registry_state<1>;

}  // namespace anchor::schema
