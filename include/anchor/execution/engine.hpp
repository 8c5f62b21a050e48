#pragma once

#include <anchor/execution/genesis.hpp>
#include <anchor/protocol/token_ledger.hpp>
#include <anchor/protocol/verification_registry.hpp>
#include <anchor/protocol/voucher_hub.hpp>
#include <anchor/protocol/voucher_spoke.hpp>
#include <anchor/schema/app_info.hpp>
#include <anchor/schema/block_result.hpp>
#include <anchor/schema/commit_result.hpp>
#include <anchor/schema/encoding/scale/encoder.hpp>
#include <anchor/schema/history_entry.hpp>
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/query_result.hpp>
#include <anchor/schema/transaction.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <anchor/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace anchor::execution {

/// Deterministic attestation state machine for one chain.
///
/// The engine decodes transactions, dispatches each payload to the unit named
/// by the envelope's `to` address, persists unit state and history at commit,
/// and answers read queries by route. Every public call is serialized.
class engine final {
 public:
  using encoder_t = anchor::schema::encoding::encoder<
      anchor::schema::encoding::scale_encoder_tag>;
  using storage_t =
      anchor::storage::storage<anchor::storage::rocksdb_storage_tag>;

  /// Resume from the last committed state in storage, or start from genesis
  /// when the database is empty.
  engine(encoder_t& encoder, storage_t& storage, genesis_config genesis);

  /// Admission check: decode, version, chain id and sender nonce. Does not
  /// mutate state.
  anchor::schema::transaction_result_t check_transaction(
      const anchor::schema::bytes_view_t& raw_tx);

  /// Execute a block in order and compute its candidate state root.
  ///
  /// Per-transaction results are returned even on failures.
  anchor::schema::block_result_t finalize_block(
      uint64_t height,
      anchor::schema::timestamp_seconds_t block_time,
      const std::vector<anchor::schema::bytes_t>& txs);

  /// Persist the finalized block: unit state, sender nonces, history and the
  /// committed height/state root.
  anchor::schema::commit_result_t commit();

  anchor::schema::app_info_t info() const;

  /// Execute a deterministic read-path query by route.
  anchor::schema::query_result_t query(std::string_view path,
                                       const anchor::schema::bytes_view_t& data);

  /// Return committed history entries in the inclusive height range.
  std::vector<anchor::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  chain_role_t role() const;

 private:
  anchor::schema::transaction_result_t validate_transaction(
      const anchor::schema::transaction_t& tx,
      std::string_view codespace) const;

  anchor::schema::transaction_result_t execute_operation(
      const anchor::schema::transaction_t& tx,
      const anchor::protocol::call_context& context);
  anchor::schema::transaction_result_t execute_registry_operation(
      const anchor::schema::transaction_t& tx,
      const anchor::protocol::call_context& context);
  anchor::schema::transaction_result_t execute_hub_operation(
      const anchor::schema::transaction_t& tx,
      const anchor::protocol::call_context& context);
  anchor::schema::transaction_result_t execute_token_operation(
      const anchor::schema::transaction_t& tx,
      const anchor::protocol::call_context& context);
  anchor::schema::transaction_result_t execute_spoke_operation(
      const anchor::schema::transaction_t& tx,
      const anchor::protocol::call_context& context);

  anchor::schema::query_result_t query_hub_chain(
      std::string_view path,
      const anchor::schema::bytes_view_t& data,
      anchor::schema::query_result_t result);
  anchor::schema::query_result_t query_spoke_chain(
      std::string_view path,
      const anchor::schema::bytes_view_t& data,
      anchor::schema::query_result_t result);

  anchor::schema::app_info_t make_info() const;
  std::vector<anchor::schema::history_entry_t> load_history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Build units from genesis or from persisted blobs.
  void load_persisted_state();
  void install_units(anchor::schema::registry_state_t registry,
                     anchor::schema::hub_state_t hub,
                     anchor::schema::token_state_t token);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  genesis_config genesis_;

  std::unique_ptr<anchor::protocol::token_ledger> token_;
  std::unique_ptr<anchor::protocol::verification_registry> registry_;
  std::unique_ptr<anchor::protocol::voucher_hub> hub_;
  std::unique_ptr<anchor::protocol::voucher_spoke> spoke_;

  std::map<anchor::schema::address_t, uint64_t> nonces_;
  std::map<anchor::schema::address_t, uint64_t> dirty_nonces_;
  std::vector<anchor::schema::history_entry_t> pending_history_;

  int64_t last_committed_height_{};
  anchor::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  anchor::schema::hash32_t pending_state_root_{};
};

}  // namespace anchor::execution
