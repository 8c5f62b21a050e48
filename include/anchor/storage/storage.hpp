#pragma once
#include <anchor/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace anchor::storage {

using key_value_entry_t =
    std::pair<anchor::schema::bytes_t, anchor::schema::bytes_t>;

/// Height and state root of the last block the engine committed.
struct committed_state final {
  int64_t height{};
  anchor::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing. A value
  /// that is present but does not decode as T stops the node.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const anchor::schema::bytes_view_t& key);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs under prefix in key order. Used to reload
  /// sender nonces and transaction history.
  std::vector<key_value_entry_t> list_by_prefix(
      const anchor::schema::bytes_view_t& prefix) const;

  /// Atomically write a set of raw entries. Commit stages unit state, dirty
  /// nonces and the block's history rows through one batch.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace anchor::storage
