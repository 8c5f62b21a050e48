#pragma once
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/verification_record.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Schema type: registry ledger.
// Protocol workflow: Everything the registry learns about a qHash: the
// record, its requested targets, per-chain confirmations and the voucher id
// (hub issued or locally derived fallback).
namespace anchor::schema {

template <uint16_t Version>
struct registry_ledger;

template <>
struct registry_ledger<1> final {
  uint16_t version{1};
  std::map<hash32_t, verification_record_t> records;
  std::map<hash32_t, std::vector<chain_id_t>> targets;
  std::map<std::pair<hash32_t, chain_id_t>, bool> confirmations;
  std::map<hash32_t, hash32_t> vouchers;
  // qHash -> reason the hub could not issue the voucher.
  std::map<hash32_t, std::string> fallback_vouchers;
  std::map<address_t, uint64_t> nonces;
  uint64_t verification_count{};
};

using registry_ledger_t = registry_ledger<1>;

}  // namespace anchor::schema
