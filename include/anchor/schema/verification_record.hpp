#pragma once
#include <anchor/schema/primitives.hpp>
#include <string>

// Schema type: verification record.
// Protocol workflow: Immutable audit entry keyed by qHash: which wallet was
// verified, when, under which proof and verification type.
namespace anchor::schema {

template <uint16_t Version>
struct verification_record;

template <>
struct verification_record<1> final {
  uint16_t version{1};
  address_t verifier{};
  bool verified{};
  timestamp_seconds_t verified_at{};
  uint64_t block_height{};
  std::string proof_id;
  std::string verification_type;
  // Value of the wallet's nonce consumed by this verification.
  uint64_t nonce{};
};

using verification_record_t = verification_record<1>;

}  // namespace anchor::schema
