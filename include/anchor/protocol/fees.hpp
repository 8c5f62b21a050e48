#pragma once
#include <anchor/schema/fee_schedule.hpp>
#include <anchor/schema/fee_split.hpp>
#include <anchor/schema/primitives.hpp>
#include <cstddef>
#include <optional>

namespace anchor::protocol {

struct fee_shares final {
  anchor::schema::amount_t treasury{};
  anchor::schema::amount_t burn{};
};

/// verification_fee + cross_chain_fee * chain_count, or std::nullopt when the
/// result does not fit in 256 bits.
std::optional<anchor::schema::amount_t> total_fee(
    const anchor::schema::fee_schedule_t& fees,
    std::size_t chain_count);

/// treasury = floor(fee * bps / 10000), burn = fee - treasury.
/// bps must be at most kBasisPointsDenominator.
fee_shares split_fee(const anchor::schema::amount_t& fee, uint16_t treasury_bps);

/// Configured burn wallet, or kDeadAddress when none is set.
anchor::schema::address_t burn_destination(
    const anchor::schema::fee_split_t& split);

}  // namespace anchor::protocol
