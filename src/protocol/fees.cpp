#include <anchor/protocol/fees.hpp>
#include <limits>

using namespace anchor::schema;

namespace anchor::protocol {

std::optional<amount_t> total_fee(const fee_schedule_t& fees,
                                  const std::size_t chain_count) {
  const auto kMax = std::numeric_limits<amount_t>::max();
  auto count = amount_t{chain_count};
  if (count != 0 && fees.cross_chain_fee > kMax / count) {
    return std::nullopt;
  }
  auto cross_chain = fees.cross_chain_fee * count;
  if (fees.verification_fee > kMax - cross_chain) {
    return std::nullopt;
  }
  return fees.verification_fee + cross_chain;
}

fee_shares split_fee(const amount_t& fee, const uint16_t treasury_bps) {
  // fee = q * D + r, so floor(fee * bps / D) = q * bps + floor(r * bps / D)
  // without forming the full product.
  const auto denominator = amount_t{kBasisPointsDenominator};
  auto quotient = fee / denominator;
  auto remainder = fee % denominator;
  auto treasury =
      quotient * treasury_bps + (remainder * treasury_bps) / denominator;
  return fee_shares{.treasury = treasury, .burn = fee - treasury};
}

address_t burn_destination(const fee_split_t& split) {
  if (split.burn_wallet.has_value() && !is_zero(*split.burn_wallet)) {
    return *split.burn_wallet;
  }
  return kDeadAddress;
}

}  // namespace anchor::protocol
