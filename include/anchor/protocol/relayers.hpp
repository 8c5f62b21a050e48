#pragma once
#include <anchor/schema/primitives.hpp>
#include <anchor/schema/relayer_set.hpp>
#include <anchor/schema/set_relayer.hpp>
#include <anchor/schema/transaction_result.hpp>
#include <string_view>

// Bounded relayer allow-list shared by registry, hub and spoke. The relayer
// and trusted relayer roles are granted and revoked together.
namespace anchor::protocol {

bool is_relayer(const anchor::schema::relayer_set_t& set,
                const anchor::schema::address_t& account);

bool is_trusted_relayer(const anchor::schema::relayer_set_t& set,
                        const anchor::schema::address_t& account);

/// Seed the set at genesis. Duplicates and zero addresses are ignored and the
/// set is capped at kMaxRelayers.
void seed_relayer(anchor::schema::relayer_set_t& set,
                  const anchor::schema::address_t& account);

/// Add or remove a relayer. Caller authorization is the unit's concern.
anchor::schema::transaction_result_t apply_set_relayer(
    anchor::schema::relayer_set_t& set,
    const anchor::schema::set_relayer_t& operation,
    std::string_view codespace);

}  // namespace anchor::protocol
