#pragma once

#include <syndicate/ledger/ledger.hpp>
#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_error_code.hpp>
#include <syndicate/settlement/settlement_asset.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

// Closing distributions. Both passes burn a participant's ledger balance
// before paying that participant, and stop at the first failure; the caller
// owns rollback of the ledger copy and the settlement save point.
namespace syndicate::execution::refund {

struct refund_result final {
  std::optional<syndicate::schema::scheme_error_code> error;
  std::string_view reason;
  syndicate::schema::amount_t paid_out{};
  std::size_t recipients{};
  syndicate::schema::amount_t remainder{};
  std::optional<syndicate::schema::identity_t> remainder_recipient;
};

/// floor(pool * balance / total) with a 512-bit intermediate; zero when
/// `total` is zero.
syndicate::schema::amount_t pro_rata_share(
    const syndicate::schema::amount_t& pool,
    const syndicate::schema::amount_t& balance,
    const syndicate::schema::amount_t& total);

/// Return every contribution 1:1 from custody.
refund_result refund_contributions(
    syndicate::ledger::ledger& ledger,
    syndicate::settlement::settlement_asset& settlement,
    const syndicate::schema::identity_t& custody);

/// Split `sold_price` pro-rata over the share ledger; rounding dust and any
/// other custody residue goes to the largest holder.
refund_result distribute_proceeds(
    syndicate::ledger::ledger& ledger,
    syndicate::settlement::settlement_asset& settlement,
    const syndicate::schema::identity_t& custody,
    const syndicate::schema::amount_t& sold_price);

}  // namespace syndicate::execution::refund
