#include <spdlog/spdlog.h>
#include <syndicate/execution/refund.hpp>

using namespace syndicate::schema;

namespace syndicate::execution::refund {

namespace {

refund_result fail(const scheme_error_code code, const std::string_view reason) {
  auto result = refund_result{};
  result.error = code;
  result.reason = reason;
  return result;
}

}  // namespace

amount_t pro_rata_share(const amount_t& pool,
                        const amount_t& balance,
                        const amount_t& total) {
  if (total == 0) {
    return 0;
  }
  const auto product = wide_amount_t{pool} * wide_amount_t{balance};
  return static_cast<amount_t>(product / wide_amount_t{total});
}

refund_result refund_contributions(
    syndicate::ledger::ledger& ledger,
    syndicate::settlement::settlement_asset& settlement,
    const identity_t& custody) {
  auto result = refund_result{};
  if (ledger.participants().empty() || ledger.total_supply() == 0) {
    spdlog::info("No contributions to refund");
    return result;
  }
  if (settlement.balance_of(custody) < ledger.total_supply()) {
    return fail(scheme_error_code::custody_shortfall,
                "custody holds less than the contribution total");
  }

  const auto participants = ledger.participants();
  for (const auto& participant : participants) {
    const auto balance = ledger.balance_of(participant);
    if (balance == 0) {
      continue;
    }
    if (auto error = ledger.burn(participant, balance)) {
      return fail(*error, "failed to burn contribution");
    }
    if (!settlement.transfer(custody, participant, balance)) {
      return fail(scheme_error_code::settlement_transfer_failed,
                  "settlement transfer of contribution refund failed");
    }
    result.paid_out += balance;
    ++result.recipients;
  }
  spdlog::info("Refunded {} contribution units to {} participant(s)",
               to_string(result.paid_out), result.recipients);
  return result;
}

refund_result distribute_proceeds(
    syndicate::ledger::ledger& ledger,
    syndicate::settlement::settlement_asset& settlement,
    const identity_t& custody,
    const amount_t& sold_price) {
  auto result = refund_result{};
  const auto total_at_entry = ledger.total_supply();
  if (sold_price == 0 || ledger.participants().empty() ||
      total_at_entry == 0) {
    spdlog::info("Nothing to distribute: sold price {} over supply {}",
                 to_string(sold_price), to_string(total_at_entry));
    return result;
  }
  if (settlement.balance_of(custody) < sold_price) {
    return fail(scheme_error_code::custody_shortfall,
                "custody holds less than the sale proceeds");
  }

  auto largest_holder = std::optional<identity_t>{};
  auto largest_balance = amount_t{0};
  const auto participants = ledger.participants();
  for (const auto& participant : participants) {
    const auto balance = ledger.balance_of(participant);
    if (balance == 0) {
      continue;
    }
    if (balance > largest_balance) {
      largest_balance = balance;
      largest_holder = participant;
    }
    const auto share = pro_rata_share(sold_price, balance, total_at_entry);
    if (auto error = ledger.burn(participant, balance)) {
      return fail(*error, "failed to burn shares");
    }
    if (share > 0 && !settlement.transfer(custody, participant, share)) {
      return fail(scheme_error_code::settlement_transfer_failed,
                  "settlement transfer of sale proceeds failed");
    }
    result.paid_out += share;
    ++result.recipients;
  }

  result.remainder = settlement.balance_of(custody);
  if (result.remainder > 0 && largest_holder) {
    if (!settlement.transfer(custody, *largest_holder, result.remainder)) {
      return fail(scheme_error_code::settlement_transfer_failed,
                  "settlement transfer of distribution remainder failed");
    }
    result.remainder_recipient = largest_holder;
    result.paid_out += result.remainder;
  }
  spdlog::info(
      "Distributed {} of sale proceeds to {} holder(s), remainder {} to "
      "largest holder",
      to_string(result.paid_out), result.recipients,
      to_string(result.remainder));
  return result;
}

}  // namespace syndicate::execution::refund
