#include <spdlog/spdlog.h>
#include <syndicate/common/critical.hpp>
#include <syndicate/ledger/ledger.hpp>

#include <iterator>

using namespace syndicate::schema;

namespace syndicate::ledger {

ledger_error_t ledger::mint(const identity_t& owner, const amount_t& amount) {
  if (is_null(owner)) {
    return scheme_error_code::invalid_recipient;
  }
  if (amount > unlimited_amount() - total_supply_) {
    return scheme_error_code::amount_overflow;
  }
  if (amount > 0) {
    total_supply_ += amount;
    balances_[owner] += amount;
    enroll(owner);
  }
  pending_events_.emplace_back(
      transfer_event_t{.from = null_identity(), .to = owner, .amount = amount});
  return std::nullopt;
}

ledger_error_t ledger::burn(const identity_t& owner, const amount_t& amount) {
  auto found = balances_.find(owner);
  const auto held = found == std::end(balances_) ? amount_t{0} : found->second;
  if (held < amount) {
    return scheme_error_code::insufficient_balance;
  }
  if (found != std::end(balances_)) {
    found->second -= amount;
    if (found->second == 0) {
      balances_.erase(found);
    }
  }
  total_supply_ -= amount;
  pending_events_.emplace_back(
      transfer_event_t{.from = owner, .to = null_identity(), .amount = amount});
  return std::nullopt;
}

ledger_error_t ledger::transfer(const identity_t& from,
                                const identity_t& to,
                                const amount_t& amount) {
  if (auto error = check_movement(from, to, amount)) {
    return error;
  }
  move(from, to, amount);
  return std::nullopt;
}

ledger_error_t ledger::transfer_from(const identity_t& spender,
                                     const identity_t& from,
                                     const identity_t& to,
                                     const amount_t& amount) {
  if (is_null(to)) {
    return scheme_error_code::invalid_recipient;
  }
  if (from == to) {
    return scheme_error_code::self_transfer;
  }
  auto granted = allowances_.find(allowance_key_t{from, spender});
  if (granted == std::end(allowances_) || granted->second < amount) {
    return scheme_error_code::insufficient_allowance;
  }
  if (auto error = check_movement(from, to, amount)) {
    return error;
  }
  if (granted->second != unlimited_amount()) {
    granted->second -= amount;
    if (granted->second == 0) {
      allowances_.erase(granted);
    }
  }
  move(from, to, amount);
  return std::nullopt;
}

ledger_error_t ledger::approve(const identity_t& owner,
                               const identity_t& spender,
                               const amount_t& amount) {
  if (is_null(spender)) {
    return scheme_error_code::invalid_recipient;
  }
  if (amount == 0) {
    allowances_.erase(allowance_key_t{owner, spender});
  } else {
    allowances_[allowance_key_t{owner, spender}] = amount;
  }
  pending_events_.emplace_back(
      approval_event_t{.owner = owner, .spender = spender, .amount = amount});
  return std::nullopt;
}

const amount_t& ledger::total_supply() const {
  return total_supply_;
}

amount_t ledger::balance_of(const identity_t& owner) const {
  auto found = balances_.find(owner);
  if (found == std::end(balances_)) {
    return 0;
  }
  return found->second;
}

amount_t ledger::allowance(const identity_t& owner,
                           const identity_t& spender) const {
  auto found = allowances_.find(allowance_key_t{owner, spender});
  if (found == std::end(allowances_)) {
    return 0;
  }
  return found->second;
}

const std::vector<identity_t>& ledger::participants() const {
  return participants_;
}

std::vector<scheme_event_payload_t> ledger::take_events() {
  auto drained = std::vector<scheme_event_payload_t>{};
  drained.swap(pending_events_);
  return drained;
}

ledger_record_t ledger::record() const {
  return ledger_record_t{.total_supply = total_supply_,
                         .participants = participants_};
}

const balance_map_t& ledger::balances() const {
  return balances_;
}

const allowance_map_t& ledger::allowances() const {
  return allowances_;
}

ledger ledger::restore(const ledger_record_t& record,
                       balance_map_t balances,
                       allowance_map_t allowances) {
  auto restored = ledger{};
  restored.total_supply_ = record.total_supply;
  restored.balances_ = std::move(balances);
  restored.allowances_ = std::move(allowances);
  for (const auto& participant : record.participants) {
    restored.enroll(participant);
  }

  auto sum = amount_t{0};
  for (const auto& [owner, amount] : restored.balances_) {
    sum += amount;
  }
  if (sum != restored.total_supply_) {
    spdlog::error("Restored ledger total {} disagrees with balance sum {}",
                  to_string(restored.total_supply_), to_string(sum));
    syndicate::common::critical("persisted ledger is inconsistent");
  }
  return restored;
}

ledger_error_t ledger::check_movement(const identity_t& from,
                                      const identity_t& to,
                                      const amount_t& amount) const {
  if (is_null(to)) {
    return scheme_error_code::invalid_recipient;
  }
  if (from == to) {
    return scheme_error_code::self_transfer;
  }
  if (balance_of(from) < amount) {
    return scheme_error_code::insufficient_balance;
  }
  return std::nullopt;
}

void ledger::move(const identity_t& from,
                  const identity_t& to,
                  const amount_t& amount) {
  if (amount > 0) {
    auto source = balances_.find(from);
    source->second -= amount;
    if (source->second == 0) {
      balances_.erase(source);
    }
    balances_[to] += amount;
    enroll(to);
  }
  pending_events_.emplace_back(
      transfer_event_t{.from = from, .to = to, .amount = amount});
}

void ledger::enroll(const identity_t& owner) {
  if (enrolled_.insert(owner).second) {
    participants_.push_back(owner);
  }
}

}  // namespace syndicate::ledger
