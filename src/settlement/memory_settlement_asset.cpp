#include <spdlog/spdlog.h>
#include <syndicate/common/critical.hpp>
#include <syndicate/settlement/memory_settlement_asset.hpp>

using namespace syndicate::schema;

namespace syndicate::settlement {

bool memory_settlement_asset::transfer(const identity_t& from,
                                       const identity_t& to,
                                       const amount_t& amount) {
  return move(from, to, amount);
}

bool memory_settlement_asset::transfer_from(const identity_t& spender,
                                            const identity_t& from,
                                            const identity_t& to,
                                            const amount_t& amount) {
  auto found = book_.allowances.find(allowance_key_t{from, spender});
  if (found == std::end(book_.allowances) || found->second < amount) {
    spdlog::debug("Settlement transfer_from rejected: allowance below {}",
                  to_string(amount));
    return false;
  }
  if (!move(from, to, amount)) {
    return false;
  }
  if (found->second != unlimited_amount()) {
    found->second -= amount;
  }
  return true;
}

amount_t memory_settlement_asset::balance_of(const identity_t& owner) const {
  auto found = book_.balances.find(owner);
  if (found == std::end(book_.balances)) {
    return 0;
  }
  return found->second;
}

void memory_settlement_asset::set_save_point() {
  save_points_.push_back(book_);
}

void memory_settlement_asset::rollback_to_save_point() {
  if (save_points_.empty()) {
    syndicate::common::critical("rollback without an active save point");
  }
  book_ = std::move(save_points_.back());
  save_points_.pop_back();
}

void memory_settlement_asset::release_save_point() {
  if (save_points_.empty()) {
    syndicate::common::critical("release without an active save point");
  }
  save_points_.pop_back();
}

void memory_settlement_asset::issue(const identity_t& owner,
                                    const amount_t& amount) {
  book_.balances[owner] += amount;
  book_.issued += amount;
}

void memory_settlement_asset::approve(const identity_t& owner,
                                      const identity_t& spender,
                                      const amount_t& amount) {
  book_.allowances[allowance_key_t{owner, spender}] = amount;
}

amount_t memory_settlement_asset::allowance(const identity_t& owner,
                                            const identity_t& spender) const {
  auto found = book_.allowances.find(allowance_key_t{owner, spender});
  if (found == std::end(book_.allowances)) {
    return 0;
  }
  return found->second;
}

amount_t memory_settlement_asset::total_issued() const {
  return book_.issued;
}

bool memory_settlement_asset::move(const identity_t& from,
                                   const identity_t& to,
                                   const amount_t& amount) {
  if (is_null(to)) {
    return false;
  }
  auto& source = book_.balances[from];
  if (source < amount) {
    return false;
  }
  source -= amount;
  book_.balances[to] += amount;
  return true;
}

}  // namespace syndicate::settlement
