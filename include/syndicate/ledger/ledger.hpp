#pragma once

#include <syndicate/schema/ledger_record.hpp>
#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_error_code.hpp>
#include <syndicate/schema/scheme_event.hpp>

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace syndicate::ledger {

/// std::nullopt on success, otherwise the reason nothing changed.
using ledger_error_t = std::optional<syndicate::schema::scheme_error_code>;

using allowance_key_t =
    std::pair<syndicate::schema::identity_t, syndicate::schema::identity_t>;
using balance_map_t =
    std::map<syndicate::schema::identity_t, syndicate::schema::amount_t>;
using allowance_map_t = std::map<allowance_key_t, syndicate::schema::amount_t>;

/// Fungible balance and allowance book shared by the contribution and share
/// roles of a scheme.
///
/// `total_supply()` always equals the sum of all balances. Every identity that
/// ever held a nonzero balance is listed once in `participants()`, in the
/// order it first received funds. Each successful mutation queues a
/// notification that the owner drains with `take_events()`. A failed call
/// leaves the ledger exactly as it was.
class ledger final {
 public:
  ledger_error_t mint(const syndicate::schema::identity_t& owner,
                      const syndicate::schema::amount_t& amount);

  ledger_error_t burn(const syndicate::schema::identity_t& owner,
                      const syndicate::schema::amount_t& amount);

  ledger_error_t transfer(const syndicate::schema::identity_t& from,
                          const syndicate::schema::identity_t& to,
                          const syndicate::schema::amount_t& amount);

  /// Spend `from`'s allowance to `spender`. The unlimited sentinel is never
  /// decremented.
  ledger_error_t transfer_from(const syndicate::schema::identity_t& spender,
                               const syndicate::schema::identity_t& from,
                               const syndicate::schema::identity_t& to,
                               const syndicate::schema::amount_t& amount);

  /// Set, not add to, the allowance of `spender` over `owner`'s balance.
  ledger_error_t approve(const syndicate::schema::identity_t& owner,
                         const syndicate::schema::identity_t& spender,
                         const syndicate::schema::amount_t& amount);

  const syndicate::schema::amount_t& total_supply() const;
  syndicate::schema::amount_t balance_of(
      const syndicate::schema::identity_t& owner) const;
  syndicate::schema::amount_t allowance(
      const syndicate::schema::identity_t& owner,
      const syndicate::schema::identity_t& spender) const;
  const std::vector<syndicate::schema::identity_t>& participants() const;

  std::vector<syndicate::schema::scheme_event_payload_t> take_events();

  syndicate::schema::ledger_record_t record() const;
  const balance_map_t& balances() const;
  const allowance_map_t& allowances() const;

  /// Rebuild a ledger from persisted rows.
  static ledger restore(const syndicate::schema::ledger_record_t& record,
                        balance_map_t balances,
                        allowance_map_t allowances);

 private:
  ledger_error_t check_movement(const syndicate::schema::identity_t& from,
                                const syndicate::schema::identity_t& to,
                                const syndicate::schema::amount_t& amount)
      const;
  void move(const syndicate::schema::identity_t& from,
            const syndicate::schema::identity_t& to,
            const syndicate::schema::amount_t& amount);
  void enroll(const syndicate::schema::identity_t& owner);

  syndicate::schema::amount_t total_supply_{};
  balance_map_t balances_;
  allowance_map_t allowances_;
  std::vector<syndicate::schema::identity_t> participants_;
  std::set<syndicate::schema::identity_t> enrolled_;
  std::vector<syndicate::schema::scheme_event_payload_t> pending_events_;
};

}  // namespace syndicate::ledger
