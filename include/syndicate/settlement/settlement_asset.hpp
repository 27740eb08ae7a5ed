#pragma once

#include <syndicate/schema/primitives.hpp>

namespace syndicate::settlement {

/// Fungible-asset ledger used by a scheme as its custody and payment rail.
///
/// Transfers report failure by returning false and must then leave balances
/// untouched. The save-point calls let the host bracket a whole scheme
/// operation: everything after `set_save_point` is undone by
/// `rollback_to_save_point` and kept by `release_save_point`.
class settlement_asset {
 public:
  virtual ~settlement_asset() = default;

  /// Move `amount` held by `from` to `to`; `from` is the caller.
  virtual bool transfer(const syndicate::schema::identity_t& from,
                        const syndicate::schema::identity_t& to,
                        const syndicate::schema::amount_t& amount) = 0;

  /// Move `amount` from `from` to `to` on behalf of `spender`, consuming the
  /// allowance `from` granted to `spender`.
  virtual bool transfer_from(const syndicate::schema::identity_t& spender,
                             const syndicate::schema::identity_t& from,
                             const syndicate::schema::identity_t& to,
                             const syndicate::schema::amount_t& amount) = 0;

  virtual syndicate::schema::amount_t balance_of(
      const syndicate::schema::identity_t& owner) const = 0;

  virtual void set_save_point() = 0;
  virtual void rollback_to_save_point() = 0;
  virtual void release_save_point() = 0;
};

}  // namespace syndicate::settlement
