#pragma once

#include <syndicate/settlement/settlement_asset.hpp>

#include <map>
#include <utility>
#include <vector>

namespace syndicate::settlement {

/// In-process settlement ledger with nested save points.
///
/// Serves as the reference rail for embedding and tests. Allowances follow the
/// usual fungible-token rules, including the never-decremented unlimited
/// sentinel.
class memory_settlement_asset : public settlement_asset {
 public:
  bool transfer(const syndicate::schema::identity_t& from,
                const syndicate::schema::identity_t& to,
                const syndicate::schema::amount_t& amount) override;

  bool transfer_from(const syndicate::schema::identity_t& spender,
                     const syndicate::schema::identity_t& from,
                     const syndicate::schema::identity_t& to,
                     const syndicate::schema::amount_t& amount) override;

  syndicate::schema::amount_t balance_of(
      const syndicate::schema::identity_t& owner) const override;

  void set_save_point() override;
  void rollback_to_save_point() override;
  void release_save_point() override;

  /// Create new units out of thin air for `owner`.
  void issue(const syndicate::schema::identity_t& owner,
             const syndicate::schema::amount_t& amount);

  void approve(const syndicate::schema::identity_t& owner,
               const syndicate::schema::identity_t& spender,
               const syndicate::schema::amount_t& amount);

  syndicate::schema::amount_t allowance(
      const syndicate::schema::identity_t& owner,
      const syndicate::schema::identity_t& spender) const;

  syndicate::schema::amount_t total_issued() const;

  std::size_t save_point_depth() const { return save_points_.size(); }

 private:
  using allowance_key_t = std::pair<syndicate::schema::identity_t,
                                    syndicate::schema::identity_t>;

  struct book final {
    std::map<syndicate::schema::identity_t, syndicate::schema::amount_t>
        balances;
    std::map<allowance_key_t, syndicate::schema::amount_t> allowances;
    syndicate::schema::amount_t issued{};
  };

  bool move(const syndicate::schema::identity_t& from,
            const syndicate::schema::identity_t& to,
            const syndicate::schema::amount_t& amount);

  book book_;
  std::vector<book> save_points_;
};

}  // namespace syndicate::settlement
