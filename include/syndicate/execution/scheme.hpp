#pragma once

#include <syndicate/execution/guards.hpp>
#include <syndicate/execution/time_source.hpp>
#include <syndicate/gateway/order_gateway.hpp>
#include <syndicate/ledger/ledger.hpp>
#include <syndicate/schema/app_info.hpp>
#include <syndicate/schema/encoding/encoder.hpp>
#include <syndicate/schema/operation_result.hpp>
#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_event.hpp>
#include <syndicate/schema/scheme_parameters.hpp>
#include <syndicate/schema/scheme_state.hpp>
#include <syndicate/settlement/settlement_asset.hpp>
#include <syndicate/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace syndicate::execution {

using event_observer_t =
    std::function<void(const syndicate::schema::scheme_event_t&)>;

/// Pooled investment scheme: one settlement asset in, one underlying position,
/// proceeds out pro-rata.
///
/// Every mutating call is all-or-nothing. The call runs on a copy of the
/// scheme state and ledger while the settlement asset sits behind a save
/// point; a failure discards the copy and rolls the settlement back, a success
/// swaps the copy in and persists it, its events and a new state root in one
/// RocksDB batch. Events reach observers after the commit with the lock
/// released, so an observer may call back into the scheme.
class scheme final {
 public:
  /// Open the scheme stored in `storage`, or create it from `parameters`.
  ///
  /// Throws std::invalid_argument when the timestamps break the schedule
  /// rules, when the custody identity is null, or when persisted state exists
  /// for different parameters.
  explicit scheme(
      const syndicate::schema::scheme_parameters_t& parameters,
      syndicate::settlement::settlement_asset& settlement,
      syndicate::gateway::order_gateway& gateway,
      syndicate::storage::storage<syndicate::storage::rocksdb_storage_tag>&
          storage,
      time_source_t clock = system_time_source());

  scheme(const scheme&) = delete;
  scheme& operator=(const scheme&) = delete;

  syndicate::schema::scheme_status_t status() const;
  syndicate::schema::scheme_state_t state() const;
  /// Construction parameters as persisted.
  syndicate::schema::scheme_parameters_t parameters() const;
  syndicate::schema::timestamp_seconds_t offer_closing_time() const;
  syndicate::schema::timestamp_seconds_t order_expiration() const;
  syndicate::schema::timestamp_seconds_t maturity() const;
  syndicate::schema::bytes_t underlying_asset() const;
  syndicate::schema::identity_t custody() const;
  syndicate::schema::amount_t purchase_price() const;
  syndicate::schema::amount_t sold_price() const;

  /// Contribution views; zero outside the offering phase.
  syndicate::schema::amount_t deposit_total() const;
  syndicate::schema::amount_t deposit_of(
      const syndicate::schema::identity_t& participant) const;

  /// Share views; zero outside the asset holding phase.
  syndicate::schema::amount_t total_supply() const;
  syndicate::schema::amount_t balance_of(
      const syndicate::schema::identity_t& owner) const;
  syndicate::schema::amount_t allowance(
      const syndicate::schema::identity_t& owner,
      const syndicate::schema::identity_t& spender) const;

  bool is_redeemable() const;

  /// Committed operation count, state root and status.
  syndicate::schema::app_info_t info() const;

  /// Persisted events with sequence in [from_sequence, to_sequence].
  std::vector<syndicate::schema::scheme_event_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  void subscribe(event_observer_t observer);

  syndicate::schema::operation_result_t deposit(
      const syndicate::schema::identity_t& caller,
      const syndicate::schema::amount_t& amount);
  syndicate::schema::operation_result_t withdraw(
      const syndicate::schema::identity_t& caller,
      const syndicate::schema::amount_t& amount);
  /// Withdraw the caller's whole contribution.
  syndicate::schema::operation_result_t withdraw(
      const syndicate::schema::identity_t& caller);

  syndicate::schema::operation_result_t make_buy_order();
  syndicate::schema::operation_result_t publish_token();
  syndicate::schema::operation_result_t sell_asset();
  syndicate::schema::operation_result_t update_sell_order();
  syndicate::schema::operation_result_t redeem();

  syndicate::schema::operation_result_t approve(
      const syndicate::schema::identity_t& owner,
      const syndicate::schema::identity_t& spender,
      const syndicate::schema::amount_t& amount);
  syndicate::schema::operation_result_t transfer(
      const syndicate::schema::identity_t& from,
      const syndicate::schema::identity_t& to,
      const syndicate::schema::amount_t& amount);
  syndicate::schema::operation_result_t transfer_from(
      const syndicate::schema::identity_t& spender,
      const syndicate::schema::identity_t& from,
      const syndicate::schema::identity_t& to,
      const syndicate::schema::amount_t& amount);

 private:
  struct working_state final {
    syndicate::schema::scheme_state_t state;
    syndicate::ledger::ledger ledger;
    std::vector<syndicate::schema::scheme_event_payload_t> events;
    std::string info;
  };

  using operation_body_t = std::function<guards::guard_result_t(
      working_state&,
      syndicate::schema::timestamp_seconds_t)>;

  /// Run `body` atomically against a working copy and commit on success.
  syndicate::schema::operation_result_t execute(std::string_view operation,
                                                const operation_body_t& body);

  /// Burn `amount` of the caller's contribution and pay it back.
  guards::guard_result_t return_contribution(
      working_state& work,
      syndicate::schema::timestamp_seconds_t now,
      const syndicate::schema::identity_t& caller,
      const syndicate::schema::amount_t& amount);

  /// Record a status change on the working copy.
  void transition(working_state& work, syndicate::schema::scheme_status_t to);

  /// Persist the working copy as checkpoint `sequence` and return its
  /// sequenced events.
  std::vector<syndicate::schema::scheme_event_t> commit(
      working_state& work,
      uint64_t sequence,
      syndicate::schema::timestamp_seconds_t now);

  /// Deliver committed events; runs with the lock released.
  static void publish(
      const std::vector<event_observer_t>& observers,
      const std::vector<syndicate::schema::scheme_event_t>& events);

  /// Load state, ledger rows and checkpoint; false when nothing is stored.
  bool load_persisted_state();

  mutable std::recursive_mutex mutex_;
  bool executing_{false};
  syndicate::schema::encoding::encoder<
      syndicate::schema::encoding::scale_encoder_tag>
      encoder_;
  syndicate::settlement::settlement_asset& settlement_;
  syndicate::gateway::order_gateway& gateway_;
  syndicate::storage::storage<syndicate::storage::rocksdb_storage_tag>&
      storage_;
  time_source_t clock_;
  syndicate::schema::scheme_state_t state_;
  syndicate::ledger::ledger ledger_;
  uint64_t committed_sequence_{};
  syndicate::schema::hash32_t state_root_{};
  uint64_t next_event_sequence_{};
  std::vector<event_observer_t> observers_;
};

}  // namespace syndicate::execution
