#include <spdlog/spdlog.h>
#include <syndicate/blake3/hash.hpp>
#include <syndicate/common/critical.hpp>
#include <syndicate/execution/refund.hpp>
#include <syndicate/execution/scheme.hpp>
#include <syndicate/schema/encoding/scale/encoder.hpp>
#include <syndicate/schema/key/scheme_keys.hpp>
#include <iterator>
#include <stdexcept>
#include <utility>

using namespace syndicate::schema;

namespace {

using encoder_t = syndicate::schema::encoding::encoder<
    syndicate::schema::encoding::scale_encoder_tag>;

syndicate::execution::guards::guard_result_t ledger_failure(
    const syndicate::ledger::ledger_error_t& error) {
  if (!error) {
    return std::nullopt;
  }
  return syndicate::execution::guards::guard_failure{*error,
                                                     to_string(*error)};
}

operation_result_t make_rejection(
    const std::string_view operation,
    const syndicate::execution::guards::guard_failure& failure) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(failure.code);
  result.log = std::string{failure.reason};
  result.info = std::string{to_string(failure.code)};
  result.codespace = "syndicate." + std::string{operation};
  return result;
}

bool same_parameters(const scheme_state_t& stored,
                     const scheme_parameters_t& parameters) {
  return stored.custody == parameters.custody &&
         stored.underlying_asset == parameters.underlying_asset &&
         stored.offer_closing_time == parameters.offer_closing_time &&
         stored.order_expiration == parameters.order_expiration &&
         stored.maturity == parameters.maturity;
}

/// Resets the re-entry flag however the operation exits.
class execution_scope final {
 public:
  explicit execution_scope(bool& executing) : executing_{executing} {
    executing_ = true;
  }
  execution_scope(const execution_scope&) = delete;
  execution_scope& operator=(const execution_scope&) = delete;
  ~execution_scope() { executing_ = false; }

 private:
  bool& executing_;
};

}  // namespace

namespace syndicate::execution {

scheme::scheme(
    const scheme_parameters_t& parameters,
    syndicate::settlement::settlement_asset& settlement,
    syndicate::gateway::order_gateway& gateway,
    syndicate::storage::storage<syndicate::storage::rocksdb_storage_tag>&
        storage,
    time_source_t clock)
    : settlement_{settlement},
      gateway_{gateway},
      storage_{storage},
      clock_{std::move(clock)} {
  auto lock = std::scoped_lock{mutex_};
  if (!clock_) {
    throw std::invalid_argument{"scheme requires a time source"};
  }

  if (load_persisted_state()) {
    if (!same_parameters(state_, parameters)) {
      throw std::invalid_argument{
          "persisted scheme was created with different parameters"};
    }
    spdlog::info("Resumed scheme in status '{}' at sequence {} (root {})",
                 to_string(state_.status), committed_sequence_,
                 to_hex(state_root_));
    return;
  }

  if (auto violation = guards::schedule_violation(
          parameters.offer_closing_time, parameters.order_expiration,
          parameters.maturity)) {
    throw std::invalid_argument{std::string{*violation}};
  }
  if (is_null(parameters.custody)) {
    throw std::invalid_argument{"custody identity must not be null"};
  }

  state_ = make_scheme_state(parameters);
  auto genesis = working_state{.state = state_, .ledger = ledger_};
  const auto now = clock_();
  (void)commit(genesis, 0, now);
  spdlog::info("Created scheme for custody {}: offer closes at {}, order "
               "expires at {}, matures at {}",
               to_hex(state_.custody), state_.offer_closing_time,
               state_.order_expiration, state_.maturity);
}

scheme_status_t scheme::status() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.status;
}

scheme_state_t scheme::state() const {
  auto lock = std::scoped_lock{mutex_};
  return state_;
}

scheme_parameters_t scheme::parameters() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = scheme_parameters_t{};
  out.custody = state_.custody;
  out.underlying_asset = state_.underlying_asset;
  out.offer_closing_time = state_.offer_closing_time;
  out.order_expiration = state_.order_expiration;
  out.maturity = state_.maturity;
  return out;
}

timestamp_seconds_t scheme::offer_closing_time() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.offer_closing_time;
}

timestamp_seconds_t scheme::order_expiration() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.order_expiration;
}

timestamp_seconds_t scheme::maturity() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.maturity;
}

bytes_t scheme::underlying_asset() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.underlying_asset;
}

identity_t scheme::custody() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.custody;
}

amount_t scheme::purchase_price() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.purchase_price;
}

amount_t scheme::sold_price() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.sold_price;
}

amount_t scheme::deposit_total() const {
  auto lock = std::scoped_lock{mutex_};
  if (state_.status != scheme_status_t::offering) {
    return 0;
  }
  return ledger_.total_supply();
}

amount_t scheme::deposit_of(const identity_t& participant) const {
  auto lock = std::scoped_lock{mutex_};
  if (state_.status != scheme_status_t::offering) {
    return 0;
  }
  return ledger_.balance_of(participant);
}

amount_t scheme::total_supply() const {
  auto lock = std::scoped_lock{mutex_};
  if (state_.status != scheme_status_t::asset_holding) {
    return 0;
  }
  return ledger_.total_supply();
}

amount_t scheme::balance_of(const identity_t& owner) const {
  auto lock = std::scoped_lock{mutex_};
  if (state_.status != scheme_status_t::asset_holding) {
    return 0;
  }
  return ledger_.balance_of(owner);
}

amount_t scheme::allowance(const identity_t& owner,
                           const identity_t& spender) const {
  auto lock = std::scoped_lock{mutex_};
  if (state_.status != scheme_status_t::asset_holding) {
    return 0;
  }
  return ledger_.allowance(owner, spender);
}

bool scheme::is_redeemable() const {
  auto lock = std::scoped_lock{mutex_};
  return guards::is_redeemable(state_, clock_());
}

app_info_t scheme::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.committed_sequence = committed_sequence_;
  result.state_root = state_root_;
  result.status = state_.status;
  return result;
}

std::vector<scheme_event_t> scheme::events(const uint64_t from_sequence,
                                           const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = std::vector<scheme_event_t>{};
  if (from_sequence > to_sequence) {
    return result;
  }
  auto encoder = encoder_t{};
  const auto rows = storage_.list_by_prefix(
      make_bytes_view(syndicate::schema::key::kEventPrefix));
  for (const auto& [key, value] : rows) {
    auto event = encoder.decode<scheme_event_t>(bytes_view_t{value});
    if (event.sequence < from_sequence) {
      continue;
    }
    if (event.sequence > to_sequence) {
      break;
    }
    result.push_back(std::move(event));
  }
  return result;
}

void scheme::subscribe(event_observer_t observer) {
  auto lock = std::scoped_lock{mutex_};
  observers_.push_back(std::move(observer));
}

operation_result_t scheme::deposit(const identity_t& caller,
                                   const amount_t& amount) {
  return execute("deposit", [&](working_state& work,
                                const timestamp_seconds_t now)
                                -> guards::guard_result_t {
    if (auto failure = guards::contribution_open(work.state, now)) {
      return failure;
    }
    if (amount == 0) {
      return guards::guard_failure{scheme_error_code::zero_amount,
                                   "deposit amount must be positive"};
    }
    if (is_null(caller)) {
      return guards::guard_failure{scheme_error_code::invalid_recipient,
                                   "depositor identity must not be null"};
    }
    if (!settlement_.transfer_from(work.state.custody, caller,
                                   work.state.custody, amount)) {
      return guards::guard_failure{
          scheme_error_code::settlement_transfer_failed,
          "settlement asset refused to move the deposit into custody"};
    }
    if (auto failure = ledger_failure(work.ledger.mint(caller, amount))) {
      return failure;
    }
    work.info = "deposited " + to_string(amount);
    return std::nullopt;
  });
}

operation_result_t scheme::withdraw(const identity_t& caller,
                                    const amount_t& amount) {
  return execute("withdraw", [&](working_state& work,
                                 const timestamp_seconds_t now) {
    return return_contribution(work, now, caller, amount);
  });
}

operation_result_t scheme::withdraw(const identity_t& caller) {
  return execute("withdraw", [&](working_state& work,
                                 const timestamp_seconds_t now) {
    const auto whole = work.ledger.balance_of(caller);
    return return_contribution(work, now, caller, whole);
  });
}

guards::guard_result_t scheme::return_contribution(
    working_state& work,
    const timestamp_seconds_t now,
    const identity_t& caller,
    const amount_t& amount) {
  if (auto failure = guards::contribution_open(work.state, now)) {
    return failure;
  }
  if (amount == 0) {
    return guards::guard_failure{scheme_error_code::zero_amount,
                                 "withdraw amount must be positive"};
  }
  if (auto failure = ledger_failure(work.ledger.burn(caller, amount))) {
    return failure;
  }
  if (!settlement_.transfer(work.state.custody, caller, amount)) {
    return guards::guard_failure{
        scheme_error_code::settlement_transfer_failed,
        "settlement asset refused to return the withdrawal"};
  }
  work.info = "withdrew " + to_string(amount);
  return std::nullopt;
}

operation_result_t scheme::make_buy_order() {
  return execute("make_buy_order", [&](working_state& work,
                                       const timestamp_seconds_t now)
                                       -> guards::guard_result_t {
    if (auto failure = guards::buy_order_allowed(work.state, now)) {
      return failure;
    }
    gateway_.place_buy(order_t{.underlying_asset = work.state.underlying_asset,
                               .notional = work.ledger.total_supply()});
    transition(work, scheme_status_t::ordering);
    work.info = "buy order placed for " + to_string(work.ledger.total_supply());
    return std::nullopt;
  });
}

operation_result_t scheme::publish_token() {
  return execute("publish_token", [&](working_state& work,
                                      const timestamp_seconds_t now)
                                      -> guards::guard_result_t {
    if (auto failure = guards::publish_allowed(work.state, now)) {
      return failure;
    }
    if (!gateway_.check_buy_filled()) {
      return guards::guard_failure{scheme_error_code::order_not_filled,
                                   "buy order has not filled"};
    }
    auto price = gateway_.buy_fill_price();
    if (price == 0) {
      price = work.ledger.total_supply();
    }
    work.state.purchase_price = price;
    transition(work, scheme_status_t::asset_holding);
    work.info = "position acquired for " + to_string(price);
    return std::nullopt;
  });
}

operation_result_t scheme::sell_asset() {
  return execute("sell_asset", [&](working_state& work,
                                   const timestamp_seconds_t now)
                                   -> guards::guard_result_t {
    if (auto failure = guards::sell_allowed(work.state, now)) {
      return failure;
    }
    gateway_.place_sell(order_t{.underlying_asset = work.state.underlying_asset,
                                .notional = work.ledger.total_supply()});
    transition(work, scheme_status_t::asset_selling);
    work.info = "sell order placed";
    return std::nullopt;
  });
}

operation_result_t scheme::update_sell_order() {
  return execute("update_sell_order", [&](working_state& work,
                                          const timestamp_seconds_t)
                                          -> guards::guard_result_t {
    if (auto failure = guards::sell_update_allowed(work.state)) {
      return failure;
    }
    if (!gateway_.check_sell_filled()) {
      return guards::guard_failure{scheme_error_code::order_not_filled,
                                   "sell order has not filled"};
    }
    work.state.sold_price = gateway_.sell_fill_price();
    transition(work, scheme_status_t::asset_sold);
    work.info = "position sold for " + to_string(work.state.sold_price);
    return std::nullopt;
  });
}

operation_result_t scheme::redeem() {
  return execute("redeem", [&](working_state& work,
                               const timestamp_seconds_t now)
                               -> guards::guard_result_t {
    if (auto failure = guards::redeem_allowed(work.state, now)) {
      return failure;
    }

    const auto entry_status = work.state.status;
    auto outcome = entry_status == scheme_status_t::asset_sold
                       ? refund::distribute_proceeds(
                             work.ledger, settlement_, work.state.custody,
                             work.state.sold_price)
                       : refund::refund_contributions(
                             work.ledger, settlement_, work.state.custody);
    if (outcome.error) {
      return guards::guard_failure{*outcome.error, outcome.reason};
    }
    // The open order is withdrawn only once the refund can no longer fail.
    if (entry_status == scheme_status_t::ordering) {
      gateway_.cancel_buy();
    }

    transition(work, scheme_status_t::closed);
    work.info = "redeemed " + to_string(outcome.paid_out) + " to " +
                std::to_string(outcome.recipients) + " participant(s)";
    return std::nullopt;
  });
}

operation_result_t scheme::approve(const identity_t& owner,
                                   const identity_t& spender,
                                   const amount_t& amount) {
  return execute("approve", [&](working_state& work,
                                const timestamp_seconds_t now)
                                -> guards::guard_result_t {
    if (auto failure = guards::share_trading_open(work.state, now)) {
      return failure;
    }
    return ledger_failure(work.ledger.approve(owner, spender, amount));
  });
}

operation_result_t scheme::transfer(const identity_t& from,
                                    const identity_t& to,
                                    const amount_t& amount) {
  return execute("transfer", [&](working_state& work,
                                 const timestamp_seconds_t now)
                                 -> guards::guard_result_t {
    if (auto failure = guards::share_trading_open(work.state, now)) {
      return failure;
    }
    return ledger_failure(work.ledger.transfer(from, to, amount));
  });
}

operation_result_t scheme::transfer_from(const identity_t& spender,
                                         const identity_t& from,
                                         const identity_t& to,
                                         const amount_t& amount) {
  return execute("transfer_from", [&](working_state& work,
                                      const timestamp_seconds_t now)
                                      -> guards::guard_result_t {
    if (auto failure = guards::share_trading_open(work.state, now)) {
      return failure;
    }
    return ledger_failure(
        work.ledger.transfer_from(spender, from, to, amount));
  });
}

operation_result_t scheme::execute(const std::string_view operation,
                                   const operation_body_t& body) {
  auto result = operation_result_t{};
  auto observers = std::vector<event_observer_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (executing_) {
      spdlog::warn("Rejected re-entrant {} while another operation runs",
                   operation);
      return make_rejection(
          operation,
          guards::guard_failure{scheme_error_code::reentrant_call,
                                "scheme is already executing an operation"});
    }
    auto scope = execution_scope{executing_};

    const auto now = clock_();
    auto work = working_state{.state = state_, .ledger = ledger_};

    settlement_.set_save_point();
    auto failure = guards::guard_result_t{};
    try {
      failure = body(work, now);
    } catch (const std::exception& ex) {
      settlement_.rollback_to_save_point();
      spdlog::error("{} aborted by collaborator fault: {}", operation,
                    ex.what());
      throw;
    } catch (...) {
      settlement_.rollback_to_save_point();
      spdlog::error("{} aborted by unknown collaborator fault", operation);
      throw;
    }

    if (failure) {
      settlement_.rollback_to_save_point();
      if (error_category_of(failure->code) == error_category_t::business) {
        spdlog::info("{} deferred: {}", operation, failure->reason);
      } else {
        spdlog::warn("{} rejected ({}): {}", operation,
                     to_string(failure->code), failure->reason);
      }
      return make_rejection(operation, *failure);
    }
    settlement_.release_save_point();

    result.info = std::move(work.info);
    result.events = commit(work, committed_sequence_ + 1, now);
    state_ = std::move(work.state);
    ledger_ = std::move(work.ledger);
    spdlog::info("{} committed at sequence {}", operation,
                 committed_sequence_);
    observers = observers_;
  }

  // Observers may call back into the scheme once the operation is finished.
  publish(observers, result.events);
  return result;
}

void scheme::transition(working_state& work, const scheme_status_t to) {
  const auto from = work.state.status;
  if (!is_permitted_transition(from, to)) {
    spdlog::error("Illegal scheme transition {} -> {}", to_string(from),
                  to_string(to));
    syndicate::common::critical("illegal scheme transition");
  }
  auto ledger_events = work.ledger.take_events();
  std::move(std::begin(ledger_events), std::end(ledger_events),
            std::back_inserter(work.events));
  work.events.emplace_back(state_changed_t{.from = from, .to = to});
  work.state.status = to;
  spdlog::info("Scheme status {} -> {}", to_string(from), to_string(to));
}

std::vector<scheme_event_t> scheme::commit(working_state& work,
                                           const uint64_t sequence,
                                           const timestamp_seconds_t now) {
  auto ledger_events = work.ledger.take_events();
  std::move(std::begin(ledger_events), std::end(ledger_events),
            std::back_inserter(work.events));

  auto batch = syndicate::storage::commit_batch{};
  batch.replace_prefix = make_bytes(syndicate::schema::key::kStatePrefix);
  batch.state.emplace_back(make_bytes(syndicate::schema::key::kSchemeKey),
                           encoder_.encode(work.state));
  batch.state.emplace_back(make_bytes(syndicate::schema::key::kLedgerKey),
                           encoder_.encode(work.ledger.record()));
  for (const auto& [owner, amount] : work.ledger.balances()) {
    batch.state.emplace_back(syndicate::schema::key::make_balance_key(owner),
                             encoder_.encode(to_amount_bytes(amount)));
  }
  for (const auto& [key, amount] : work.ledger.allowances()) {
    batch.state.emplace_back(
        syndicate::schema::key::make_allowance_key(key.first, key.second),
        encoder_.encode(to_amount_bytes(amount)));
  }

  auto sequenced = std::vector<scheme_event_t>{};
  sequenced.reserve(work.events.size());
  auto next_event_sequence = next_event_sequence_;
  for (auto& payload : work.events) {
    auto event = scheme_event_t{.sequence = next_event_sequence++,
                                .timestamp = now,
                                .payload = std::move(payload)};
    batch.appends.emplace_back(
        syndicate::schema::key::make_event_key(event.sequence),
        encoder_.encode(event));
    sequenced.push_back(std::move(event));
  }
  work.events.clear();

  auto material = bytes_t{};
  for (const auto* rows : {&batch.state, &batch.appends}) {
    for (const auto& [key, value] : *rows) {
      material.insert(std::end(material), std::begin(key), std::end(key));
      material.insert(std::end(material), std::begin(value), std::end(value));
    }
  }
  const auto root = syndicate::blake3::fold(state_root_, sequence,
                                            bytes_view_t{material});
  batch.checkpoint = syndicate::storage::committed_state{
      .sequence = sequence, .state_root = root};
  storage_.commit(batch);

  committed_sequence_ = sequence;
  state_root_ = root;
  next_event_sequence_ = next_event_sequence;
  return sequenced;
}

void scheme::publish(const std::vector<event_observer_t>& observers,
                     const std::vector<scheme_event_t>& events) {
  for (const auto& event : events) {
    for (const auto& observer : observers) {
      try {
        observer(event);
      } catch (const std::exception& ex) {
        spdlog::error("Scheme observer failed on event {}: {}",
                      event.sequence, ex.what());
      }
    }
  }
}

bool scheme::load_persisted_state() {
  spdlog::debug("Loading persisted scheme state");
  auto committed = storage_.load_committed_state();
  if (!committed) {
    return false;
  }

  auto stored_state = storage_.get<encoder_t, scheme_state_t>(
      encoder_, make_bytes_view(syndicate::schema::key::kSchemeKey));
  auto stored_ledger = storage_.get<encoder_t, ledger_record_t>(
      encoder_, make_bytes_view(syndicate::schema::key::kLedgerKey));
  if (!stored_state || !stored_ledger) {
    syndicate::common::critical(
        "committed checkpoint present without scheme state");
  }

  auto balances = syndicate::ledger::balance_map_t{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           make_bytes_view(syndicate::schema::key::kBalanceKeyPrefix))) {
    auto owner = syndicate::schema::key::parse_balance_key(bytes_view_t{key});
    if (!owner) {
      syndicate::common::critical("malformed balance row key");
    }
    balances.emplace(*owner, from_amount_bytes(encoder_.decode<amount_bytes_t>(
                                 bytes_view_t{value})));
  }

  auto allowances = syndicate::ledger::allowance_map_t{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           make_bytes_view(syndicate::schema::key::kAllowanceKeyPrefix))) {
    auto pair = syndicate::schema::key::parse_allowance_key(bytes_view_t{key});
    if (!pair) {
      syndicate::common::critical("malformed allowance row key");
    }
    allowances.emplace(*pair, from_amount_bytes(encoder_.decode<amount_bytes_t>(
                                  bytes_view_t{value})));
  }

  const auto event_rows = storage_.list_by_prefix(
      make_bytes_view(syndicate::schema::key::kEventPrefix));
  if (!event_rows.empty()) {
    auto last = encoder_.decode<scheme_event_t>(
        bytes_view_t{event_rows.back().second});
    next_event_sequence_ = last.sequence + 1;
  }

  state_ = std::move(*stored_state);
  ledger_ = syndicate::ledger::ledger::restore(
      *stored_ledger, std::move(balances), std::move(allowances));
  committed_sequence_ = committed->sequence;
  state_root_ = committed->state_root;
  return true;
}

}  // namespace syndicate::execution
