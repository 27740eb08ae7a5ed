#pragma once

#include <syndicate/schema/order.hpp>
#include <syndicate/schema/primitives.hpp>

namespace syndicate::gateway {

/// Strategy that acquires and later liquidates the underlying position.
///
/// A check returning false is an ordinary outcome: the order is still working
/// and the scheme leaves its state unchanged. Fill prices are read only after
/// the matching check has returned true.
class order_gateway {
 public:
  virtual ~order_gateway() = default;

  virtual void place_buy(const syndicate::schema::order_t& order) = 0;
  virtual void cancel_buy() = 0;
  virtual bool check_buy_filled() = 0;
  virtual syndicate::schema::amount_t buy_fill_price() const = 0;

  virtual void place_sell(const syndicate::schema::order_t& order) = 0;
  virtual void cancel_sell() = 0;
  virtual bool check_sell_filled() = 0;
  virtual syndicate::schema::amount_t sell_fill_price() const = 0;
};

/// Default strategy: orders are accepted and never fill.
class no_fill_order_gateway final : public order_gateway {
 public:
  void place_buy(const syndicate::schema::order_t& order) override;
  void cancel_buy() override;
  bool check_buy_filled() override;
  syndicate::schema::amount_t buy_fill_price() const override;

  void place_sell(const syndicate::schema::order_t& order) override;
  void cancel_sell() override;
  bool check_sell_filled() override;
  syndicate::schema::amount_t sell_fill_price() const override;
};

}  // namespace syndicate::gateway
