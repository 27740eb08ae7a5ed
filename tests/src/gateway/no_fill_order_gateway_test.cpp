#include <gtest/gtest.h>
#include <syndicate/gateway/order_gateway.hpp>

TEST(no_fill_order_gateway, accepts_orders_and_never_fills) {
  auto gateway = syndicate::gateway::no_fill_order_gateway{};
  auto order = syndicate::schema::order_t{};
  order.underlying_asset = syndicate::schema::bytes_t{0x01};
  order.notional = 1000;

  gateway.place_buy(order);
  EXPECT_FALSE(gateway.check_buy_filled());
  EXPECT_EQ(gateway.buy_fill_price(), 0);
  gateway.cancel_buy();

  gateway.place_sell(order);
  EXPECT_FALSE(gateway.check_sell_filled());
  EXPECT_EQ(gateway.sell_fill_price(), 0);
  gateway.cancel_sell();
}
