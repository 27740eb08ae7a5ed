#include <spdlog/spdlog.h>
#include <syndicate/gateway/order_gateway.hpp>

using namespace syndicate::schema;

namespace syndicate::gateway {

void no_fill_order_gateway::place_buy(const order_t& order) {
  spdlog::debug("No-fill gateway accepted buy order for notional {}",
                to_string(order.notional));
}

void no_fill_order_gateway::cancel_buy() {
  spdlog::debug("No-fill gateway cancelled buy order");
}

bool no_fill_order_gateway::check_buy_filled() {
  return false;
}

amount_t no_fill_order_gateway::buy_fill_price() const {
  return 0;
}

void no_fill_order_gateway::place_sell(const order_t& order) {
  spdlog::debug("No-fill gateway accepted sell order for notional {}",
                to_string(order.notional));
}

void no_fill_order_gateway::cancel_sell() {
  spdlog::debug("No-fill gateway cancelled sell order");
}

bool no_fill_order_gateway::check_sell_filled() {
  return false;
}

amount_t no_fill_order_gateway::sell_fill_price() const {
  return 0;
}

}  // namespace syndicate::gateway
