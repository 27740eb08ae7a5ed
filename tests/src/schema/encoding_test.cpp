#include <gtest/gtest.h>
#include <syndicate/schema/encoding/scale/encoder.hpp>
#include <syndicate/testing/common.hpp>

#include <variant>

namespace {

using encoder_t = syndicate::schema::encoding::encoder<
    syndicate::schema::encoding::scale_encoder_tag>;

syndicate::schema::scheme_state_t make_sold_state() {
  auto state = syndicate::schema::scheme_state_t{};
  state.status = syndicate::schema::scheme_status_t::asset_sold;
  state.custody = syndicate::testing::make_hash(7);
  state.underlying_asset = syndicate::schema::bytes_t{0xDE, 0xAD};
  state.offer_closing_time = 100;
  state.order_expiration = 200;
  state.maturity = 300;
  state.purchase_price = 1000;
  state.sold_price = syndicate::schema::unlimited_amount();
  return state;
}

}  // namespace

TEST(encoding, scheme_state_decodes_what_was_encoded) {
  auto encoder = encoder_t{};
  auto state = make_sold_state();
  auto decoded = encoder.decode<syndicate::schema::scheme_state_t>(
      syndicate::schema::bytes_view_t{encoder.encode(state)});

  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.status, state.status);
  EXPECT_EQ(decoded.custody, state.custody);
  EXPECT_EQ(decoded.underlying_asset, state.underlying_asset);
  EXPECT_EQ(decoded.offer_closing_time, state.offer_closing_time);
  EXPECT_EQ(decoded.order_expiration, state.order_expiration);
  EXPECT_EQ(decoded.maturity, state.maturity);
  EXPECT_EQ(decoded.purchase_price, state.purchase_price);
  EXPECT_EQ(decoded.sold_price, state.sold_price);
}

TEST(encoding, ledger_record_keeps_participant_order) {
  auto encoder = encoder_t{};
  auto record = syndicate::schema::ledger_record_t{};
  record.total_supply = 1000;
  record.participants = {syndicate::testing::make_hash(9),
                         syndicate::testing::make_hash(3),
                         syndicate::testing::make_hash(5)};
  auto decoded = encoder.decode<syndicate::schema::ledger_record_t>(
      syndicate::schema::bytes_view_t{encoder.encode(record)});
  EXPECT_EQ(decoded.total_supply, record.total_supply);
  EXPECT_EQ(decoded.participants, record.participants);
}

TEST(encoding, scheme_event_preserves_payload_alternative) {
  auto encoder = encoder_t{};
  auto event = syndicate::schema::scheme_event_t{};
  event.sequence = 12;
  event.timestamp = 1'700'000'000;
  event.payload = syndicate::schema::transfer_event_t{
      .from = syndicate::schema::null_identity(),
      .to = syndicate::testing::make_hash(1),
      .amount = 250};

  auto decoded = encoder.decode<syndicate::schema::scheme_event_t>(
      syndicate::schema::bytes_view_t{encoder.encode(event)});
  EXPECT_EQ(decoded.sequence, event.sequence);
  EXPECT_EQ(decoded.timestamp, event.timestamp);
  ASSERT_TRUE(
      std::holds_alternative<syndicate::schema::transfer_event_t>(
          decoded.payload));
  const auto& transfer =
      std::get<syndicate::schema::transfer_event_t>(decoded.payload);
  EXPECT_TRUE(syndicate::schema::is_null(transfer.from));
  EXPECT_EQ(transfer.to, syndicate::testing::make_hash(1));
  EXPECT_EQ(transfer.amount, 250);
}

TEST(encoding, try_decode_rejects_truncated_state) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_sold_state());
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder.try_decode<syndicate::schema::scheme_state_t>(
                          syndicate::schema::bytes_view_t{bytes})
                   .has_value());
}

TEST(encoding, try_decode_rejects_unknown_status_byte) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_sold_state());
  // version (2 bytes) then the status byte.
  bytes[2] = 0x2A;
  EXPECT_FALSE(encoder.try_decode<syndicate::schema::scheme_state_t>(
                          syndicate::schema::bytes_view_t{bytes})
                   .has_value());
}

TEST(encoding, try_decode_rejects_unknown_event_payload) {
  auto encoder = encoder_t{};
  auto event = syndicate::schema::scheme_event_t{};
  event.payload = syndicate::schema::state_changed_t{};
  auto bytes = encoder.encode(event);
  // version (2) + sequence (8) + timestamp (8), then the payload index.
  bytes[18] = 9;
  EXPECT_FALSE(encoder.try_decode<syndicate::schema::scheme_event_t>(
                          syndicate::schema::bytes_view_t{bytes})
                   .has_value());
}
