#include <boost/program_options/errors.hpp>
#include <gtest/gtest.h>
#include <syndicate/config/parameters.hpp>
#include <syndicate/testing/common.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace {

const auto kCustodyHex = std::string{
    "c0c1c2c3c4c5c6c7c8c9cacbcccdcecfd0d1d2d3d4d5d6d7d8d9dadbdcdddedf"};

std::string make_config(const std::string& custody_hex) {
  return "offer_closing_time = 1767225600\n"
         "order_expiration = 1769817600\n"
         "# position to acquire\n"
         "maturity = 1780185600\n"
         "underlying_asset = 5553542d54424c4c\n"
         "custody = " +
         custody_hex + "\n";
}

}  // namespace

TEST(config, load_parameters_reads_every_key) {
  auto input = std::istringstream{make_config(kCustodyHex)};
  auto parameters = syndicate::config::load_parameters(input);
  EXPECT_EQ(parameters.offer_closing_time, 1767225600u);
  EXPECT_EQ(parameters.order_expiration, 1769817600u);
  EXPECT_EQ(parameters.maturity, 1780185600u);
  EXPECT_EQ(parameters.underlying_asset,
            syndicate::schema::make_bytes(std::string_view{"UST-TBLL"}));
  EXPECT_EQ(parameters.custody, syndicate::testing::make_hash(0xC0));
}

TEST(config, missing_key_is_an_error) {
  auto input = std::istringstream{
      "offer_closing_time = 1\norder_expiration = 2\nmaturity = 3\n"
      "underlying_asset = 00\n"};
  EXPECT_THROW(syndicate::config::load_parameters(input),
               boost::program_options::error);
}

TEST(config, malformed_custody_is_an_error) {
  auto input = std::istringstream{make_config("c0c1")};
  EXPECT_THROW(syndicate::config::load_parameters(input),
               boost::program_options::error);
}

TEST(config, non_numeric_timestamp_is_an_error) {
  auto input = std::istringstream{
      "offer_closing_time = soon\norder_expiration = 2\nmaturity = 3\n"
      "underlying_asset = 00\ncustody = " +
      kCustodyHex + "\n"};
  EXPECT_THROW(syndicate::config::load_parameters(input),
               boost::program_options::error);
}

TEST(config, load_parameters_file_reads_from_disk) {
  const auto path = syndicate::testing::make_db_path("syndicate_config");
  {
    auto output = std::ofstream{path};
    output << make_config(kCustodyHex);
  }
  auto parameters = syndicate::config::load_parameters_file(path);
  EXPECT_EQ(parameters.maturity, 1780185600u);
  syndicate::testing::remove_path(path);

  EXPECT_THROW(syndicate::config::load_parameters_file(path),
               boost::program_options::error);
}
