#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <syndicate/config/parameters.hpp>
#include <fstream>
#include <string>

using namespace syndicate::schema;

namespace {

boost::program_options::options_description make_description() {
  auto description =
      boost::program_options::options_description{"Scheme parameters"};
  description.add_options()(
      "offer_closing_time",
      boost::program_options::value<timestamp_seconds_t>()->required(),
      "Deposits are accepted strictly before this time (unix seconds)")(
      "order_expiration",
      boost::program_options::value<timestamp_seconds_t>()->required(),
      "The buy order must fill strictly before this time")(
      "maturity", boost::program_options::value<timestamp_seconds_t>()->required(),
      "The position may be sold at or after this time")(
      "underlying_asset",
      boost::program_options::value<std::string>()->required(),
      "Hex-encoded identifier of the position to acquire")(
      "custody", boost::program_options::value<std::string>()->required(),
      "Hex-encoded 32-byte identity that holds pooled funds");
  return description;
}

}  // namespace

namespace syndicate::config {

scheme_parameters_t load_parameters(std::istream& input) {
  auto vm = boost::program_options::variables_map{};
  boost::program_options::store(
      boost::program_options::parse_config_file(input, make_description()),
      vm);
  boost::program_options::notify(vm);

  const auto& underlying_hex = vm["underlying_asset"].as<std::string>();
  auto underlying = try_from_hex(underlying_hex);
  if (!underlying) {
    throw boost::program_options::invalid_option_value{underlying_hex};
  }
  const auto& custody_hex = vm["custody"].as<std::string>();
  auto custody = try_make_hash32(custody_hex);
  if (!custody) {
    throw boost::program_options::invalid_option_value{custody_hex};
  }

  auto parameters = scheme_parameters_t{};
  parameters.custody = *custody;
  parameters.underlying_asset = std::move(*underlying);
  parameters.offer_closing_time =
      vm["offer_closing_time"].as<timestamp_seconds_t>();
  parameters.order_expiration = vm["order_expiration"].as<timestamp_seconds_t>();
  parameters.maturity = vm["maturity"].as<timestamp_seconds_t>();
  spdlog::debug("Loaded scheme parameters for underlying {}", underlying_hex);
  return parameters;
}

scheme_parameters_t load_parameters_file(const std::string_view& path) {
  auto input = std::ifstream{std::string{path}};
  if (!input) {
    spdlog::error("Unable to open scheme configuration '{}'", path);
    throw boost::program_options::reading_file{std::string{path}.c_str()};
  }
  return load_parameters(input);
}

}  // namespace syndicate::config
