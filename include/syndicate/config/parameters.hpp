#pragma once
#include <syndicate/schema/scheme_parameters.hpp>
#include <istream>
#include <string_view>

// Scheme parameters read from an INI-style file:
//
//   offer_closing_time = 1767225600
//   order_expiration   = 1769817600
//   maturity           = 1780185600
//   underlying_asset   = 5553542d54424c4c
//   custody            = <64 hex characters>
//
// Missing or malformed values raise boost::program_options::error.
namespace syndicate::config {

syndicate::schema::scheme_parameters_t load_parameters(std::istream& input);

syndicate::schema::scheme_parameters_t load_parameters_file(
    const std::string_view& path);

}  // namespace syndicate::config
