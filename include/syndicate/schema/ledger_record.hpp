#pragma once
#include <syndicate/schema/primitives.hpp>
#include <vector>

// Schema type: ledger record.
// Persisted ledger header. Balances and allowances live in their own rows.
namespace syndicate::schema {

template <uint16_t Version>
struct ledger_record;

template <>
struct ledger_record<1> final {
  uint16_t version{1};
  amount_t total_supply{};
  std::vector<identity_t> participants;
};

using ledger_record_t = ledger_record<1>;

}  // namespace syndicate::schema
