#pragma once

#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_status.hpp>

#include <cstdint>
#include <variant>

// Schema type: scheme event.
// Advisory notifications for observers and the persisted event log. They carry
// no control semantics.
namespace syndicate::schema {

struct state_changed_t final {
  scheme_status_t from{};
  scheme_status_t to{};
};

/// Mints carry a null `from`, burns a null `to`.
struct transfer_event_t final {
  identity_t from{};
  identity_t to{};
  amount_t amount{};
};

struct approval_event_t final {
  identity_t owner{};
  identity_t spender{};
  amount_t amount{};
};

using scheme_event_payload_t =
    std::variant<state_changed_t, transfer_event_t, approval_event_t>;

template <uint16_t Version>
struct scheme_event;

template <>
struct scheme_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_seconds_t timestamp{};
  scheme_event_payload_t payload;
};

using scheme_event_t = scheme_event<1>;

}  // namespace syndicate::schema
