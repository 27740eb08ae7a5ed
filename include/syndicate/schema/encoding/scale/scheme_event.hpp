#pragma once
#include <syndicate/schema/scheme_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace syndicate::schema {

void encode(const state_changed_t& o, ::scale::Encoder& encoder);
void decode(state_changed_t& o, ::scale::Decoder& decoder);

void encode(const transfer_event_t& o, ::scale::Encoder& encoder);
void decode(transfer_event_t& o, ::scale::Decoder& decoder);

void encode(const approval_event_t& o, ::scale::Encoder& encoder);
void decode(approval_event_t& o, ::scale::Decoder& decoder);

void encode(const scheme_event<1>& o, ::scale::Encoder& encoder);
void decode(scheme_event<1>& o, ::scale::Decoder& decoder);

}  // namespace syndicate::schema
