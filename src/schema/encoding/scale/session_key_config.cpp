#include <keyward/schema/encoding/scale/session_key_config.hpp>

using namespace keyward::schema;

namespace keyward::schema::encoding::scale {

void encode(const session_key_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.max_transaction_amount, encoder);
  encode(o.max_daily_amount, encoder);
  encode(o.max_transaction_count, encoder);
  encode(o.expiration_time, encoder);
  encode(o.created_at, encoder);
  encode(o.allowed_contracts, encoder);
  encode(o.allowed_methods, encoder);
  encode(o.require_user_confirmation, encoder);
  encode(o.emergency_revocation, encoder);
}

void decode(session_key_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.max_transaction_amount, decoder);
  decode(o.max_daily_amount, decoder);
  decode(o.max_transaction_count, decoder);
  decode(o.expiration_time, decoder);
  decode(o.created_at, decoder);
  decode(o.allowed_contracts, decoder);
  decode(o.allowed_methods, decoder);
  decode(o.require_user_confirmation, decoder);
  decode(o.emergency_revocation, decoder);
}

}  // namespace keyward::schema::encoding::scale
