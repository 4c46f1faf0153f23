#include <keyward/schema/encoding/scale/session_key_usage.hpp>

using namespace keyward::schema;

namespace keyward::schema::encoding::scale {

void encode(const session_key_usage<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.reference, encoder);
  encode(o.amount, encoder);
  encode(o.timestamp, encoder);
  encode(o.contract_address, encoder);
  encode(o.method_name, encoder);
  encode(o.gas_limit, encoder);
}

void decode(session_key_usage<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.reference, decoder);
  decode(o.amount, decoder);
  decode(o.timestamp, decoder);
  decode(o.contract_address, decoder);
  decode(o.method_name, decoder);
  decode(o.gas_limit, decoder);
}

}  // namespace keyward::schema::encoding::scale
