#include <keyward/schema/encoding/scale/session_key_config.hpp>
#include <keyward/schema/encoding/scale/session_key_state.hpp>
#include <keyward/schema/encoding/scale/session_key_usage.hpp>

using namespace keyward::schema;

namespace keyward::schema::encoding::scale {

// Only the identity address is persisted. The signing capability stays with
// the key material provider.
void encode(const session_key_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.session_id, encoder);
  encode(o.principal, encoder);
  encode(o.identity.address, encoder);
  encode(o.config, encoder);
  encode(o.usage, encoder);
  encode(o.is_active, encoder);
  encode(o.is_revoked, encoder);
  encode(o.revoked_at, encoder);
  encode(o.revoked_reason, encoder);
}

void decode(session_key_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.session_id, decoder);
  decode(o.principal, decoder);
  decode(o.identity.address, decoder);
  decode(o.config, decoder);
  decode(o.usage, decoder);
  decode(o.is_active, decoder);
  decode(o.is_revoked, decoder);
  decode(o.revoked_at, decoder);
  decode(o.revoked_reason, decoder);
  o.identity.capability.reset();
}

}  // namespace keyward::schema::encoding::scale
