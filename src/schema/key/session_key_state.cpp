#include <keyward/schema/key/builder.hpp>
#include <keyward/schema/key/session_key_state.hpp>

using namespace keyward::schema;

namespace keyward::schema::key {

bytes_t make_key(const session_id_t& id) {
  auto b = builder{};
  b.write(kSessionKeyPrefix);
  b.write(std::span(id.data(), id.size()));
  return b.data;
}

bytes_t make_key(const session_key_state<1>& value) {
  return make_key(value.session_id);
}

bytes_t make_session_key_prefix() {
  auto b = builder{};
  b.write(kSessionKeyPrefix);
  return b.data;
}

}  // namespace keyward::schema::key
