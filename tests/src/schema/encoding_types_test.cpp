#include <gtest/gtest.h>
#include <keyward/crypto/signing_key.hpp>
#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/schema/key/session_key_state.hpp>
#include <keyward/testing/common.hpp>

#include <algorithm>
#include <memory>

using namespace keyward::schema;
using keyward::testing::kNoon;
using keyward::testing::make_address;

namespace {

using encoder_t = keyward::schema::encoding::encoder<
    keyward::schema::encoding::scale_encoder_tag>;

session_key_state_t make_populated_state() {
  auto state = session_key_state_t{};
  state.session_id = keyward::testing::make_hash(3);
  state.principal = make_address(0x10);
  state.identity.address = make_address(0x40);
  state.config = keyward::testing::make_config(kNoon, 100, 250, 3);
  state.config.max_daily_amount = whole_tokens(1'000);
  state.config.require_user_confirmation = true;
  state.usage.push_back(keyward::testing::make_usage(kNoon + 1, 42));
  state.usage.back().gas_limit = 90'000;
  state.is_active = false;
  state.is_revoked = true;
  state.revoked_at = kNoon + 2;
  state.revoked_reason = "User revoked";
  return state;
}

}  // namespace

TEST(encoding_types, session_key_state_survives_scale) {
  auto encoder = encoder_t{};
  auto state = make_populated_state();

  auto bytes = encoder.encode(state);
  auto decoded = encoder.decode<session_key_state_t>(bytes_view_t{bytes});

  EXPECT_EQ(decoded.session_id, state.session_id);
  EXPECT_EQ(decoded.principal, state.principal);
  EXPECT_EQ(decoded.identity.address, state.identity.address);
  EXPECT_EQ(decoded.config.max_daily_amount, whole_tokens(1'000));
  EXPECT_EQ(decoded.config.max_transaction_count, 3u);
  EXPECT_EQ(decoded.config.allowed_contracts, state.config.allowed_contracts);
  EXPECT_EQ(decoded.config.allowed_methods, state.config.allowed_methods);
  EXPECT_TRUE(decoded.config.require_user_confirmation);
  ASSERT_EQ(decoded.usage.size(), 1u);
  EXPECT_EQ(decoded.usage[0].amount, amount_t{42});
  EXPECT_EQ(decoded.usage[0].gas_limit, 90'000u);
  EXPECT_EQ(decoded.usage[0].reference, state.usage[0].reference);
  EXPECT_TRUE(decoded.is_revoked);
  EXPECT_EQ(decoded.revoked_at, state.revoked_at);
  EXPECT_EQ(decoded.revoked_reason, state.revoked_reason);
}

TEST(encoding_types, signing_capability_is_never_encoded) {
  auto encoder = encoder_t{};
  auto with_key = make_populated_state();
  auto without_key = with_key;
  with_key.identity.capability = keyward::crypto::signing_key::generate();

  EXPECT_EQ(encoder.encode(with_key), encoder.encode(without_key));
  auto decoded = encoder.decode<session_key_state_t>(
      bytes_view_t{encoder.encode(with_key)});
  EXPECT_EQ(decoded.identity.capability, nullptr);
}

TEST(encoding_types, truncated_bytes_fail_to_decode) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_populated_state());
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(
      encoder.try_decode<session_key_state_t>(bytes_view_t{bytes}).has_value());
}

TEST(encoding_types, session_key_storage_key_layout) {
  auto id = keyward::testing::make_hash(0);
  auto key = keyward::schema::key::make_key(id);
  auto prefix = keyward::schema::key::make_session_key_prefix();

  ASSERT_EQ(key.size(), prefix.size() + id.size());
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), key.begin()));
  EXPECT_EQ(make_string_view(prefix), "SESSIONKEY|");
  EXPECT_TRUE(std::equal(id.begin(), id.end(), key.begin() + prefix.size()));
}
