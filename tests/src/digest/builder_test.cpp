#include <gtest/gtest.h>
#include <relay/digest/builder.hpp>
#include <relay/testing/common.hpp>

#include <algorithm>
#include <utility>

namespace {

using relay::testing::make_address;

relay::schema::transfer_intent_t base_intent() {
  return relay::digest::make_intent(
      make_address(0x10), relay::schema::amount_t{10}, make_address(0x30),
      make_address(0x50), relay::schema::nonce_t{1});
}

}  // namespace

TEST(digest_builder, encoding_is_fixed_width_and_ordered) {
  auto intent = base_intent();
  auto encoded = relay::digest::encode_intent(intent);
  ASSERT_EQ(encoded.size(), relay::digest::kEncodedIntentSize);

  auto offset = relay::digest::kIntentDomain.size();
  EXPECT_TRUE(std::equal(relay::digest::kIntentDomain.begin(),
                         relay::digest::kIntentDomain.end(), encoded.begin()));
  EXPECT_TRUE(std::equal(intent.sender.begin(), intent.sender.end(),
                         encoded.begin() + offset));
  offset += 20;
  // amount = 10, big endian in 32 bytes
  EXPECT_EQ(encoded[offset + 31], 10);
  EXPECT_EQ(encoded[offset], 0);
  offset += 32;
  EXPECT_TRUE(std::equal(intent.recipient.begin(), intent.recipient.end(),
                         encoded.begin() + offset));
  offset += 20;
  EXPECT_TRUE(std::equal(intent.token.begin(), intent.token.end(),
                         encoded.begin() + offset));
  offset += 20;
  EXPECT_EQ(encoded[offset + 31], 1);
}

TEST(digest_builder, same_tuple_gives_same_digest) {
  auto first = relay::digest::compute_digest(base_intent());
  auto second = relay::digest::compute_digest(base_intent());
  EXPECT_EQ(first, second);

  auto intent = base_intent();
  EXPECT_EQ(first, relay::digest::compute_digest(intent.sender, intent.amount,
                                                 intent.recipient, intent.token,
                                                 intent.nonce));
}

TEST(digest_builder, every_field_changes_the_digest) {
  auto base = relay::digest::compute_digest(base_intent());

  auto nonce_zero = base_intent();
  nonce_zero.nonce = 0;
  auto nonce_one = base_intent();
  nonce_one.nonce = 1;
  EXPECT_NE(relay::digest::compute_digest(nonce_zero),
            relay::digest::compute_digest(nonce_one));

  auto amount_zero = base_intent();
  amount_zero.amount = 0;
  auto amount_max = base_intent();
  amount_max.amount = relay::schema::max_amount();
  EXPECT_NE(relay::digest::compute_digest(amount_zero),
            relay::digest::compute_digest(amount_max));
  EXPECT_NE(relay::digest::compute_digest(amount_zero), base);

  auto other_recipient = base_intent();
  other_recipient.recipient = make_address(0x31);
  EXPECT_NE(relay::digest::compute_digest(other_recipient), base);

  auto other_sender = base_intent();
  other_sender.sender = make_address(0x11);
  EXPECT_NE(relay::digest::compute_digest(other_sender), base);

  auto other_token = base_intent();
  other_token.token = make_address(0x51);
  EXPECT_NE(relay::digest::compute_digest(other_token), base);
}

TEST(digest_builder, swapping_sender_and_recipient_changes_the_digest) {
  auto intent = base_intent();
  auto swapped = intent;
  std::swap(swapped.sender, swapped.recipient);
  EXPECT_NE(relay::digest::compute_digest(intent),
            relay::digest::compute_digest(swapped));
}

TEST(digest_builder, personal_message_digest_is_a_distinct_hash) {
  auto digest = relay::digest::compute_digest(base_intent());
  auto signed_digest = relay::digest::personal_message_digest(digest);
  EXPECT_NE(signed_digest, digest);
  EXPECT_EQ(signed_digest, relay::digest::personal_message_digest(digest));
}

TEST(digest_builder, digest_matches_known_vector) {
  EXPECT_EQ(
      relay::schema::to_hex(relay::digest::compute_digest(base_intent())),
      "7033fa8d622e122e8ad7a48a0deebed4598909480f545fba97c6325e8697f600");

  auto sender = relay::schema::try_make_address(
      "7e5f4552091a69125d5dfcb7b8c2659029395bdf");
  ASSERT_TRUE(sender.has_value());
  EXPECT_EQ(relay::schema::to_hex(relay::digest::compute_digest(
                *sender, relay::schema::amount_t{10}, make_address(0x30),
                make_address(0x50), relay::schema::nonce_t{1})),
            "680a2a003cb66261d600978fe3687b8cc3fc0e10a37321757a3dc8314b20580c");
}

TEST(digest_builder, personal_message_digest_matches_known_vector) {
  auto digest = relay::digest::compute_digest(base_intent());
  EXPECT_EQ(
      relay::schema::to_hex(relay::digest::personal_message_digest(digest)),
      "27e0e9f06ba4433902963661f751533e723d82be4a559f69e26c245aa5f47305");
}
