#include <tlvtree/builder.hpp>
#include <tlvtree/encoder.hpp>
#include <tlvtree/proto/basic.hpp>
#include <tlvtree/record.hpp>

#include <gtest/gtest.h>

#include "test_util.hpp"

using namespace tlvtree;
using tlvtree::test_util::from_hex;

namespace {

class builder_test : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(proto::register_variants(reg_)); }

  registry reg_;
};

TEST_F(builder_test, allocates_integer_record_without_source) {
  auto t = allocate(record_type(reg_), {proto::integer_tag, 9, 0x12345678});
  ASSERT_TRUE(t) << t.error().to_string();

  EXPECT_EQ((*t)[t->root()].size, 9U);
  EXPECT_EQ((*t)[*t->find("payload")].offset, 5U);
  EXPECT_EQ((*t)[*t->find("payload")].ty.get_kind(), kind::u32);

  auto out = serialize(*t);
  ASSERT_TRUE(out);
  EXPECT_EQ(*out, from_hex(test_util::integer_record));
}

TEST_F(builder_test, dynamic_payload_is_sized_from_length) {
  auto t = allocate(record_type(reg_), {proto::text_tag, 11, bytes{'H', 'E', 'L', 'L', 'O', 0}});
  ASSERT_TRUE(t) << t.error().to_string();

  auto const& payload = (*t)[*t->find("payload")];
  EXPECT_EQ(payload.ty.name(), "text[6]");
  EXPECT_EQ(payload.size, 6U);

  auto out = serialize(*t);
  ASSERT_TRUE(out);
  EXPECT_EQ(*out, from_hex(test_util::text_record));
}

TEST_F(builder_test, payload_disagreeing_with_length_is_schema_mismatch) {
  auto t = allocate(record_type(reg_), {proto::text_tag, 8, "HELLO"});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::schema_mismatch);
}

TEST_F(builder_test, unknown_tag_fails_like_decoding) {
  auto t = allocate(record_type(reg_), {9, 9, 0});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::unknown_tag);
}

TEST_F(builder_test, integer_out_of_width_is_schema_mismatch) {
  auto t = allocate(record_type(reg_), {256, 9, 0});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::schema_mismatch);
  EXPECT_NE(t.error().detail.find("tag"), std::string::npos);
}

TEST_F(builder_test, wrong_field_count_is_schema_mismatch) {
  auto t = allocate(record_type(reg_), {proto::integer_tag, 9});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::schema_mismatch);
}

TEST_F(builder_test, leaf_given_children_is_schema_mismatch) {
  auto t = allocate(type::u32(), {1, 2});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::schema_mismatch);

  auto s = allocate(type::array(type::u8()), init(5));
  ASSERT_FALSE(s);
  EXPECT_EQ(s.error().code, errc::schema_mismatch);
}

TEST(builder_array_test, array_count_follows_initializers) {
  auto t = allocate(type::array(type::u16()), {1, 2, 3});
  ASSERT_TRUE(t) << t.error().to_string();

  EXPECT_EQ((*t)[t->root()].ty.count(), 3U);
  EXPECT_EQ((*t)[t->root()].size, 6U);
  EXPECT_EQ((*t)[*t->find("2")].offset, 4U);

  auto fixed = allocate(type::array(type::u16(), 2), {1, 2, 3});
  ASSERT_FALSE(fixed);
  EXPECT_EQ(fixed.error().code, errc::schema_mismatch);
}

TEST(builder_array_test, sized_block_requires_exact_bytes) {
  auto ok = allocate(type::block(2), init(bytes{1, 2}));
  ASSERT_TRUE(ok);

  auto bad = allocate(type::block(2), init(bytes{1, 2, 3}));
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, errc::schema_mismatch);
}

TEST(builder_array_test, composite_helper_builds_children) {
  std::vector<init> items;
  for (int i = 0; i < 4; ++i) {
    items.emplace_back(i);
  }
  auto t = allocate(type::array(type::u8()), init::composite(std::move(items)));
  ASSERT_TRUE(t);
  EXPECT_EQ((*t)[t->root()].children.size(), 4U);
}

}  // namespace
