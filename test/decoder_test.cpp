#include <tlvtree/decoder.hpp>
#include <tlvtree/logger.hpp>
#include <tlvtree/proto/basic.hpp>
#include <tlvtree/record.hpp>

#include <gtest/gtest.h>

#include "test_util.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace tlvtree;
using tlvtree::test_util::concat;
using tlvtree::test_util::from_hex;

namespace {

class decoder_test : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(proto::register_variants(reg_)); }

  auto decode_hex(std::string_view hex, decode_options opts = {})
    -> expected<parse_tree, error_info> {
    return decode(record_type(reg_), memory_source{from_hex(hex)}, 0, opts);
  }

  registry reg_;
};

TEST_F(decoder_test, integer_record) {
  auto t = decode_hex(test_util::integer_record);
  ASSERT_TRUE(t) << t.error().to_string();

  auto const& root = (*t)[t->root()];
  EXPECT_EQ(root.offset, 0U);
  EXPECT_EQ(root.size, 9U);
  EXPECT_EQ((*t)[*t->find("tag")].as_uint(), 0U);
  EXPECT_EQ((*t)[*t->find("length")].as_uint(), 9U);

  auto payload = t->find("payload");
  ASSERT_TRUE(payload);
  EXPECT_EQ((*t)[*payload].as_uint(), 0x12345678U);
  EXPECT_EQ((*t)[*payload].offset, 5U);
  EXPECT_EQ((*t)[*payload].ty.get_kind(), kind::u32);
}

TEST_F(decoder_test, text_record_keeps_embedded_nul) {
  auto t = decode_hex(test_util::text_record);
  ASSERT_TRUE(t) << t.error().to_string();

  EXPECT_EQ((*t)[*t->find("length")].as_uint(), 11U);
  auto const& payload = (*t)[*t->find("payload")];
  EXPECT_EQ(payload.ty.name(), "text[6]");
  EXPECT_EQ(payload.as_string(), std::string("HELLO\0", 6));
}

TEST_F(decoder_test, list_record_dispatches_each_element) {
  auto t = decode(record_type(reg_), memory_source{test_util::list_of_three()});
  ASSERT_TRUE(t) << t.error().to_string();

  EXPECT_EQ((*t)[*t->find("tag")].as_uint(), 2U);
  EXPECT_EQ((*t)[*t->find("length")].as_uint(), 36U);
  EXPECT_EQ((*t)[*t->find("payload.count")].as_uint(), 3U);

  auto elements = t->find("payload.elements");
  ASSERT_TRUE(elements);
  ASSERT_EQ((*t)[*elements].children.size(), 3U);
  EXPECT_EQ((*t)[*elements].ty.count(), 3U);

  for (std::size_t i = 0; i < 3; ++i) {
    auto path = "payload.elements." + std::to_string(i);
    auto value = t->find(path + ".payload");
    ASSERT_TRUE(value) << path;
    EXPECT_EQ((*t)[*value].as_uint(), 305419896U);
    EXPECT_EQ((*t)[*t->find(path)].offset, 9U + 9U * i);
  }
}

TEST_F(decoder_test, unknown_tag_reads_nothing_past_the_tag) {
  test_util::counting_source src{from_hex("07 09 00 00 00 78 56 34 12")};

  auto t = decode(record_type(reg_), src);
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::unknown_tag);
  EXPECT_NE(t.error().detail.find("tag 7"), std::string::npos);
  EXPECT_EQ(src.furthest(), 1U);
  EXPECT_EQ(src.bytes_read(), 1U);
}

TEST_F(decoder_test, unknown_tag_wins_over_short_record) {
  // Header only: the declared 9 bytes are not there.
  auto header = decode_hex("07 09 00 00 00");
  ASSERT_FALSE(header);
  EXPECT_EQ(header.error().code, errc::unknown_tag);

  // Tag only: not even a length.
  auto tag = decode_hex("07");
  ASSERT_FALSE(tag);
  EXPECT_EQ(tag.error().code, errc::unknown_tag);
  EXPECT_NE(tag.error().detail.find("while resolving length"), std::string::npos);
}

TEST_F(decoder_test, record_longer_than_source_is_truncated) {
  auto t = decode_hex("00 09 00 00 00 78 56");
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::truncated_input);
  EXPECT_EQ(t.error().cause_ec, errc::out_of_range);
}

TEST_F(decoder_test, truncated_header_is_truncated) {
  auto t = decode_hex("00 09 00");
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::truncated_input);
  EXPECT_EQ(t.error().cause_ec, errc::out_of_range);
  EXPECT_NE(t.error().detail.find("length"), std::string::npos);
}

TEST_F(decoder_test, truncated_list_is_truncated) {
  auto data = test_util::list_of_three();
  data.resize(data.size() - 2);

  auto t = decode(record_type(reg_), memory_source{data});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::truncated_input);
}

TEST_F(decoder_test, length_smaller_than_header_is_invalid) {
  auto t = decode_hex("01 03 00 00 00");
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::invalid_length);
  EXPECT_NE(t.error().detail.find("while resolving payload"), std::string::npos);
}

TEST_F(decoder_test, length_mismatch_is_rejected_by_default) {
  auto t = decode_hex("00 0A 00 00 00 78 56 34 12 FF");
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::length_mismatch);
}

namespace capture {
std::vector<std::string> warnings;
void sink(void*, log_context const& ctx) {
  if (ctx.level == log_level::warning) {
    warnings.emplace_back(ctx.message);
  }
}
}  // namespace capture

TEST_F(decoder_test, length_mismatch_is_logged_under_trust_policy) {
  capture::warnings.clear();
  set_log_function(&capture::sink);
  set_log_level(log_level::warning);

  auto t = decode_hex("00 0A 00 00 00 78 56 34 12 FF", decode_options{.lengths = length_policy::trust});

  set_log_function(nullptr);
  set_log_level(log_level::off);

  ASSERT_TRUE(t) << t.error().to_string();
  EXPECT_EQ((*t)[t->root()].size, 9U);
  EXPECT_EQ((*t)[*t->find("length")].as_uint(), 10U);
  ASSERT_EQ(capture::warnings.size(), 1U);
  EXPECT_NE(capture::warnings[0].find("declares 10 bytes, decoded 9"), std::string::npos);
}

TEST_F(decoder_test, array_count_limit) {
  auto t = decode_hex("02 09 00 00 00 05 00 00 00", decode_options{.max_array_count = 2});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::count_limit_exceeded);
}

TEST_F(decoder_test, nesting_depth_limit) {
  auto data = concat(from_hex("02 12 00 00 00 01 00 00 00"), from_hex(test_util::integer_record));

  auto ok = decode(record_type(reg_), memory_source{data});
  ASSERT_TRUE(ok) << ok.error().to_string();

  auto t = decode(record_type(reg_), memory_source{data}, 0, decode_options{.max_depth = 3});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::nesting_too_deep);
}

class sequence_decoder_test : public decoder_test {
 protected:
  void SetUp() override {
    decoder_test::SetUp();
    ASSERT_TRUE(reg_.add({.tag = 3, .name = "sequence", .payload = record_sequence_type(reg_)}));
  }
};

TEST_F(sequence_decoder_test, elements_fill_the_record_length) {
  auto data = concat(concat(from_hex("03 19 00 00 00"), from_hex(test_util::integer_record)),
                     from_hex(test_util::text_record));

  auto t = decode(record_type(reg_), memory_source{data});
  ASSERT_TRUE(t) << t.error().to_string();

  auto const& payload = (*t)[*t->find("payload")];
  EXPECT_TRUE(payload.ty.is_byte_bounded());
  EXPECT_EQ(payload.ty.name(), "array<record>{20}");
  EXPECT_EQ(payload.size, 20U);
  ASSERT_EQ(payload.children.size(), 2U);
  EXPECT_EQ((*t)[*t->find("payload.1")].offset, 14U);
  EXPECT_EQ((*t)[*t->find("payload.1.payload")].as_string(), std::string("HELLO\0", 6));
}

TEST_F(sequence_decoder_test, empty_extent_has_no_elements) {
  auto t = decode_hex("03 05 00 00 00");
  ASSERT_TRUE(t) << t.error().to_string();
  EXPECT_TRUE((*t)[*t->find("payload")].children.empty());
}

TEST_F(sequence_decoder_test, element_running_past_extent_is_length_mismatch) {
  // Extent is 12 bytes; the second element needs 9 from offset 14.
  auto data = concat(concat(from_hex("03 11 00 00 00"), from_hex(test_util::integer_record)),
                     from_hex(test_util::integer_record));

  auto t = decode(record_type(reg_), memory_source{data});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::length_mismatch);
  EXPECT_NE(t.error().detail.find("spans 12 bytes"), std::string::npos);
}

TEST_F(sequence_decoder_test, element_limit_applies_without_count) {
  auto data = from_hex("03 17 00 00 00");
  for (int i = 0; i < 2; ++i) {
    data = concat(std::move(data), from_hex(test_util::integer_record));
  }

  auto t = decode(record_type(reg_), memory_source{data}, 0, decode_options{.max_array_count = 1});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::count_limit_exceeded);
}

TEST_F(decoder_test, unbounded_array_cannot_be_decoded) {
  schema s{"items"};
  s.add("values", type::array(type::u8()));

  auto t = decode(make_structure(std::move(s)), memory_source{from_hex("01 02")});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::schema_mismatch);
}

TEST_F(decoder_test, resolver_can_bound_an_array_by_bytes) {
  schema s{"bytes_then_tail"};
  s.add("extent", type::u8());
  s.add("values", [](field_view const& fields) -> expected<type, error_info> {
    auto extent = fields.uint("extent");
    if (!extent) {
      return unexpected(extent.error());
    }
    return type::array(type::u16()).with_size(static_cast<std::size_t>(*extent));
  });
  s.add("tail", type::u8());

  auto t = decode(make_structure(std::move(s)), memory_source{from_hex("04 01 00 02 00 FF")});
  ASSERT_TRUE(t) << t.error().to_string();
  auto const& values = (*t)[*t->find("values")];
  ASSERT_EQ(values.children.size(), 2U);
  EXPECT_EQ((*t)[values.children[1]].as_uint(), 2U);
  EXPECT_EQ((*t)[*t->find("tail")].as_uint(), 0xFFU);
}

TEST_F(decoder_test, flat_list_decodes_every_element) {
  constexpr std::uint32_t n = 100'000;
  bytes data{};
  data.reserve(9 + 9 * n);
  store_le(data, 2, 1);
  store_le(data, 9 + 9 * std::uint64_t{n}, 4);
  store_le(data, n, 4);
  auto element = from_hex(test_util::integer_record);
  for (std::uint32_t i = 0; i < n; ++i) {
    data.insert(data.end(), element.begin(), element.end());
  }

  auto t = decode(record_type(reg_), memory_source{std::move(data)});
  ASSERT_TRUE(t) << t.error().to_string();
  auto elements = t->find("payload.elements");
  ASSERT_TRUE(elements);
  ASSERT_EQ((*t)[*elements].children.size(), n);
  EXPECT_EQ((*t)[(*t)[*elements].children.back()].offset, 9U + 9U * (n - 1));
}

TEST_F(decoder_test, decode_at_offset_records_source_offsets) {
  auto data = concat(from_hex("AA BB CC"), from_hex(test_util::integer_record));

  auto t = decode(record_type(reg_), memory_source{data}, 3);
  ASSERT_TRUE(t) << t.error().to_string();
  EXPECT_EQ((*t)[t->root()].offset, 3U);
  EXPECT_EQ((*t)[*t->find("payload")].offset, 8U);
}

TEST_F(decoder_test, decodes_from_file) {
  auto path = std::filesystem::temp_directory_path() / "tlvtree_decoder_test.bin";
  {
    auto data = test_util::list_of_three();
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<char const*>(data.data()), static_cast<std::streamsize>(data.size()));
  }

  auto t = decode(record_type(reg_), file_source{path});
  std::filesystem::remove(path);

  ASSERT_TRUE(t) << t.error().to_string();
  EXPECT_EQ((*t)[*t->find("payload.count")].as_uint(), 3U);
}

TEST_F(decoder_test, missing_file_is_io_error) {
  auto t = decode(record_type(reg_),
                  file_source{std::filesystem::temp_directory_path() / "tlvtree_missing.bin"});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::io_error);
  EXPECT_TRUE(static_cast<bool>(t.error().cause_ec));
}

// A schema that is not record-shaped: fixed block, count byte, counted array, sized tail.
TEST(decoder_schema_test, resolved_array_and_sized_block) {
  schema s{"header"};
  s.add("magic", type::block(2));
  s.add("n", type::u8(), field_role::element_count);
  s.add("values", [](field_view const& fields) -> expected<type, error_info> {
    auto n = fields.uint("n");
    if (!n) {
      return unexpected(n.error());
    }
    return type::array(type::u16(), static_cast<std::uint32_t>(*n));
  });
  s.add("tail", type::text(3));
  auto header = make_structure(std::move(s));

  memory_source src{from_hex("CA FE 02 01 00 02 01 61 62 63")};
  auto t = decode(header, src);
  ASSERT_TRUE(t) << t.error().to_string();

  EXPECT_EQ((*t)[*t->find("magic")].as_bytes(), (bytes{0xCA, 0xFE}));
  EXPECT_EQ((*t)[*t->find("values.0")].as_uint(), 1U);
  EXPECT_EQ((*t)[*t->find("values.1")].as_uint(), 0x0102U);
  EXPECT_EQ((*t)[*t->find("tail")].as_string(), "abc");
  EXPECT_EQ((*t)[t->root()].size, 10U);
}

TEST(decoder_schema_test, dynamic_leaf_without_resolver_is_schema_mismatch) {
  schema s{"bad"};
  s.add("body", type::block());
  auto t = decode(make_structure(std::move(s)), memory_source{bytes{1, 2, 3}});
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().code, errc::schema_mismatch);
}

}  // namespace
