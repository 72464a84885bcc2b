#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace tlvtree;

TEST(ExpectedTest, DefaultConstruction) {
  expected<int, std::string> e;
  EXPECT_TRUE(e.has_value());
  EXPECT_TRUE(e);
  EXPECT_EQ(*e, 0);
}

TEST(ExpectedTest, ValueConstruction) {
  expected<int, std::string> e(42);
  EXPECT_TRUE(e.has_value());
  EXPECT_EQ(*e, 42);
  EXPECT_EQ(e.value(), 42);
}

TEST(ExpectedTest, UnexpectedConstruction) {
  expected<int, std::string> e(unexpected("error"));
  EXPECT_FALSE(e.has_value());
  EXPECT_FALSE(e);
  EXPECT_EQ(e.error(), "error");
}

TEST(ExpectedTest, UnexpectConstruction) {
  expected<int, std::string> e(unexpect, "error");
  EXPECT_FALSE(e.has_value());
  EXPECT_EQ(e.error(), "error");
}

TEST(ExpectedTest, ValueOnErrorThrows) {
  expected<int, std::string> e(unexpected("error"));
  EXPECT_THROW((void)e.value(), bad_expected_access);
}

TEST(ExpectedTest, ValueOr) {
  expected<int, std::string> e1(42);
  expected<int, std::string> e2(unexpected("error"));

  EXPECT_EQ(e1.value_or(0), 42);
  EXPECT_EQ(e2.value_or(0), 0);
}

TEST(ExpectedTest, AndThen) {
  auto halve = [](int x) -> expected<int, error_info> {
    if (x % 2 != 0) {
      return make_error(errc::invalid_length, "odd");
    }
    return x / 2;
  };

  expected<int, error_info> e1(10);
  auto r1 = e1.and_then(halve);
  ASSERT_TRUE(r1);
  EXPECT_EQ(*r1, 5);

  auto r2 = r1.and_then(halve);
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error().code, errc::invalid_length);
  EXPECT_EQ(r2.error().detail, "odd");

  expected<int, error_info> e2 = make_error(errc::unknown_tag);
  auto r3 = e2.and_then(halve);
  ASSERT_FALSE(r3);
  EXPECT_EQ(r3.error().code, errc::unknown_tag);
}

TEST(ExpectedTest, Transform) {
  expected<int, std::string> e1(42);
  auto r1 = e1.transform([](int x) { return x * 2; });
  EXPECT_TRUE(r1.has_value());
  EXPECT_EQ(*r1, 84);

  expected<int, std::string> e2(unexpected("error"));
  auto r2 = e2.transform([](int x) { return x * 2; });
  EXPECT_FALSE(r2.has_value());
  EXPECT_EQ(r2.error(), "error");
}

TEST(ExpectedTest, OrElse) {
  expected<int, std::string> e1(42);
  auto r1 = e1.or_else([](std::string const&) { return expected<int, std::string>(0); });
  EXPECT_EQ(*r1, 42);

  expected<int, std::string> e2(unexpected("error"));
  auto r2 = e2.or_else([](std::string const&) { return expected<int, std::string>(999); });
  EXPECT_EQ(*r2, 999);
}

TEST(ExpectedTest, Equality) {
  expected<int, std::string> e1(42);
  expected<int, std::string> e2(42);
  expected<int, std::string> e3(43);
  expected<int, std::string> e4(unexpected(std::string{"error"}));

  EXPECT_EQ(e1, e2);
  EXPECT_NE(e1, e3);
  EXPECT_NE(e1, e4);

  EXPECT_EQ(e1, 42);
  EXPECT_NE(e1, 43);
  EXPECT_EQ(e4, unexpected(std::string{"error"}));
}

TEST(ExpectedTest, ArrowOperator) {
  expected<std::string, int> e(std::in_place, "hello");
  EXPECT_EQ(e->size(), 5U);
}

TEST(ExpectedTest, VoidSuccessAndError) {
  expected<void, error_info> ok{};
  EXPECT_TRUE(ok);
  EXPECT_NO_THROW(ok.value());

  expected<void, error_info> bad = make_error(errc::duplicate_tag, "tag 1");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, errc::duplicate_tag);
  EXPECT_THROW(bad.value(), bad_expected_access);
}

TEST(ExpectedTest, VoidAndThen) {
  expected<void, error_info> ok{};
  auto r1 = ok.and_then([]() -> expected<int, error_info> { return 7; });
  ASSERT_TRUE(r1);
  EXPECT_EQ(*r1, 7);

  expected<void, error_info> bad = make_error(errc::io_error);
  auto r2 = bad.and_then([]() -> expected<int, error_info> { return 7; });
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error().code, errc::io_error);
}
