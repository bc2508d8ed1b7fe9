// SPDX-License-Identifier: BSL-1.0
// SPDX-FileCopyrightText: Copyright 2024-2025 Kasumi Hanazuki <kasumi@rollingapple.net>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <tuple>

#include <embrb/embrb.hpp>
#include <gtest/gtest.h>

#include "assert.hpp"

using namespace std::literals;
using namespace embrb::value;
using namespace embrb::literals;

namespace {
  template <typename T> void expect_roundtrip(T value, std::string_view source) {
    auto const ruby_value = embrb::eval(source);
    EXPECT_TRUE(ruby_value.equals(embrb::into_Value(value))) << source;
    EXPECT_EQ(embrb::from_Value<T>(ruby_value), value) << source;
  }
}

TEST(ConvertTest, Primitives) {
  expect_roundtrip(true, "true");
  expect_roundtrip(false, "false");

  expect_roundtrip(std::numeric_limits<signed char>::min(), "-128");
  expect_roundtrip(std::numeric_limits<unsigned char>::max(), "255");
  expect_roundtrip(std::numeric_limits<short>::min(), "-32768");
  expect_roundtrip(std::numeric_limits<unsigned short>::max(), "65535");
  expect_roundtrip(std::numeric_limits<int>::min(), "-2**31");
  expect_roundtrip(std::numeric_limits<unsigned int>::max(), "2**32-1");
  expect_roundtrip(std::numeric_limits<long long>::min(), "-2**63");
  expect_roundtrip(std::numeric_limits<long long>::max(), "2**63-1");
  expect_roundtrip(std::numeric_limits<unsigned long long>::max(), "2**64-1");

  expect_roundtrip(3459834.140625, "3459834.140625");
  expect_roundtrip(std::numeric_limits<double>::infinity(), "Float::INFINITY");
  EXPECT_TRUE(std::isnan(embrb::eval<double>("Float::NAN")));

  EXPECT_FALSE(embrb::eval<bool>("nil"));
  EXPECT_TRUE(embrb::eval<bool>("0"));
}

TEST(ConvertTest, IntegerOutOfRange) {
  EXPECT_RAISE(embrb::builtin::RangeError(), embrb::ErrorKind::RuntimeException,
      embrb::eval<long long>("2**64"));
  EXPECT_RAISE(embrb::builtin::RangeError(), embrb::ErrorKind::HostMessage,
      embrb::eval<signed char>("128"));
  EXPECT_RAISE(embrb::builtin::RangeError(), embrb::ErrorKind::HostMessage,
      embrb::eval<unsigned char>("-1"));
}

TEST(ConvertTest, ImplicitConversionOfTheRuntime) {
  // Integer conversion is delegated to the runtime, which raises for a String.
  EXPECT_RAISE(embrb::builtin::TypeError(), embrb::ErrorKind::RuntimeException,
      embrb::eval<int>("'1'"));
  EXPECT_EQ(embrb::eval<int>("1.9"), 1);
  EXPECT_EQ(embrb::eval<double>("1/2r"), 0.5);
}

TEST(ConvertTest, WrapperTypeMismatch) {
  auto const err = embrb::spec::capture_error([] { embrb::eval<std::string>("1"); });
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind(), embrb::ErrorKind::HostMessage);
  EXPECT_TRUE(err->exception_class().is_same(embrb::builtin::TypeError()));
  EXPECT_EQ(err->message(), "no implicit conversion of Integer into String");
  EXPECT_STREQ(err->what(), "TypeError: no implicit conversion of Integer into String");
  EXPECT_FALSE(err->runtime_exception());

  auto const nil = embrb::spec::capture_error([] { embrb::from_Value<Array>(Value::qnil); });
  ASSERT_TRUE(nil);
  EXPECT_EQ(nil->message(), "no implicit conversion of nil into Array");

  auto const truth = embrb::spec::capture_error([] { embrb::from_Value<Complex>(Value::qtrue); });
  ASSERT_TRUE(truth);
  EXPECT_EQ(truth->message(), "no implicit conversion of true into Complex");

  auto const falsity =
      embrb::spec::capture_error([] { embrb::from_Value<Symbol>(Value::qfalse); });
  ASSERT_TRUE(falsity);
  EXPECT_EQ(falsity->message(), "no implicit conversion of false into Symbol");
}

TEST(ConvertTest, StringEncodings) {
  EXPECT_EQ(embrb::eval<std::string>("'plain'"), "plain");
  EXPECT_EQ(embrb::eval<std::string>("'café'"), "caf\xC3\xA9");

  // Transcoded into UTF-8
  EXPECT_EQ(embrb::eval<std::string>(R"("caf\xE9".force_encoding("ISO-8859-1"))"),
      "caf\xC3\xA9");

  // Binary strings are copied as they are
  EXPECT_EQ(embrb::eval<std::string>(R"("\xFF\x00\xFE".b)"), "\xFF\x00\xFE"s);
}

TEST(ConvertTest, HostStringsAreUtf8) {
  for(auto const value: {embrb::into_Value("café"s), embrb::into_Value("café"sv),
          embrb::into_Value("café")}) {
    EXPECT_EQ(value.send("encoding").send<std::string>("to_s"), "UTF-8");
    EXPECT_EQ(value.send<long>("length"), 4);
    EXPECT_EQ(embrb::from_Value<std::string>(value), "café");
  }
}

TEST(ConvertTest, StringView) {
  auto const str = "borrowed"_str;
  EXPECT_EQ(embrb::from_Value<std::string_view>(str), "borrowed"sv);
}

TEST(ConvertTest, Optional) {
  EXPECT_EQ(embrb::eval<std::optional<int>>("nil"), std::nullopt);
  EXPECT_EQ(embrb::eval<std::optional<int>>("42"), 42);
  EXPECT_TRUE(embrb::into_Value(std::optional<int>()).is_nil());
  EXPECT_TRUE(embrb::into_Value(std::optional<int>(3)).equals(embrb::eval("3")));
}

TEST(ConvertTest, Tuple) {
  auto const [n, s] = embrb::eval<std::tuple<int, std::string>>("[1, 'one']");
  EXPECT_EQ(n, 1);
  EXPECT_EQ(s, "one");

  EXPECT_RAISE(embrb::builtin::ArgumentError(), embrb::ErrorKind::HostMessage,
      (embrb::eval<std::tuple<int, int>>("[1]")));

  auto const ary = embrb::into_Value(std::tuple{1, "two"s});
  EXPECT_EQ(fmt::format("{:#}", ary), "[1, \"two\"]");
}
