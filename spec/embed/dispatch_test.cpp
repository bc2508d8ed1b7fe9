// SPDX-License-Identifier: BSL-1.0
// SPDX-FileCopyrightText: Copyright 2024-2025 Kasumi Hanazuki <kasumi@rollingapple.net>
#include <algorithm>
#include <array>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <embrb/embrb.hpp>
#include <gtest/gtest.h>

#include "assert.hpp"

using namespace std::literals;
using namespace embrb::value;

namespace {
  template <typename... F> struct overloaded: F... {
    using F::operator()...;
  };

  std::string_view kind_of(std::string_view source) {
    return std::visit(overloaded{
                          [](Integer) { return "Integer"sv; },
                          [](Float) { return "Float"sv; },
                          [](Rational) { return "Rational"sv; },
                          [](Complex) { return "Complex"sv; },
                          [](Match) { return "Match"sv; },
                          [](String) { return "String"sv; },
                          [](Symbol) { return "Symbol"sv; },
                          [](Array) { return "Array"sv; },
                          [](Value) { return "Value"sv; },
                      },
        embrb::classify(embrb::eval(source)));
  }

  // One sample of every built-in type tag the wrappers care about, and some they do not.
  std::array const samples = {
    "nil",
    "true",
    "false",
    "42",
    "2**100",
    "1.5",
    "1e300",
    "3/4r",
    "Complex(1, 2)",
    "/b/.match('abc')",
    "'str'",
    ":sym",
    "'dyn'.+('amic').to_sym",
    "[1, 2]",
    "{a: 1}",
    "String",
    "Kernel",
    "proc { }",
    "->() { }",
    "StandardError.new",
    "Object.new",
    "Class.new(Numeric).new",
  };

  template <typename W, typename V> struct is_alternative;
  template <typename W, typename... Ts>
  struct is_alternative<W, std::variant<Ts...>>
      : std::bool_constant<(std::is_same_v<W, Ts> || ...)> {};

  template <typename W> void expect_narrowing(auto expected) {
    for(auto const source: samples) {
      auto const sample = embrb::eval(source);
      auto const narrowed = W::from_value(sample);
      EXPECT_EQ(narrowed.has_value(), expected(sample)) << W::class_name << " from " << source;

      if constexpr(is_alternative<W, embrb::Classified>::value) {
        EXPECT_EQ(std::holds_alternative<W>(embrb::classify(sample)), narrowed.has_value())
            << W::class_name << " from " << source;
      }

      if(narrowed) {
        // Upcast and narrow again
        Value const upcast = *narrowed;
        EXPECT_TRUE(upcast.is_same(sample)) << source;
        auto const again = W::from_value(upcast);
        ASSERT_TRUE(again) << source;
        EXPECT_TRUE(again->is_same(sample)) << source;
      }
    }
  }

  template <typename W> void expect_narrowing_by_tag(std::initializer_list<ruby_value_type> tags) {
    expect_narrowing<W>(
        [tags](Value v) { return std::find(tags.begin(), tags.end(), v.type()) != tags.end(); });
  }

  template <typename W, typename K> void expect_narrowing_by_kind(ClassT<K> klass) {
    expect_narrowing<W>([klass](Value v) { return v.is_kind_of(klass); });
  }
}

TEST(DispatchTest, NarrowingFollowsTypeTag) {
  expect_narrowing_by_tag<Integer>({RUBY_T_FIXNUM, RUBY_T_BIGNUM});
  expect_narrowing_by_tag<Float>({RUBY_T_FLOAT});
  expect_narrowing_by_tag<Rational>({RUBY_T_RATIONAL});
  expect_narrowing_by_tag<Complex>({RUBY_T_COMPLEX});
  expect_narrowing_by_tag<Match>({RUBY_T_MATCH});
  expect_narrowing_by_tag<String>({RUBY_T_STRING});
  expect_narrowing_by_tag<Symbol>({RUBY_T_SYMBOL});
  expect_narrowing_by_tag<Array>({RUBY_T_ARRAY});
  expect_narrowing_by_tag<Module>({RUBY_T_MODULE, RUBY_T_CLASS});
  expect_narrowing_by_tag<Class>({RUBY_T_CLASS});
}

TEST(DispatchTest, NarrowingFollowsClass) {
  expect_narrowing_by_kind<Numeric>(embrb::builtin::Numeric());
  expect_narrowing_by_kind<Proc>(embrb::builtin::Proc());
  expect_narrowing_by_kind<Exception>(embrb::builtin::Exception());
}

TEST(DispatchTest, Classify) {
  EXPECT_EQ(kind_of("42"), "Integer"sv);
  EXPECT_EQ(kind_of("2**100"), "Integer"sv);
  EXPECT_EQ(kind_of("1.5"), "Float"sv);
  EXPECT_EQ(kind_of("1e300 * 10"), "Float"sv);
  EXPECT_EQ(kind_of("3/4r"), "Rational"sv);
  EXPECT_EQ(kind_of("Complex(1, 2)"), "Complex"sv);
  EXPECT_EQ(kind_of("/b/.match('abc')"), "Match"sv);
  EXPECT_EQ(kind_of("'str'"), "String"sv);
  EXPECT_EQ(kind_of(":sym"), "Symbol"sv);
  EXPECT_EQ(kind_of("[1, 2]"), "Array"sv);
  EXPECT_EQ(kind_of("nil"), "Value"sv);
  EXPECT_EQ(kind_of("{}"), "Value"sv);
  EXPECT_EQ(kind_of("Class.new(Numeric).new"), "Value"sv);
}

TEST(DispatchTest, ClassifiedValueIsUsable) {
  auto const classified = embrb::classify(embrb::eval("Complex(3, 4)"));
  ASSERT_TRUE(std::holds_alternative<Complex>(classified));
  EXPECT_EQ(std::get<Complex>(classified).abs(), 5.0);
}

TEST(DispatchTest, CheckedNarrowing) {
  EXPECT_TRUE(Integer::from_value(embrb::eval("1")));
  EXPECT_FALSE(Integer::from_value(embrb::eval("1.0")));
  EXPECT_TRUE(Float::from_value(embrb::eval("1.0")));
  EXPECT_FALSE(Float::from_value(embrb::eval("1")));
  EXPECT_FALSE(Rational::from_value(embrb::eval("1")));
  EXPECT_FALSE(Complex::from_value(embrb::eval("1")));
  EXPECT_FALSE(Match::from_value(embrb::eval("'b'")));
  EXPECT_FALSE(String::from_value(Value::qnil));

  EXPECT_TRUE(Numeric::from_value(embrb::eval("Class.new(Numeric).new")));
  EXPECT_TRUE(Numeric::from_value(embrb::eval("2**100")));
  EXPECT_FALSE(Numeric::from_value(embrb::eval("'1'")));

  EXPECT_TRUE(Module::from_value(embrb::eval("Kernel")));
  EXPECT_TRUE(Module::from_value(embrb::eval("String")));
  EXPECT_FALSE(Class::from_value(embrb::eval("Kernel")));
  EXPECT_TRUE(Class::from_value(embrb::eval("String")));

  EXPECT_TRUE(Exception::from_value(embrb::eval("StandardError.new")));
  EXPECT_FALSE(Exception::from_value(embrb::eval("StandardError")));

  auto const lambda = Proc::from_value(embrb::eval("->(x) { x }"));
  ASSERT_TRUE(lambda);
  EXPECT_TRUE(lambda->is_lambda());
  EXPECT_FALSE(embrb::eval<Proc>("proc { }").is_lambda());
  EXPECT_FALSE(Proc::from_value(embrb::eval("method(:puts)")));
}

TEST(DispatchTest, Integer) {
  auto const small = Integer::from_i64(-42);
  EXPECT_TRUE(small.is_fixnum());
  EXPECT_EQ(small.to_i64(), -42);

  auto const big = Integer::from_u64(std::numeric_limits<std::uint64_t>::max());
  EXPECT_FALSE(big.is_fixnum());
  EXPECT_EQ(fmt::format("{}", big), "18446744073709551615");
  EXPECT_RAISE(embrb::builtin::RangeError(), embrb::ErrorKind::RuntimeException, big.to_i64());

  auto const min = Integer::from_i64(std::numeric_limits<std::int64_t>::min());
  EXPECT_EQ(min.to_i64(), std::numeric_limits<std::int64_t>::min());
}

TEST(DispatchTest, Float) {
  auto const f = Float::from_f64(0.1);
  EXPECT_EQ(f.to_f64(), 0.1);
  EXPECT_EQ(fmt::format("{}", f), "0.1");

  auto const heap = Float::from_f64(1e300);
  EXPECT_EQ(heap.to_f64(), 1e300);
  EXPECT_EQ(heap.to_double(), 1e300);
}
