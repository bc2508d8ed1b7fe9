// SPDX-License-Identifier: BSL-1.0
// SPDX-FileCopyrightText: Copyright 2024-2025 Kasumi Hanazuki <kasumi@rollingapple.net>
#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

#include <embrb/embrb.hpp>
#include <gtest/gtest.h>

#include "assert.hpp"

using namespace std::literals;
using namespace embrb::value;
using namespace embrb::literals;

namespace {
  std::string_view view(String str) {
    return static_cast<std::string_view>(str);
  }
}

TEST(ValueTest, Nil) {
  EXPECT_TRUE(Value{}.is_nil());
  EXPECT_TRUE(Value::qnil.is_nil());
  EXPECT_FALSE(Value::qfalse.is_nil());
  EXPECT_FALSE(Value::qfalse.test());
  EXPECT_TRUE(Value::qtrue.test());
  EXPECT_TRUE(Value::qnil.is_kind_of(embrb::builtin::NilClass()));
  EXPECT_EQ(Value::qnil.type(), RUBY_T_NIL);
}

TEST(ValueTest, SameAndEqual) {
  auto const a = embrb::eval("'abc'");
  auto const b = embrb::eval("'abc'");
  EXPECT_FALSE(a.is_same(b));
  EXPECT_TRUE(a.is_same(a));
  EXPECT_TRUE(a.equals(b));

  auto const one = embrb::eval("1");
  auto const one_f = embrb::eval("1.0");
  EXPECT_TRUE(one.equals(one_f));
  EXPECT_FALSE(one.equals(b));
}

TEST(ValueTest, Presentation) {
  auto const str = embrb::eval("'abc'");
  EXPECT_EQ(view(str.to_string()), "abc"sv);
  EXPECT_EQ(view(str.inspect()), "\"abc\""sv);
  EXPECT_EQ(fmt::format("{}", str), "abc");
  EXPECT_EQ(fmt::format("{:#}", str), "\"abc\"");
  EXPECT_EQ(fmt::format("{:#}", Value::qnil), "nil");

  auto const rational = embrb::eval<Rational>("3/4r");
  EXPECT_EQ(fmt::format("{}", rational), "3/4");
  EXPECT_EQ(fmt::format("{:#}", rational), "(3/4)");

  auto const match = embrb::eval<Match>("/b/.match('abc')");
  EXPECT_EQ(fmt::format("{}", match), "b");
  EXPECT_EQ(fmt::format("{:#}", match), "#<MatchData \"b\">");
}

TEST(ValueTest, Freeze) {
  auto const str = "mutable"_str;
  EXPECT_FALSE(str.is_frozen());
  EXPECT_NO_THROW(str.data());

  auto const frozen = str.freeze();
  EXPECT_TRUE(frozen.is_same(str));
  EXPECT_TRUE(str.is_frozen());
  EXPECT_RAISE(embrb::builtin::FrozenError(), embrb::ErrorKind::RuntimeException, str.data());
}

TEST(ValueTest, Literals) {
  auto const bin = "test"_str;
  EXPECT_EQ(bin.size(), 4);
  EXPECT_EQ(embrb::from_Value<std::string>(bin.send("encoding").send("to_s")), "ASCII-8BIT");

  auto const u8 = u8"テスト"_str;
  EXPECT_EQ(u8.size(), 9);
  EXPECT_EQ(u8.send<long>("length"), 3);

  auto const f1 = "frozen"_fstr;
  auto const f2 = "frozen"_fstr;
  EXPECT_TRUE(f1.is_frozen());
  EXPECT_TRUE(f1.is_same(f2));

  EXPECT_TRUE("sym"_sym.is_same(embrb::eval(":sym")));
  EXPECT_TRUE(Symbol("sym").is_same("sym"_sym));
  EXPECT_EQ("sym"_id.as_ID(), "sym"_sym.as_ID());
}

TEST(ValueTest, InternedStrings) {
  auto const a = String::intern_from("interned"s);
  auto const b = String::intern_from("interned");
  EXPECT_TRUE(a.is_frozen());
  EXPECT_TRUE(a.is_same(b));
  EXPECT_EQ(view(a), "interned"sv);

  auto const u8 = String::intern_from(u8"インターン");
  EXPECT_TRUE(u8.is_frozen());
  EXPECT_EQ(embrb::from_Value<std::string>(u8.send("encoding").send("to_s")), "UTF-8");
  EXPECT_EQ(u8.send<long>("length"), 5);
}

TEST(ValueTest, Array) {
  auto const ary = Array::new_array();
  ary.push_back(1).push_back("two"s).push_front(0);
  EXPECT_EQ(ary.size(), 3);
  EXPECT_EQ(ary.at<int>(0), 0);
  EXPECT_EQ(ary.at<std::string>(2), "two");
  EXPECT_TRUE(ary[5].is_nil());

  EXPECT_EQ(ary.pop_back<std::string>(), "two");
  EXPECT_EQ(ary.pop_front<int>(), 0);
  EXPECT_EQ(ary.size(), 1);

  std::array const elements = {"a"_str, "b"_str};
  auto const from_range = Array::new_from(elements);
  EXPECT_EQ(fmt::format("{:#}", from_range), "[\"a\", \"b\"]");

  auto const from_list = Array::new_from({embrb::into_Value(1), Value::qnil});
  EXPECT_EQ(fmt::format("{:#}", from_list), "[1, nil]");

  auto const reserved = Array::new_array(16);
  EXPECT_EQ(reserved.size(), 0);
  reserved.push_back(1.5);
  EXPECT_EQ(reserved.at<double>(0), 1.5);
}

TEST(ValueTest, ModuleAndClass) {
  auto const object = embrb::builtin::Object();
  EXPECT_TRUE(object.const_defined("String"));
  EXPECT_FALSE(object.const_defined("NoSuchConstantHere"));
  EXPECT_TRUE(object.const_get<Class>("String").is_same(embrb::builtin::String()));
  EXPECT_EQ(view(embrb::builtin::String().name()), "String"sv);
  EXPECT_RAISE(embrb::builtin::NameError(), embrb::ErrorKind::RuntimeException,
      object.const_get("NoSuchConstantHere"));

  auto const type_error = embrb::builtin::TypeError();
  EXPECT_TRUE(type_error.is_subclass_of(embrb::builtin::StandardError()));
  EXPECT_FALSE(type_error.is_superclass_of(embrb::builtin::StandardError()));
  EXPECT_TRUE(embrb::builtin::Exception().is_superclass_of(type_error));

  auto const str = embrb::builtin::String().new_instance("made"s);
  EXPECT_EQ(view(str), "made"sv);
  EXPECT_TRUE(str.get_class().is_same(embrb::builtin::String()));
  EXPECT_TRUE(str.is_instance_of(embrb::builtin::String()));
  EXPECT_FALSE(str.is_instance_of(object));
  EXPECT_TRUE(str.is_kind_of(object));
}

TEST(ValueTest, ObjectCapability) {
  auto const str = "ivars"_str;
  EXPECT_FALSE(str.instance_variable_defined("@x"));
  str.instance_variable_set("@x", 42);
  EXPECT_TRUE(str.instance_variable_defined("@x"));
  EXPECT_EQ(str.instance_variable_get<int>("@x"), 42);

  auto const id = str.object_id();
  EXPECT_TRUE(id.equals(str.send("object_id")));

  auto const singleton = str.singleton_class();
  EXPECT_TRUE(singleton.send<bool>("singleton_class?"));

  auto const frozen = "frozen ivars"_str.freeze();
  EXPECT_RAISE(embrb::builtin::FrozenError(), embrb::ErrorKind::RuntimeException,
      frozen.instance_variable_set("@x", 1));
}

TEST(ValueTest, NumericCapability) {
  EXPECT_EQ(embrb::eval<Rational>("3/4r").to_double(), 0.75);
  EXPECT_EQ(embrb::eval<Integer>("2**10").to_double(), 1024.0);
  EXPECT_EQ(embrb::eval<Numeric>("1.5").to_double(), 1.5);
}

TEST(ValueTest, Pinned) {
  embrb::PinnedOpt<String> empty;
  EXPECT_FALSE(empty);

  embrb::Pinned<String> pinned(String::copy_from("kept across GC"s));
  embrb::Pinned<String> copy = pinned;
  embrb::eval("GC.start(full_mark: true, immediate_sweep: true)");
  EXPECT_EQ(view(*copy), "kept across GC"sv);
  EXPECT_EQ(pinned->size(), 14);
}

TEST(ValueTest, Leak) {
  // The slot stays registered for the rest of the process.
  static embrb::Leak<String> leak;
  EXPECT_THROW(leak.get(), std::runtime_error);

  leak = String::copy_from("leaked"s);
  embrb::eval("GC.start(full_mark: true, immediate_sweep: true)");
  EXPECT_EQ(view(*leak), "leaked"sv);
  EXPECT_EQ(leak->size(), 6);

  leak.clear();
  EXPECT_THROW(*leak, std::runtime_error);
  leak.set("again"_str);
  EXPECT_EQ(view(leak.get()), "again"sv);
}

TEST(ValueTest, Builtins) {
  EXPECT_TRUE(embrb::builtin::Complex().is_subclass_of(embrb::builtin::Numeric()));
  EXPECT_TRUE(embrb::builtin::Interrupt().is_subclass_of(embrb::builtin::SignalException()));
  EXPECT_FALSE(embrb::builtin::Interrupt().is_subclass_of(embrb::builtin::StandardError()));
  EXPECT_EQ(view(embrb::builtin::MatchData().name()), "MatchData"sv);

  EXPECT_TRUE(embrb::eval("{}").is_instance_of(embrb::builtin::Hash()));
  EXPECT_TRUE(embrb::eval("/re/").is_instance_of(embrb::builtin::Regexp()));

  EXPECT_RAISE(embrb::builtin::MathDomainError(), embrb::ErrorKind::RuntimeException,
      embrb::eval("Math.sqrt(-1)"));
  EXPECT_RAISE(embrb::builtin::EncodingError(), embrb::ErrorKind::RuntimeException,
      embrb::eval(R"("\xFF".encode("UTF-16"))"));
  EXPECT_RAISE(embrb::builtin::SignalException(), embrb::ErrorKind::RuntimeException,
      embrb::eval("raise SignalException, 'TERM'"));
}
