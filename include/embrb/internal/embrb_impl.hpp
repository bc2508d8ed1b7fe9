// SPDX-License-Identifier: BSL-1.0
// SPDX-FileCopyrightText: Copyright 2024-2025 Kasumi Hanazuki <kasumi@rollingapple.net>
#pragma once

#include <atomic>
#include <concepts>
#include <cstdlib>
#include <exception>
#include <ranges>
#include <stdexcept>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <embrb/internal/embrb.hpp>

#if HAVE_CXXABI_H
#include <cxxabi.h>
#endif

namespace embrb {
  namespace detail {
    /// Calls the function under `rb_protect`.
    ///
    /// The function must not throw C++ exceptions.
    template <typename F> inline VALUE protect_raw(F &callback, int &state) noexcept {
      return ::rb_protect(
          [](VALUE callback) -> VALUE { return (*reinterpret_cast<F *>(callback))(); },
          reinterpret_cast<VALUE>(&callback), &state);
    }

    inline void check_jump_tag(int state) {
      switch(state) {
      case tag_none:
        return;
      case tag_raise: {
        auto const err = detail::unsafe_coerce<Exception>(::rb_errinfo());
        ::rb_set_errinfo(RUBY_Qnil);
        throw Error(err);
      }
      default:
        throw Error(static_cast<JumpTag>(state));
      }
    }

    inline std::string_view jump_tag_name(JumpTag tag) noexcept {
      switch(tag) {
      case tag_return:
        return "return";
      case tag_break:
        return "break";
      case tag_next:
        return "next";
      case tag_retry:
        return "retry";
      case tag_redo:
        return "redo";
      case tag_throw:
        return "throw";
      case tag_fatal:
        return "fatal";
      default:
        return "unknown";
      }
    }

    /**
     * Converts anything into ID.
     *
     * Do not store the return value. Dynamic IDs may be garbage-collected.
     */
    template <concepts::Identifier I> inline decltype(auto) into_ID(I &&id) {
      if constexpr(requires {
                     { id.as_ID() } noexcept -> std::same_as<ID>;
                   }) {
        return id.as_ID();
      } else {
        return Symbol(std::forward<decltype(id)>(id)).as_ID();
      }
    }

    inline std::string_view conversion_source_name(Value value) {
      switch(value.as_VALUE()) {
      case RUBY_Qnil:
        return "nil";
      case RUBY_Qtrue:
        return "true";
      case RUBY_Qfalse:
        return "false";
      default:
        return ::rb_obj_classname(value.as_VALUE());
      }
    }

    inline Error conversion_error(Value value, std::string_view into) {
      return Error::format(builtin::TypeError(), "no implicit conversion of {} into {}",
          conversion_source_name(value), into);
    }

    /// Reads the message of an exception object without letting a secondary exception escape.
    ///
    inline std::string exception_message(VALUE exception) {
      int state = 0;
      auto fetch = [exception]() noexcept -> VALUE {
        return ::rb_obj_as_string(::rb_funcallv(exception, rb_intern("message"), 0, nullptr));
      };
      VALUE const message = protect_raw(fetch, state);
      if(state == tag_none) {
        return std::string(RSTRING_PTR(message), RSTRING_LEN(message));
      }
      if(state != tag_raise) {
        return "(message unavailable: non-local jump)";
      }
      VALUE const secondary = ::rb_errinfo();
      ::rb_set_errinfo(RUBY_Qnil);
      return fmt::format("(message unavailable: {})", ::rb_obj_classname(secondary));
    }
  }

  template <std::invocable<> F> inline auto protect(F &&functor) -> std::invoke_result_t<F> {
    using Result = std::invoke_result_t<F>;
    int state = 0;
    std::exception_ptr cxx_exception;

    if constexpr(std::is_void_v<Result>) {
      auto callback = [&functor, &cxx_exception]() noexcept -> VALUE {
        try {
          std::invoke(functor);
        } catch(...) {
          cxx_exception = std::current_exception();
        }
        return RUBY_Qnil;
      };
      detail::protect_raw(callback, state);
      if(cxx_exception) {
        std::rethrow_exception(cxx_exception);
      }
      detail::check_jump_tag(state);
    } else {
      std::optional<Result> result;
      auto callback = [&functor, &result, &cxx_exception]() noexcept -> VALUE {
        try {
          result.emplace(std::invoke(functor));
        } catch(...) {
          cxx_exception = std::current_exception();
        }
        return RUBY_Qnil;
      };
      detail::protect_raw(callback, state);
      if(cxx_exception) {
        std::rethrow_exception(cxx_exception);
      }
      detail::check_jump_tag(state);
      return std::move(*result);
    }
  }

  namespace convert {
    template <typename T> inline Value into_Value(T value) {
      if constexpr(std::convertible_to<T, Value>) {
        return value;
      } else {
        return IntoValue<std::decay_t<T>>().convert(value);
      }
    }
    template <typename T> inline auto from_Value(Value value) -> auto {
      if constexpr(std::convertible_to<Value, T>) {
        return value;
      } else {
        return FromValue<std::remove_reference_t<T>>().convert(value);
      }
    }

    template <concepts::CheckedValue T> inline T FromValue<T>::convert(Value value) {
      if(auto const v = T::from_value(value)) {
        return *v;
      }
      throw detail::conversion_error(value, T::class_name);
    }

    inline bool FromValue<bool>::convert(Value value) {
      return RB_TEST(value.as_VALUE());
    }
    inline Value IntoValue<bool>::convert(bool value) {
      return detail::unsafe_coerce<Value>(value ? RUBY_Qtrue : RUBY_Qfalse);
    };

    inline signed char FromValue<signed char>::convert(Value value) {
      int const v = protect([x = value.as_VALUE()] { return RB_NUM2INT(x); });
      signed char const r = static_cast<signed char>(v);
      if(v != static_cast<int>(r)) {
        throw Error::format(builtin::RangeError(),
            "integer {} too {} to convert to 'signed char'", v, v < 0 ? "small" : "big");
      }
      return r;
    }
    inline Value IntoValue<signed char>::convert(signed char value) {
      return detail::unsafe_coerce<Value>(RB_INT2FIX(value));
    };

    inline unsigned char FromValue<unsigned char>::convert(Value value) {
      int const v = protect([x = value.as_VALUE()] { return RB_NUM2INT(x); });
      unsigned char const r = static_cast<unsigned char>(v);
      if(v != static_cast<int>(r)) {
        throw Error::format(builtin::RangeError(),
            "integer {} too {} to convert to 'unsigned char'", v, v < 0 ? "small" : "big");
      }
      return r;
    }
    inline Value IntoValue<unsigned char>::convert(unsigned char value) {
      return detail::unsafe_coerce<Value>(RB_INT2FIX(value));
    };

#define EMBRB_DEFINE_CONV(TYPE, FROM_VALUE, INTO_VALUE)                                            \
  inline TYPE FromValue<TYPE>::convert(Value value) {                                              \
    return protect([v = value.as_VALUE()] { return static_cast<TYPE>(FROM_VALUE(v)); });           \
  }                                                                                                \
  inline Value IntoValue<TYPE>::convert(TYPE value) {                                              \
    return detail::unsafe_coerce<Value>(protect([value] { return INTO_VALUE(value); }));           \
  }

    EMBRB_DEFINE_CONV(short, RB_NUM2SHORT, RB_INT2FIX);
    EMBRB_DEFINE_CONV(unsigned short, RB_NUM2USHORT, RB_INT2FIX);
    EMBRB_DEFINE_CONV(int, RB_NUM2INT, RB_INT2NUM);
    EMBRB_DEFINE_CONV(unsigned int, RB_NUM2UINT, RB_UINT2NUM);
    EMBRB_DEFINE_CONV(long, RB_NUM2LONG, RB_LONG2NUM);
    EMBRB_DEFINE_CONV(unsigned long, RB_NUM2ULONG, RB_ULONG2NUM);
    EMBRB_DEFINE_CONV(long long, RB_NUM2LL, RB_LL2NUM);
    EMBRB_DEFINE_CONV(unsigned long long, RB_NUM2ULL, RB_ULL2NUM);
    EMBRB_DEFINE_CONV(double, ::rb_num2dbl, ::rb_float_new);

#undef EMBRB_DEFINE_CONV

    inline std::string FromValue<std::string>::convert(Value value) {
      auto str = from_Value<String>(value);
      int const index = ::rb_enc_get_index(str.as_VALUE());
      if(index != ::rb_utf8_encindex() && index != ::rb_usascii_encindex() &&
          index != ::rb_ascii8bit_encindex() && !::rb_enc_str_asciionly_p(str.as_VALUE())) {
        str = detail::unsafe_coerce<String>(protect([v = str.as_VALUE()] {
          return ::rb_str_encode(v, ::rb_enc_from_encoding(::rb_utf8_encoding()), 0, RUBY_Qnil);
        }));
      }
      return std::string(str.cdata(), str.size());
    }
    inline Value IntoValue<std::string>::convert(std::string value) {
      return into_Value(std::string_view(value));
    }

    inline std::string_view FromValue<std::string_view>::convert(Value value) {
      return std::string_view(from_Value<String>(value));
    }
    inline Value IntoValue<std::string_view>::convert(std::string_view value) {
      return detail::unsafe_coerce<Value>(
          protect([value] { return (::rb_utf8_str_new)(value.data(), value.size()); }));
    }

    inline Value IntoValue<char const *>::convert(char const *EMBRB_Nonnull value) {
      return into_Value(std::string_view(value));
    }

    template <concepts::ConvertibleFromValue T>
    inline decltype(auto) FromValue<std::optional<T>>::convert(Value v) {
      using Result = std::optional<decltype(from_Value<T>(v))>;
      if(v.is_nil()) {
        return Result();
      }
      return Result(from_Value<T>(v));
    }

    template <concepts::ConvertibleIntoValue T>
    inline Value IntoValue<std::optional<T>>::convert(std::optional<T> value) {
      return value ? into_Value<T>(*value) : Value::qnil;
    }

    template <concepts::ConvertibleFromValue... T>
    inline decltype(auto) FromValue<std::tuple<T...>>::convert(Value value) {
      auto array = from_Value<Array>(value);
      if(array.size() != sizeof...(T)) {
        throw Error::format(builtin::ArgumentError(), "Array of length {} is expected (given {})",
            sizeof...(T), array.size());
      }
      return [array]<size_t... I>(std::index_sequence<I...>) {
        return std::make_tuple(array.at<T>(I)...);
      }(std::make_index_sequence<sizeof...(T)>());
    }

    template <concepts::ConvertibleIntoValue... T>
    inline Value IntoValue<std::tuple<T...>>::convert(std::tuple<T...> value) {
      return [&value]<size_t... I>(std::index_sequence<I...>) {
        return Array::new_from(std::tuple{into_Value<T>(std::get<I>(value))...});
      }(std::make_index_sequence<sizeof...(T)>());
    }
  }

  /// Id

  inline Id::Id(ID id): id_(id) {
  }

  inline ID Id::as_ID() const noexcept {
    return id_;
  }

  namespace value {
    /// ValueBase

    inline constexpr ValueBase::ValueBase(): value_(RUBY_Qnil) {
    }

    inline constexpr ValueBase::ValueBase(VALUE value): value_(value) {
    }

    inline constexpr VALUE ValueBase::as_VALUE() const {
      return value_;
    }

    inline bool ValueBase::is_nil() const {
      return RB_NIL_P(value_);
    }

    inline bool ValueBase::is_frozen() const {
      return RB_TEST(::rb_obj_frozen_p(value_));
    }

    inline ruby_value_type ValueBase::type() const noexcept {
      return ::rb_type(value_);
    }

    inline bool ValueBase::is_same(ValueBase other) const noexcept {
      return value_ == other.value_;
    }

    template <typename T> inline bool ValueBase::is_instance_of(ClassT<T> klass) const {
      return protect(
          [&] { return RB_TEST(::rb_obj_is_instance_of(as_VALUE(), klass.as_VALUE())); });
    }

    template <typename T> inline bool ValueBase::is_kind_of(ClassT<T> klass) const {
      return protect([&] { return RB_TEST(::rb_obj_is_kind_of(as_VALUE(), klass.as_VALUE())); });
    }

    /// ValueT

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    inline ClassT<Derived> ValueT<Derived, Super, nilable>::get_class() const {
      return detail::unsafe_coerce<ClassT<Derived>>(
          protect([v = this->as_VALUE()] { return ::rb_obj_class(v); }));
    }

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    inline Derived ValueT<Derived, Super, nilable>::freeze() const {
      return detail::unsafe_coerce<Derived>(
          protect([v = this->as_VALUE()] { return ::rb_obj_freeze(v); }));
    }

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    inline double ValueT<Derived, Super, nilable>::to_double() const
      requires concepts::NumericValue<Derived>
    {
      return protect([v = this->as_VALUE()] { return ::rb_num2dbl(v); });
    }

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    inline Class ValueT<Derived, Super, nilable>::singleton_class() const
      requires concepts::ObjectValue<Derived>
    {
      return detail::unsafe_coerce<Class>(
          protect([v = this->as_VALUE()] { return ::rb_singleton_class(v); }));
    }

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    inline Integer ValueT<Derived, Super, nilable>::object_id() const
      requires concepts::ObjectValue<Derived>
    {
      return detail::unsafe_coerce<Integer>(
          protect([v = this->as_VALUE()] { return ::rb_obj_id(v); }));
    }

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    inline bool ValueT<Derived, Super, nilable>::instance_variable_defined(
        concepts::Identifier auto &&name) const
      requires concepts::ObjectValue<Derived>
    {
      ID const id = detail::into_ID(std::forward<decltype(name)>(name));
      return protect([v = this->as_VALUE(), id] { return RB_TEST(::rb_ivar_defined(v, id)); });
    }

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    template <concepts::ConvertibleFromValue T>
    inline auto ValueT<Derived, Super, nilable>::instance_variable_get(
        concepts::Identifier auto &&name) const -> auto
      requires concepts::ObjectValue<Derived>
    {
      ID const id = detail::into_ID(std::forward<decltype(name)>(name));
      return from_Value<T>(detail::unsafe_coerce<Value>(
          protect([v = this->as_VALUE(), id] { return ::rb_ivar_get(v, id); })));
    }

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable>
    inline void ValueT<Derived, Super, nilable>::instance_variable_set(
        concepts::Identifier auto &&name, concepts::ConvertibleIntoValue auto &&value) const
      requires concepts::ObjectValue<Derived>
    {
      auto const v = into_Value(std::forward<decltype(value)>(value));
      ID const id = detail::into_ID(std::forward<decltype(name)>(name));
      protect([self = this->as_VALUE(), id, v] { ::rb_ivar_set(self, id, v.as_VALUE()); });
    }

    /// Value

    template <concepts::ConvertibleFromValue R>
    inline R Value::send(
        concepts::Identifier auto &&mid, concepts::ConvertibleIntoValue auto &&...args) const {
      std::array<VALUE, sizeof...(args)> const argv{
        into_Value(std::forward<decltype(args)>(args)).as_VALUE()...};
      ID const id = detail::into_ID(std::forward<decltype(mid)>(mid));
      return from_Value<R>(detail::unsafe_coerce<Value>(protect([&] {
        return ::rb_funcallv(as_VALUE(), id, static_cast<int>(argv.size()), argv.data());
      })));
    }

    inline bool Value::test() const noexcept {
      return RB_TEST(as_VALUE());
    }

    inline bool Value::equals(ValueBase other) const {
      return protect([&] { return RB_TEST(::rb_equal(as_VALUE(), other.as_VALUE())); });
    }

    inline String Value::inspect() const {
      return detail::unsafe_coerce<String>(protect([&] { return ::rb_inspect(as_VALUE()); }));
    }

    inline String Value::to_string() const {
      return detail::unsafe_coerce<String>(
          protect([&] { return ::rb_obj_as_string(as_VALUE()); }));
    }

    inline Value const Value::qnil = {RUBY_Qnil};
    inline Value const Value::qtrue = {RUBY_Qtrue};
    inline Value const Value::qfalse = {RUBY_Qfalse};
  }

  /// Module

  namespace value {
    inline std::optional<Module> Module::from_value(Value value) noexcept {
      auto const type = value.type();
      if(type != RUBY_T_MODULE && type != RUBY_T_CLASS) {
        return std::nullopt;
      }
      return Module(detail::unsafe_coerce<Module>(value.as_VALUE()));
    }

    inline String Module::name() const {
      return detail::unsafe_coerce<String>(protect([&] { return ::rb_class_path(as_VALUE()); }));
    }

    inline bool Module::const_defined(concepts::Identifier auto &&name) const {
      ID const id = detail::into_ID(std::forward<decltype(name)>(name));
      return protect([&] { return ::rb_const_defined(as_VALUE(), id) != 0; });
    }

    template <concepts::ConvertibleFromValue T>
    inline T Module::const_get(concepts::Identifier auto &&name) const {
      ID const id = detail::into_ID(std::forward<decltype(name)>(name));
      return from_Value<T>(
          detail::unsafe_coerce<Value>(protect([&] { return ::rb_const_get(as_VALUE(), id); })));
    }
  }

  /// Class

  namespace value {
    template <typename T>
    inline std::optional<ClassT<T>> ClassT<T>::from_value(Value value) noexcept {
      if(value.type() != RUBY_T_CLASS) {
        return std::nullopt;
      }
      return ClassT<T>(detail::unsafe_coerce<ClassT<T>>(value.as_VALUE()));
    }

    template <typename T>
    inline T ClassT<T>::new_instance(concepts::ConvertibleIntoValue auto &&...args) const
      requires std::derived_from<T, ValueBase>
    {
      std::array<VALUE, sizeof...(args)> const vargs{
        into_Value(std::forward<decltype(args)>(args)).as_VALUE()...};
      return detail::unsafe_coerce<T>(protect([&] {
        return ::rb_class_new_instance(
            static_cast<int>(vargs.size()), vargs.data(), this->as_VALUE());
      }));
    }

    template <typename T>
    template <typename S>
    inline bool ClassT<T>::is_subclass_of(ClassT<S> klass) const {
      return protect([&] {
        return ::rb_class_inherited_p(this->as_VALUE(), klass.as_VALUE()) == RUBY_Qtrue;
      });
    }

    template <typename T>
    template <typename S>
    inline bool ClassT<T>::is_superclass_of(ClassT<S> klass) const {
      return protect([&] {
        return ::rb_class_inherited_p(klass.as_VALUE(), this->as_VALUE()) == RUBY_Qtrue;
      });
    }
  }

  /// Symbol

  namespace value {
    template <size_t N>
    inline Symbol::Symbol(char const (&s)[N]): Symbol(std::string_view(&s[0], N - 1)) {
    }

    inline Symbol::Symbol(std::string_view sv)
        : Symbol(detail::unsafe_coerce<Symbol>(protect(
              [sv] { return ::rb_to_symbol(::rb_interned_str(sv.data(), sv.size())); }))) {
    }

    inline std::optional<Symbol> Symbol::from_value(Value value) noexcept {
      if(!RB_SYMBOL_P(value.as_VALUE())) {
        return std::nullopt;
      }
      return Symbol(detail::unsafe_coerce<Symbol>(value.as_VALUE()));
    }

    inline ID Symbol::as_ID() const noexcept {
      return ::rb_sym2id(as_VALUE());
    }
  }

  /// String

  namespace value {
    inline std::optional<String> String::from_value(Value value) noexcept {
      if(!RB_TYPE_P(value.as_VALUE(), RUBY_T_STRING)) {
        return std::nullopt;
      }
      return String(detail::unsafe_coerce<String>(value.as_VALUE()));
    }

    template <concepts::StringLike S> inline String String::intern_from(S &&s) {
      using CharT = typename std::remove_cvref_t<S>::value_type;
      using Traits = typename std::remove_cvref_t<S>::traits_type;
      std::basic_string_view<CharT, Traits> sv(std::forward<S>(s));
      return detail::unsafe_coerce<String>(protect([&] {
        return (::rb_enc_interned_str)(
            reinterpret_cast<char const *>(sv.data()), sv.size(), CharTraits<CharT>::encoding());
      }));
    }

    template <concepts::CharLike CharT>
    inline String String::intern_from(CharT const *EMBRB_Nonnull s) {
      return intern_from(std::basic_string_view<CharT>(s));
    }

    template <concepts::StringLike S> inline String String::copy_from(S &&s) {
      using CharT = typename std::remove_cvref_t<S>::value_type;
      using Traits = typename std::remove_cvref_t<S>::traits_type;
      std::basic_string_view<CharT, Traits> sv(std::forward<S>(s));
      return detail::unsafe_coerce<String>(protect([&] {
        return (::rb_enc_str_new)(
            reinterpret_cast<char const *>(sv.data()), sv.size(), CharTraits<CharT>::encoding());
      }));
    }

    template <concepts::CharLike CharT>
    inline String String::copy_from(CharT const *EMBRB_Nonnull s) {
      return copy_from(std::basic_string_view<CharT>(s));
    }

    inline size_t String::size() const noexcept {
      return RSTRING_LEN(as_VALUE());
    }

    inline char *EMBRB_Nonnull String::data() const {
      protect([&] { ::rb_check_frozen(as_VALUE()); });
      return RSTRING_PTR(as_VALUE());
    }

    inline char const *EMBRB_Nonnull String::cdata() const noexcept {
      return RSTRING_PTR(as_VALUE());
    }

    inline String::operator std::string_view() const noexcept {
      return {cdata(), size()};
    }
  }

  /// Array

  namespace value {
    inline std::optional<Array> Array::from_value(Value value) noexcept {
      if(!RB_TYPE_P(value.as_VALUE(), RUBY_T_ARRAY)) {
        return std::nullopt;
      }
      return Array(detail::unsafe_coerce<Array>(value.as_VALUE()));
    }

    inline size_t Array::size() const noexcept {
      return ::rb_array_len(as_VALUE());
    }

    template <concepts::ConvertibleFromValue T> inline decltype(auto) Array::at(size_t i) const {
      return from_Value<T>((*this)[i]);
    }

    inline Value Array::operator[](size_t i) const {
      return detail::unsafe_coerce<Value>(::rb_ary_entry(as_VALUE(), static_cast<long>(i)));
    }

    template <std::ranges::contiguous_range R>
#ifdef HAVE_STD_IS_LAYOUT_COMPATIBLE
      requires std::is_layout_compatible_v<std::ranges::range_value_t<R>, ValueBase>
#else
      requires(std::derived_from<std::ranges::range_value_t<R>, ValueBase> &&
               sizeof(std::ranges::range_value_t<R>) == sizeof(ValueBase))
#endif
    inline Array Array::new_from(R const &elements) {
      // contiguous_range<T> has a layout combatible to VALUE[]
      return detail::unsafe_coerce<Array>(protect([&] {
        return ::rb_ary_new_from_values(static_cast<long>(std::ranges::size(elements)),
            reinterpret_cast<VALUE const *>(std::ranges::data(elements)));
      }));
    };

    inline Array Array::new_from(std::initializer_list<ValueBase> elements) {
      return detail::unsafe_coerce<Array>(protect([&] {
        return ::rb_ary_new_from_values(static_cast<long>(elements.size()),
            reinterpret_cast<VALUE const *>(elements.begin()));
      }));
    }

    template <std::derived_from<ValueBase>... T>
    inline Array Array::new_from(std::tuple<T...> const &elements) {
      std::array<VALUE, sizeof...(T)> const values = std::apply(
          [](auto... v) { return std::array<VALUE, sizeof...(T)>{v.as_VALUE()...}; }, elements);
      return detail::unsafe_coerce<Array>(protect([&] {
        return ::rb_ary_new_from_values(static_cast<long>(values.size()), values.data());
      }));
    }

    inline Array Array::new_array() {
      return detail::unsafe_coerce<Array>(protect([] { return ::rb_ary_new(); }));
    }

    inline Array Array::new_array(long capacity) {
      return detail::unsafe_coerce<Array>(
          protect([capacity] { return ::rb_ary_new_capa(capacity); }));
    }

    template <concepts::ConvertibleIntoValue T> inline Array Array::push_back(T value) const {
      auto const v = into_Value<T>(value);
      protect([v, this] { ::rb_ary_push(as_VALUE(), v.as_VALUE()); });
      return *this;
    }

    template <concepts::ConvertibleFromValue T> inline T Array::pop_back() const {
      return from_Value<T>(
          detail::unsafe_coerce<Value>(protect([this] { return ::rb_ary_pop(as_VALUE()); })));
    }

    template <concepts::ConvertibleIntoValue T> inline Array Array::push_front(T value) const {
      auto const v = into_Value<T>(value);
      protect([v, this] { ::rb_ary_unshift(as_VALUE(), v.as_VALUE()); });
      return *this;
    }

    template <concepts::ConvertibleFromValue T> inline T Array::pop_front() const {
      return from_Value<T>(
          detail::unsafe_coerce<Value>(protect([this] { return ::rb_ary_shift(as_VALUE()); })));
    }
  }

  /// Proc

  namespace detail {
    using ProcBody = std::function<ProcFunc>;

    inline rb_data_type_t const proc_body_data_type = {
      .wrap_struct_name = "embrb::ProcBody",
      .function = {
        .dmark = nullptr,
        .dfree = [](void *EMBRB_Nullable p) noexcept { delete static_cast<ProcBody *>(p); },
        .dsize = [](void const *EMBRB_Nullable) noexcept { return sizeof(ProcBody); },
      },
      .flags = RUBY_TYPED_FREE_IMMEDIATELY,
    };

    inline VALUE proc_body_trampoline(VALUE, VALUE body, int argc,
        VALUE const *EMBRB_Nullable argv, VALUE) {
      auto const &function = *static_cast<ProcBody const *>(RTYPEDDATA_DATA(body));
      return cxx_protect([&] {
        // VALUE[] has a layout compatible to Value[]
        std::span<Value const> const args(reinterpret_cast<Value const *>(argv), argc);
        return function(args).as_VALUE();
      });
    }
  }

  namespace value {
    inline std::optional<Proc> Proc::from_value(Value value) noexcept {
      if(!RB_TEST(::rb_obj_is_proc(value.as_VALUE()))) {
        return std::nullopt;
      }
      return Proc(detail::unsafe_coerce<Proc>(value.as_VALUE()));
    }

    inline Proc Proc::new_from_function(std::function<detail::ProcFunc> function) {
      VALUE body = protect(
          [] { return ::rb_data_typed_object_wrap(0, nullptr, &detail::proc_body_data_type); });
      RTYPEDDATA_DATA(body) = new detail::ProcBody(std::move(function));  // Tracked by Ruby GC
      VALUE const proc =
          protect([body] { return ::rb_proc_new(&detail::proc_body_trampoline, body); });
      RB_GC_GUARD(body);
      return detail::unsafe_coerce<Proc>(proc);
    }

    inline bool Proc::is_lambda() const {
      return protect([&] { return RB_TEST(::rb_proc_lambda_p(as_VALUE())); });
    }

    inline Value Proc::call(Array args) const {
      return detail::unsafe_coerce<Value>(
          protect([&] { return ::rb_proc_call(as_VALUE(), args.as_VALUE()); }));
    }
  }

  /// Exception

  namespace value {
    inline std::optional<Exception> Exception::from_value(Value value) noexcept {
      if(!RB_TEST(::rb_obj_is_kind_of(value.as_VALUE(), ::rb_eException))) {
        return std::nullopt;
      }
      return Exception(detail::unsafe_coerce<Exception>(value.as_VALUE()));
    }

    template <std::derived_from<Exception> E, typename... Args>
    inline E Exception::format(
        ClassT<E> cls, fmt::format_string<Args...> format_str, Args &&...args) {
      return cls.new_instance(fmt::format(format_str, std::forward<Args>(args)...));
    }

    inline String Exception::message() const {
      return send<String>("message");
    }
  }

  /// Numeric

  namespace value {
    inline std::optional<Numeric> Numeric::from_value(Value value) noexcept {
      if(!RB_TEST(::rb_obj_is_kind_of(value.as_VALUE(), ::rb_cNumeric))) {
        return std::nullopt;
      }
      return Numeric(detail::unsafe_coerce<Numeric>(value.as_VALUE()));
    }

    inline std::optional<Integer> Integer::from_value(Value value) noexcept {
      if(!RB_INTEGER_TYPE_P(value.as_VALUE())) {
        return std::nullopt;
      }
      return Integer(detail::unsafe_coerce<Integer>(value.as_VALUE()));
    }

    inline Integer Integer::from_i64(std::int64_t n) {
      return detail::unsafe_coerce<Integer>(
          protect([n] { return RB_LL2NUM(static_cast<long long>(n)); }));
    }

    inline Integer Integer::from_u64(std::uint64_t n) {
      return detail::unsafe_coerce<Integer>(
          protect([n] { return RB_ULL2NUM(static_cast<unsigned long long>(n)); }));
    }

    inline bool Integer::is_fixnum() const noexcept {
      return RB_FIXNUM_P(as_VALUE());
    }

    inline std::int64_t Integer::to_i64() const {
      if(is_fixnum()) {
        return RB_FIX2LONG(as_VALUE());
      }
      return protect([v = as_VALUE()] { return static_cast<std::int64_t>(RB_NUM2LL(v)); });
    }

    inline std::optional<Float> Float::from_value(Value value) noexcept {
      if(!RB_FLOAT_TYPE_P(value.as_VALUE())) {
        return std::nullopt;
      }
      return Float(detail::unsafe_coerce<Float>(value.as_VALUE()));
    }

    inline Float Float::from_f64(double n) {
      return detail::unsafe_coerce<Float>(protect([n] { return ::rb_float_new(n); }));
    }

    inline double Float::to_f64() const noexcept {
      return ::rb_float_value(as_VALUE());
    }

    inline std::optional<Rational> Rational::from_value(Value value) noexcept {
      if(!RB_TYPE_P(value.as_VALUE(), RUBY_T_RATIONAL)) {
        return std::nullopt;
      }
      return Rational(detail::unsafe_coerce<Rational>(value.as_VALUE()));
    }
  }

  /// Complex

  namespace value {
    inline std::optional<Complex> Complex::from_value(Value value) noexcept {
      if(!RB_TYPE_P(value.as_VALUE(), RUBY_T_COMPLEX)) {
        return std::nullopt;
      }
      return Complex(detail::unsafe_coerce<Complex>(value.as_VALUE()));
    }

    inline Complex Complex::new_complex(
        concepts::NumericValue auto real, concepts::NumericValue auto imag) {
      VALUE const z = protect([real, imag] {
        return ::rb_complex_new(real.as_VALUE(), imag.as_VALUE());
      });
      // rb_complex_new always allocates a Complex
      embrb_assert(RB_TYPE_P(z, RUBY_T_COMPLEX));
      return detail::unsafe_coerce<Complex>(z);
    }

    inline Complex Complex::polar(
        concepts::NumericValue auto abs, concepts::NumericValue auto arg) {
      Value const z = detail::unsafe_coerce<Value>(protect([abs, arg] {
        return ::rb_complex_new_polar(abs.as_VALUE(), arg.as_VALUE());
      }));
      return from_Value<Complex>(z);
    }

    template <concepts::ConvertibleFromValue T> inline decltype(auto) Complex::real() const {
      return from_Value<T>(detail::unsafe_coerce<Value>(::rb_complex_real(as_VALUE())));
    }

    template <concepts::ConvertibleFromValue T> inline decltype(auto) Complex::imag() const {
      return from_Value<T>(detail::unsafe_coerce<Value>(::rb_complex_imag(as_VALUE())));
    }

    inline Complex Complex::conjugate() const {
      VALUE const z = protect([v = as_VALUE()] { return ::rb_complex_conjugate(v); });
      // The conjugate is created by the class of the receiver
      embrb_assert(RB_TYPE_P(z, RUBY_T_COMPLEX));
      return detail::unsafe_coerce<Complex>(z);
    }

    // Complex#abs and Complex#arg may return an Integer for exact parts.

    inline double Complex::abs() const {
      return protect([v = as_VALUE()] { return ::rb_num2dbl(::rb_complex_abs(v)); });
    }

    inline double Complex::arg() const {
      return protect([v = as_VALUE()] { return ::rb_num2dbl(::rb_complex_arg(v)); });
    }
  }

  /// Match

  namespace value {
    inline std::optional<Match> Match::from_value(Value value) noexcept {
      if(!RB_TYPE_P(value.as_VALUE(), RUBY_T_MATCH)) {
        return std::nullopt;
      }
      return Match(detail::unsafe_coerce<Match>(value.as_VALUE()));
    }
  }

  static_assert(concepts::ReprValue<Value>);
  static_assert(concepts::NumericValue<Integer>);
  static_assert(concepts::NumericValue<Complex>);
  static_assert(!concepts::NumericValue<String>);
  static_assert(concepts::ObjectValue<Match>);
  static_assert(!concepts::ObjectValue<Integer>);

  /// Pinned

  template <std::derived_from<ValueBase> T> inline PinnedOpt<T>::Storage::Storage(T v): value{v} {
    ::rb_gc_register_address(const_cast<VALUE *>(reinterpret_cast<VALUE const *>(&value)));
  }

  template <std::derived_from<ValueBase> T> inline PinnedOpt<T>::Storage::~Storage() {
    ::rb_gc_unregister_address(const_cast<VALUE *>(reinterpret_cast<VALUE const *>(&value)));
  }

  template <std::derived_from<ValueBase> T>
  inline PinnedOpt<T>::PinnedOpt(T value): ptr_(std::make_shared<Storage>(value)) {
  }

  template <std::derived_from<ValueBase> T> inline T &PinnedOpt<T>::operator*() const noexcept {
    return ptr_->value;
  }

  template <std::derived_from<ValueBase> T>
  inline T *EMBRB_Nullable PinnedOpt<T>::operator->() const noexcept {
    embrb_assert(ptr_);
    return &ptr_->value;
  }

  template <std::derived_from<ValueBase> T> inline PinnedOpt<T>::operator bool() const noexcept {
    return static_cast<bool>(ptr_);
  }

  template <std::derived_from<ValueBase> T>
  inline Pinned<T>::Pinned(T value): PinnedOpt<T>(value) {
  }

  template <std::derived_from<ValueBase> T>
  inline T *EMBRB_Nonnull Pinned<T>::operator->() const noexcept {
    return PinnedOpt<T>::operator->();
  }

  /// Leak

  template <std::derived_from<ValueBase> T>
  inline Leak<T>::Leak() noexcept: raw_value_(RUBY_Qnil), init_(false), registered_(false) {
  }

  template <std::derived_from<ValueBase> T>
  inline Leak<T>::Leak(T value): value_(value), init_(true), registered_(true) {
    ::rb_gc_register_address(&raw_value_);
  }

  template <std::derived_from<ValueBase> T> inline Leak<T> &Leak<T>::operator=(T value) {
    set(value);
    return *this;
  }

  template <std::derived_from<ValueBase> T> inline T Leak<T>::get() const {
    if(!init_) {
      throw std::runtime_error{"Leak has no value"};
    }
    return value_;
  }

  template <std::derived_from<ValueBase> T> inline void Leak<T>::set(T value) {
    value_ = value;
    init_ = true;
    if(!registered_) {
      ::rb_gc_register_address(&raw_value_);
      registered_ = true;
    }
  }

  template <std::derived_from<ValueBase> T> inline T Leak<T>::operator*() const {
    return get();
  }

  template <std::derived_from<ValueBase> T>
  inline T const *EMBRB_Nonnull Leak<T>::operator->() const {
    if(!init_) {
      throw std::runtime_error{"Leak has no value"};
    }
    return &value_;
  }

  template <std::derived_from<ValueBase> T> inline void Leak<T>::clear() noexcept {
    raw_value_ = RUBY_Qnil;
    init_ = false;
  }

  /// Literals

  namespace literals {
    template <detail::cxstring s> String operator""_str() {
      return String::copy_from(s);
    }

    template <detail::u8cxstring s> String operator""_str() {
      return String::copy_from(s);
    }

    template <detail::cxstring s> String operator""_fstr() {
      static Leak<String> const str{detail::unsafe_coerce<String>(
          protect([] { return ::rb_obj_freeze(::rb_str_new_static(s.data(), s.size())); }))};
      return *str;
    }

    template <detail::u8cxstring s> String operator""_fstr() {
      static Leak<String> const str{detail::unsafe_coerce<String>(protect([] {
        return ::rb_obj_freeze(::rb_enc_str_new_static(
            reinterpret_cast<char const *>(s.data()), s.size(), ::rb_utf8_encoding()));
      }))};
      return *str;
    }

    // Symbols for static IDs are immortal.

    template <detail::cxstring s> Symbol operator""_sym() {
      static Symbol const sym = detail::unsafe_coerce<Symbol>(
          protect([] { return ::rb_id2sym(operator""_id < s>().as_ID()); }));
      return sym;
    }

    template <detail::u8cxstring s> Symbol operator""_sym() {
      static Symbol const sym = detail::unsafe_coerce<Symbol>(
          protect([] { return ::rb_id2sym(operator""_id < s>().as_ID()); }));
      return sym;
    }

    template <detail::cxstring s> Id operator""_id() {
      static Id const id{protect([] { return ::rb_intern2(s.data(), s.size()); })};
      return id;
    }

    template <detail::u8cxstring s> Id operator""_id() {
      static Id const id{
        protect([] { return ::rb_intern_str(operator""_fstr < s>().as_VALUE()); })};
      return id;
    }
  }

  /// Error

  inline Error::Error(Exception exception)
      : repr_(std::in_place_type<RuntimeException>, RuntimeException{Pinned<Exception>(exception)}),
        message_(detail::exception_message(exception.as_VALUE())),
        what_(fmt::format("{}: {}", ::rb_obj_classname(exception.as_VALUE()), message_)) {
  }

  inline Error::Error(ClassT<Exception> klass, std::string message)
      : repr_(std::in_place_type<HostMessage>, HostMessage{Pinned<ClassT<Exception>>(klass)}),
        message_(std::move(message)),
        what_(fmt::format("{}: {}", ::rb_class2name(klass.as_VALUE()), message_)) {
  }

  inline Error::Error(detail::JumpTag tag)
      : repr_(std::in_place_type<Jump>, Jump{tag}),
        message_(fmt::format("non-local jump ({})", detail::jump_tag_name(tag))),
        what_(fmt::format("LocalJumpError: {}", message_)) {
    embrb_assert(tag != detail::tag_none && tag != detail::tag_raise);
  }

  template <typename... Args>
  inline Error Error::format(
      ClassT<Exception> klass, fmt::format_string<Args...> format_str, Args &&...args) {
    return Error(klass, fmt::format(format_str, std::forward<Args>(args)...));
  }

  inline ErrorKind Error::kind() const noexcept {
    if(std::holds_alternative<RuntimeException>(repr_)) {
      return ErrorKind::RuntimeException;
    }
    if(std::holds_alternative<Jump>(repr_)) {
      return ErrorKind::Jump;
    }
    return ErrorKind::HostMessage;
  }

  inline std::optional<Exception> Error::runtime_exception() const noexcept {
    if(auto const *const exc = std::get_if<RuntimeException>(&repr_)) {
      return *exc->exception;
    }
    return std::nullopt;
  }

  inline std::optional<detail::JumpTag> Error::jump_tag() const noexcept {
    if(auto const *const jump = std::get_if<Jump>(&repr_)) {
      return jump->tag;
    }
    return std::nullopt;
  }

  inline ClassT<Exception> Error::exception_class() const noexcept {
    if(auto const *const exc = std::get_if<RuntimeException>(&repr_)) {
      return detail::unsafe_coerce<ClassT<Exception>>(
          ::rb_obj_class(exc->exception->as_VALUE()));
    }
    if(auto const *const host = std::get_if<HostMessage>(&repr_)) {
      return *host->klass;
    }
    return builtin::LocalJumpError();
  }

  inline std::string_view Error::message() const noexcept {
    return message_;
  }

  inline bool Error::is_kind_of(ClassT<Exception> klass) const {
    if(auto const exc = runtime_exception()) {
      return exc->is_kind_of(klass);
    }
    auto const own = exception_class();
    return own.is_same(klass) || own.is_subclass_of(klass);
  }

  inline Exception Error::to_exception() const {
    if(auto const exc = runtime_exception()) {
      return *exc;
    }
    return exception_class().new_instance(message_);
  }

  inline char const *EMBRB_Nonnull Error::what() const noexcept {
    return what_.c_str();
  }

  /// Classify

  inline Classified classify(Value value) noexcept {
    VALUE const v = value.as_VALUE();
    switch(value.type()) {
    case RUBY_T_FIXNUM:
    case RUBY_T_BIGNUM:
      return Classified(std::in_place_type<Integer>, detail::unsafe_coerce<Integer>(v));
    case RUBY_T_FLOAT:
      return Classified(std::in_place_type<Float>, detail::unsafe_coerce<Float>(v));
    case RUBY_T_RATIONAL:
      return Classified(std::in_place_type<Rational>, detail::unsafe_coerce<Rational>(v));
    case RUBY_T_COMPLEX:
      return Classified(std::in_place_type<Complex>, detail::unsafe_coerce<Complex>(v));
    case RUBY_T_MATCH:
      return Classified(std::in_place_type<Match>, detail::unsafe_coerce<Match>(v));
    case RUBY_T_STRING:
      return Classified(std::in_place_type<String>, detail::unsafe_coerce<String>(v));
    case RUBY_T_SYMBOL:
      return Classified(std::in_place_type<Symbol>, detail::unsafe_coerce<Symbol>(v));
    case RUBY_T_ARRAY:
      return Classified(std::in_place_type<Array>, detail::unsafe_coerce<Array>(v));
    default:
      return Classified(std::in_place_type<Value>, value);
    }
  }

  /// Eval

  template <concepts::ConvertibleFromValue T> inline auto eval(std::string_view code) -> auto {
    std::string const source(code);
    return from_Value<T>(detail::unsafe_coerce<Value>(
        protect([&source] { return ::rb_eval_string(source.c_str()); })));
  }

  /// Embed

  namespace embed {
    inline Cleanup::Cleanup() noexcept: active_(true) {
    }

    inline Cleanup::Cleanup(Cleanup &&other) noexcept
        : active_(std::exchange(other.active_, false)) {
    }

    inline Cleanup::~Cleanup() {
      if(active_) {
        ::ruby_cleanup(0);
      }
    }

    inline Cleanup init(std::initializer_list<char const *> options) {
      static std::atomic_flag initialized;
      if(initialized.test_and_set()) {
        throw std::runtime_error{"Ruby VM is already initialized in this process"};
      }

      RUBY_INIT_STACK;
      if(int const state = ::ruby_setup(); state != 0) {
        throw std::runtime_error{fmt::format("ruby_setup failed (state {})", state)};
      }

      std::vector<std::string> arguments{"embrb"};
      arguments.insert(arguments.end(), options.begin(), options.end());
      arguments.emplace_back("-e");
      arguments.emplace_back("");
      std::vector<char *> argv;
      for(auto &arg: arguments) {
        argv.push_back(arg.data());
      }
      argv.push_back(nullptr);

      void *const node = ::ruby_options(static_cast<int>(arguments.size()), argv.data());
      int status = 0;
      if(!::ruby_executable_node(node, &status)) {
        ::ruby_cleanup(status);
        throw std::runtime_error{
          fmt::format("Ruby VM rejected the options (status {})", status)};
      }
      if(int const state = ::ruby_exec_node(node); state != 0) {
        ::ruby_cleanup(state);
        throw std::runtime_error{fmt::format("Ruby VM failed to start (state {})", state)};
      }
      return Cleanup();
    }
  }

  /// C++ exceptions in Ruby frames

  namespace detail {
#if HAVE_ABI___CXA_CURRENT_EXCEPTION_TYPE
    static bool constexpr have_abi_cxa_current_exception_type = true;
#else
    static bool constexpr have_abi_cxa_current_exception_type = false;
#endif

    inline std::string demangle_type_info(std::type_info const &ti) {
#if HAVE_ABI___CXA_DEMANGLE
      std::unique_ptr<char, decltype(&std::free)> const name = {
        abi::__cxa_demangle(ti.name(), nullptr, 0, nullptr),
        std::free,
      };
      if(name) {
        return name.get();
      }
#endif
      return ti.name();
    }

    inline Error make_host_error(
        std::exception const *EMBRB_Nullable exc, std::type_info const *EMBRB_Nullable ti) {
      std::string name, msg;
      if(ti)
        name = demangle_type_info(*ti);
      if(exc)
        msg = exc->what();
      return Error::format(
          builtin::RuntimeError(), "{}: {}", name.empty() ? std::string{"unknown"} : name, msg);
    }

    inline std::type_info const *EMBRB_Nullable current_exception_type() noexcept {
#if HAVE_ABI___CXA_CURRENT_EXCEPTION_TYPE
      return abi::__cxa_current_exception_type();
#else
      return nullptr;
#endif
    }

    /// Runs a C++ function called from Ruby.
    ///
    /// C++ exceptions must not unwind through Ruby frames. The exception is translated and
    /// raised only after the C++ handlers have completed.
    inline auto cxx_protect(std::invocable<> auto const &functor) noexcept
        -> std::invoke_result_t<decltype(functor)> {
      std::optional<Error> error;
      int jump_state = tag_none;

      try {
        return functor();
      } catch(Error const &err) {
        if(auto const tag = err.jump_tag()) {
          jump_state = *tag;
        } else {
          error.emplace(err);
        }
      } catch(std::exception const &exc) {
        error.emplace(make_host_error(&exc, &typeid(exc)));
      } catch(...) {
        error.emplace(make_host_error(nullptr, current_exception_type()));
      }

      if(jump_state != tag_none) {
        ::rb_jump_tag(jump_state);
      }

      int state = 0;
      auto create = [&error]() noexcept -> VALUE {
        if(auto const exc = error->runtime_exception()) {
          return exc->as_VALUE();
        }
        auto const msg = error->message();
        return ::rb_exc_new_str(
            error->exception_class().as_VALUE(), (::rb_utf8_str_new)(msg.data(), msg.size()));
      };
      VALUE const exc = protect_raw(create, state);
      error.reset();
      if(state != tag_none) {
        ::rb_jump_tag(state);
      }
      ::rb_exc_raise(exc);
    }
  }
}

namespace fmt {
  template <std::derived_from<embrb::Value> T>
  template <typename ParseContext>
  constexpr auto formatter<T, char>::parse(ParseContext &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if(it == ctx.end()) {
      return it;
    }
    if(*it == '#') {
      inspect = true;
      ++it;
    }
    if(it != ctx.end() && *it != '}') {
      throw fmt::format_error("invalid format args for embrb::Value");
    }
    return it;
  }

  template <std::derived_from<embrb::Value> T>
  template <typename FormatContext>
  auto formatter<T, char>::format(T value, FormatContext &ctx) const -> decltype(ctx.out()) {
    embrb::String const str = inspect ? value.inspect() : value.to_string();
    return fmt::format_to(ctx.out(), "{}", static_cast<std::string_view>(str));
  }
}
