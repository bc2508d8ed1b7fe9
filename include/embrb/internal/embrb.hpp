// SPDX-License-Identifier: BSL-1.0
// SPDX-FileCopyrightText: Copyright 2024-2025 Kasumi Hanazuki <kasumi@rollingapple.net>
#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <ruby.h>
#include <ruby/encoding.h>

#define embrb_assert(expr) assert((expr))
#define embrb_delete(reason) delete

#ifdef HAVE_FEATURE_NULLABILITY
#define EMBRB_Nullable _Nullable
#define EMBRB_Nonnull _Nonnull
#else
#define EMBRB_Nullable
#define EMBRB_Nonnull
#endif

/// embrb
///
/// Safe access to an embedded CRuby interpreter.
///
/// Every function in this library requires that the interpreter has been initialized (see
/// \ref embrb::embed::init) and is called on the thread holding the GVL.
namespace embrb {
  class Id;
  class Error;

  /// Value wrappers.
  ///
  /// A value wrapper is a borrowed reference into the Ruby heap. It is valid only while the
  /// referenced object is reachable from a GC root: the native stack of the thread running Ruby,
  /// a global or an explicit registration (\ref embrb::Pinned, \ref embrb::Leak). Wrappers own
  /// nothing and have no destructor responsibility.
  namespace value {
    enum Nilability : bool;

    class ValueBase;
    template <typename Derived, std::derived_from<ValueBase> Super, Nilability> class ValueT;
    class Value;
    class Module;
    template <typename T = Value> class ClassT;
    using Class = ClassT<Value>;
    class Symbol;
    class Proc;
    class String;
    class Array;
    class Exception;
    class Numeric;
    class Integer;
    class Float;
    class Rational;
    class Complex;
    class Match;
  }
  using namespace value;

  /// Capabilities.
  ///
  /// A capability may be granted to a wrapper type only when every instance of the type, as
  /// guaranteed by its checked constructor, satisfies it.
  namespace capability {
    /// The wrapper always refers to an instance of `Numeric`.
    template <typename T> inline constexpr bool numeric = false;
    /// The wrapper always refers to a heap object (never an immediate).
    template <typename T> inline constexpr bool object = false;
  }

  /// Concepts
  ///
  namespace concepts {
    template <typename T>
    concept StringLike = requires {
      typename std::remove_cvref_t<T>::value_type;
      typename std::remove_cvref_t<T>::traits_type;
      typename std::basic_string_view<typename std::remove_cvref_t<T>::value_type,
          typename std::remove_cvref_t<T>::traits_type>;
    };

    /// Specifies the types that can be used as Ruby identifiers.
    ///
    /// This includes \ref embrb::Id, \ref embrb::value::Symbol and C++ strings.
    template <typename T>
    concept Identifier = requires(T id) {
      { id.as_ID() } noexcept -> std::same_as<ID>;
    } || std::is_constructible_v<Symbol, T>;

    /// Specifies the types that represent a Ruby value with the same layout as `VALUE`.
    ///
    template <typename T>
    concept ReprValue = std::derived_from<std::remove_cvref_t<T>, ValueBase> &&
                        sizeof(std::remove_cvref_t<T>) == sizeof(VALUE);

    /// Specifies the value wrappers granted the numeric capability.
    ///
    template <typename T>
    concept NumericValue = ReprValue<T> && capability::numeric<std::remove_cvref_t<T>>;

    /// Specifies the value wrappers granted the object capability.
    ///
    template <typename T>
    concept ObjectValue = ReprValue<T> && capability::object<std::remove_cvref_t<T>>;

    /// Specifies the value wrappers that can be narrowed from a Value by a checked constructor.
    ///
    template <typename T>
    concept CheckedValue = requires(Value v) {
      { T::from_value(v) } noexcept -> std::same_as<std::optional<T>>;
      { T::class_name } -> std::convertible_to<std::string_view>;
    };
  }

  /// Implementation details.
  ///
  /// @internal
  namespace detail {
    /// Unchecked narrowing of a `VALUE`.
    ///
    /// Only for references whose type is already established: the result of a runtime function
    /// that always returns the type, or a value whose type tag has just been inspected.
    template <typename T> struct unsafe_coerce {
      VALUE value;

      constexpr unsafe_coerce(VALUE value): value{value} {
      }

      template <std::derived_from<T> U>
      constexpr unsafe_coerce(unsafe_coerce<U> other): value{other.value} {
      }
    };

    template <typename T> inline constexpr bool always_false_v = false;

    // Duplicated definition for cxstring and u8cxstring instead of parameterize char type, because
    // clang-18 does not support template parameter deduction for type aliases.

    /// Represents a compile-time binary string.
    ///
    template <size_t N> struct cxstring {
      using value_type = char;
      using traits_type = std::char_traits<value_type>;

      std::array<value_type, N> data_;

      // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays)
      consteval cxstring(value_type const (&str)[N]) {
        std::copy_n(str, N, data_.data());
      }

      constexpr value_type const *EMBRB_Nonnull data() const {
        return data_.data();
      }

      constexpr size_t size() const {
        return N - 1;
      }

      constexpr operator std::basic_string_view<value_type>() const {
        return {data(), size()};
      }
    };

    /// Represents a compile-time UTF-8 string.
    ///
    template <size_t N> struct u8cxstring {
      using value_type = char8_t;
      using traits_type = std::char_traits<value_type>;

      std::array<value_type, N> data_;

      // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays)
      consteval u8cxstring(value_type const (&str)[N]) {
        std::copy_n(str, N, data_.data());
      }

      constexpr value_type const *EMBRB_Nonnull data() const {
        return data_.data();
      }

      constexpr size_t size() const {
        return N - 1;
      }

      constexpr operator std::basic_string_view<value_type>() const {
        return {data(), size()};
      }
    };

    /// Tags of `rb_protect` states, as defined in the VM (`enum ruby_tag_type`).
    ///
    enum JumpTag : int {
      tag_none = 0,
      tag_return = 1,
      tag_break = 2,
      tag_next = 3,
      tag_retry = 4,
      tag_redo = 5,
      tag_raise = 6,
      tag_throw = 7,
      tag_fatal = 8,
    };

    using ProcFunc = Value(std::span<Value const> args);

    auto cxx_protect(std::invocable<> auto const &functor) noexcept
        -> std::invoke_result_t<decltype(functor)>;
  }

  /// Calls a function that may raise a Ruby exception.
  ///
  /// The function runs under `rb_protect`. A Ruby exception raised inside is stopped here and
  /// thrown as \ref embrb::Error carrying the original exception object. Other jumps are thrown
  /// as an \ref embrb::Error of kind `ErrorKind::Jump`. C++ exceptions thrown by the function
  /// are caught inside and rethrown after `rb_protect` returns, so they never unwind through the
  /// VM.
  ///
  /// @warning The jump skips the destructors of objects alive in the function's frames.
  ///
  /// @param functor The function to call.
  /// @return The return value of the function.
  /// @throw embrb::Error When a Ruby exception is raised or another jump happens.
  template <std::invocable<> F> auto protect(F &&functor) -> std::invoke_result_t<F>;

  /// Conversion between C++ and Ruby values.
  ///
  namespace convert {
    /// Converts a C++ value into a Ruby value.
    ///
    /// @tparam T The type of the C++ value.
    /// @param value The C++ value to be converted.
    /// @return The converted Ruby value.
    template <typename T> Value into_Value(T value);
    /// Converts a Ruby value into a C++ value.
    ///
    /// @tparam T The type the C++ value.
    /// @param value The Ruby value to be converted.
    /// @return The converted C++ value.
    /// @throw embrb::Error When the value cannot be converted.
    template <typename T> auto from_Value(Value value) -> auto;

    template <typename T> struct FromValue {
      static_assert(detail::always_false_v<T>, "conversion from Value not defined");
    };
    template <typename T> struct IntoValue {
      static_assert(detail::always_false_v<T>, "conversion into Value not defined");
    };

#define EMBRB_DECLARE_CONV(TYPE)                                                                   \
  template <> struct FromValue<TYPE> {                                                             \
    TYPE convert(Value value);                                                                     \
  };                                                                                               \
  template <> struct IntoValue<TYPE> {                                                             \
    Value convert(TYPE value);                                                                     \
  };

    EMBRB_DECLARE_CONV(bool);
    EMBRB_DECLARE_CONV(signed char);
    EMBRB_DECLARE_CONV(unsigned char);
    EMBRB_DECLARE_CONV(short);
    EMBRB_DECLARE_CONV(unsigned short);
    EMBRB_DECLARE_CONV(int);
    EMBRB_DECLARE_CONV(unsigned int);
    EMBRB_DECLARE_CONV(long);
    EMBRB_DECLARE_CONV(unsigned long);
    EMBRB_DECLARE_CONV(long long);
    EMBRB_DECLARE_CONV(unsigned long long);
    EMBRB_DECLARE_CONV(double);
    EMBRB_DECLARE_CONV(std::string);
    EMBRB_DECLARE_CONV(std::string_view);

#undef EMBRB_DECLARE_CONV

    template <> struct IntoValue<char const *> {
      Value convert(char const *EMBRB_Nonnull value);
    };

    /// Narrowing into a value wrapper through its checked constructor.
    ///
    template <concepts::CheckedValue T> struct FromValue<T> {
      T convert(Value value);
    };
  }
  using namespace convert;

  namespace concepts {
    /// Specifies the types that can be converted from Ruby values.
    ///
    template <typename T>
    concept ConvertibleFromValue = requires(Value v) { from_Value<T>(v); };

    /// Specifies the types that can be converted into Ruby values.
    ///
    template <typename T>
    concept ConvertibleIntoValue = requires(T v) {
      { into_Value<T>(v) } -> std::same_as<Value>;
    };
  }

  namespace convert {
    template <concepts::ConvertibleFromValue T> struct FromValue<std::optional<T>> {
      decltype(auto) convert(Value v);
    };

    template <concepts::ConvertibleIntoValue T> struct IntoValue<std::optional<T>> {
      Value convert(std::optional<T> value);
    };

    template <concepts::ConvertibleFromValue... T> struct FromValue<std::tuple<T...>> {
      decltype(auto) convert(Value value);
    };

    template <concepts::ConvertibleIntoValue... T> struct IntoValue<std::tuple<T...>> {
      Value convert(std::tuple<T...> value);
    };
  }

  /// Maps C++ character types to Ruby encodings.
  ///
  template <typename CharT> struct CharTraits {
    static_assert(detail::always_false_v<CharT>, "Encoding unknown for this character type");
  };

  template <> struct CharTraits<char> {
    static inline constinit auto encoding = rb_ascii8bit_encoding;
  };
  template <> struct CharTraits<char8_t> {
    static inline constinit auto encoding = rb_utf8_encoding;
  };

  namespace concepts {
    template <typename T>
    concept CharTraits = requires {
      { T::encoding() } -> std::same_as<rb_encoding *>;
    };

    /// Specifies the character types that can be mapped to Ruby strings.
    ///
    template <typename T>
    concept CharLike = requires {
      requires CharTraits<::embrb::CharTraits<std::remove_cvref_t<T>>>;
      typename std::basic_string_view<std::remove_cvref_t<T>>;
    };
  };

  /// Literals
  ///
  /// This namespace contains C++ user-defined literals to generate Ruby objects.
  namespace literals {
    /// Creates a mutable `String` in ASCII-8BIT encoding.
    ///
    template <detail::cxstring> String operator""_str();
    /// Creates a mutable `String` in UTF-8 encoding.
    ///
    template <detail::u8cxstring> String operator""_str();
    /// Creates a frozen `String` in ASCII-8BIT encoding.
    ///
    /// The string is created once and never garbage-collected.
    template <detail::cxstring> String operator""_fstr();
    /// Creates a frozen `String` in UTF-8 encoding.
    ///
    /// The string is created once and never garbage-collected.
    template <detail::u8cxstring> String operator""_fstr();
    /// Creates a `Symbol` for the name encoded in ASCII/ASCII-8BIT.
    ///
    template <detail::cxstring> Symbol operator""_sym();
    /// Creates a `Symbol` for the name encoded in UTF-8.
    ///
    template <detail::u8cxstring> Symbol operator""_sym();
    /// Creates an ID for the name encoded in ASCII/ASCII-8BIT.
    ///
    /// IDs created this way is static and never garbage-collected.
    template <detail::cxstring> Id operator""_id();
    /// Creates an ID for the name encoded in UTF-8.
    ///
    /// IDs created this way is static and never garbage-collected.
    template <detail::u8cxstring> Id operator""_id();
  }

  /// Wrapper for static IDs.
  ///
  /// Static IDs are never garbage-collected, and it's safe to store anywhere.
  /// @sa embrb::literals::operator""_id()
  class Id {
    ID id_;

    explicit Id(ID id);

  public:
    Id(Id const &) = default;
    ID as_ID() const noexcept;

    template <detail::cxstring> friend Id literals::operator""_id();
    template <detail::u8cxstring> friend Id literals::operator""_id();
  };

  namespace value {
    /// Whether the value wrapper can be nil.
    enum Nilability : bool {
      Nonnil = false,
      Nilable = true,
    };

    /// Base class for all value wrappers.
    ///
    /// Use \ref embrb::value::Value instead of this class.
    class ValueBase {
      VALUE value_;

    protected:
      /// Constructs a `ValueBase` from a Ruby value.
      ///
      /// @param value The Ruby value to be wrapped.
      constexpr ValueBase(VALUE value);

    public:
      /// Constructs a `ValueBase` from a nil value.
      constexpr ValueBase();
      /// Unwraps the `VALUE`.
      ///
      /// @return The wrapped Ruby `VALUE`.
      /// @warning This method should be used with caution and only when you have to call Ruby API
      /// directly.
      constexpr VALUE as_VALUE() const;
      /// Constructs a `ValueBase` from a coerced value.
      ///
      /// @param coerce The coerced value.
      /// @warning This constructor is unsafe.
      ValueBase(detail::unsafe_coerce<ValueBase> coerce): value_(coerce.value) {
      }

      /// Checks if the wrapped value is nil.
      ///
      /// @return Whether the value is nil.
      bool is_nil() const;
      /// Checks if the wrapped value is frozen.
      ///
      /// @return Whether the value is frozen.
      bool is_frozen() const;
      /// Returns the type tag of the wrapped value.
      ///
      /// @return The type tag reported by the runtime.
      ruby_value_type type() const noexcept;
      /// Checks if two wrappers refer to the same object.
      ///
      /// @param other The value to compare with.
      /// @return Whether the references are identical.
      bool is_same(ValueBase other) const noexcept;
      /// Checks if the wrapped value is an instance of a class.
      ///
      /// @param klass The class to check against.
      /// @return Whether the value is an instance of the class.
      template <typename T> bool is_instance_of(ClassT<T> klass) const;
      /// Checks if the wrapped value is a kind of a class.
      ///
      /// @param klass The class to check against.
      /// @return Whether the value is a kind of the class.
      template <typename T> bool is_kind_of(ClassT<T> klass) const;
    };

    template <typename Derived, std::derived_from<ValueBase> Super, Nilability nilable = Nonnil>
    class ValueT: public Super {
    public:
      constexpr ValueT()
        requires(nilable == Nilability::Nilable)
      = default;
      constexpr ValueT()
        requires(nilable != Nilability::Nilable)
      = embrb_delete("This type of Value cannot be nil.");

      template <std::derived_from<Derived> T> ValueT(T const &value): Super(value.as_VALUE()) {
      }
      constexpr ValueT(detail::unsafe_coerce<Derived> coerce): Super(coerce) {
        if constexpr(nilable == Nilability::Nonnil) {
          embrb_assert(!RB_NIL_P(coerce.value) && coerce.value != RUBY_Qfalse);
        }
      }
      Derived &operator=(Derived const &other) {
        Super::operator=(other);
        return static_cast<Derived &>(*this);
      }

      ClassT<Derived> get_class() const;
      Derived freeze() const;

      /// Converts the number into a C++ double using the implicit conversion of the runtime.
      ///
      /// @return The converted number.
      double to_double() const
        requires concepts::NumericValue<Derived>;

      /// Returns the singleton class of the object.
      ///
      /// @return The singleton class.
      Class singleton_class() const
        requires concepts::ObjectValue<Derived>;

      /// Returns the `object_id` of the object.
      ///
      /// @return The object id.
      Integer object_id() const
        requires concepts::ObjectValue<Derived>;

      bool instance_variable_defined(concepts::Identifier auto &&name) const
        requires concepts::ObjectValue<Derived>;
      template <concepts::ConvertibleFromValue T = Value>
      auto instance_variable_get(concepts::Identifier auto &&name) const -> auto
        requires concepts::ObjectValue<Derived>;
      void instance_variable_set(
          concepts::Identifier auto &&name, concepts::ConvertibleIntoValue auto &&value) const
        requires concepts::ObjectValue<Derived>;
    };

    /// Any Ruby value.
    ///
    /// This is the opaque reference. It may be nil and may hold any immediate or heap object.
    class Value: public ValueT<Value, ValueBase, Nilable> {
    public:
      using ValueT<Value, ValueBase, Nilable>::ValueT;

      template <concepts::ConvertibleFromValue R = Value>
      R send(concepts::Identifier auto &&mid, concepts::ConvertibleIntoValue auto &&...args) const;

      bool test() const noexcept;

      /// Compares the values with the `==` method of the receiver.
      ///
      /// @param other The value to compare with.
      /// @return Whether the values are equal.
      bool equals(ValueBase other) const;

      /// Converts the object into a String using its `#inspect` method.
      ///
      /// @return The converted string.
      String inspect() const;

      /// Converts the object into a String using its `#to_s` method.
      ///
      /// @return The converted string.
      String to_string() const;

      static Value const qnil;
      static Value const qtrue;
      static Value const qfalse;
    };

    /// Represents a Ruby module or a class.
    ///
    class Module: public ValueT<Module, Value> {
    public:
      using ValueT<Module, Value>::ValueT;

      static constexpr std::string_view class_name = "Module";
      static std::optional<Module> from_value(Value value) noexcept;

      /// Returns the name path of this module.
      ///
      /// @return The name path of this module.
      String name() const;

      /// Checks if a constant is defined under this module.
      ///
      /// @param name Name of the constant.
      /// @returns Whether the constant is defined.
      bool const_defined(concepts::Identifier auto &&name) const;

      /// Gets the value of a constant under this module.
      ///
      /// @tparam T The type the constant value should be converted into.
      /// @param name Name of the constant.
      /// @return The value converted into T.
      template <concepts::ConvertibleFromValue T = Value>
      T const_get(concepts::Identifier auto &&name) const;
    };

    template <typename T>
    class [[clang::preferred_name(Class)]] ClassT: public ValueT<ClassT<T>, Module> {
    public:
      using ValueT<ClassT<T>, Module>::ValueT;

      static constexpr std::string_view class_name = "Class";
      static std::optional<ClassT<T>> from_value(Value value) noexcept;

      /// Allocates and initializes an instance of this class.
      ///
      /// @param args The arguments to be passed to `initialize.
      /// @return The new instance.
      T new_instance(concepts::ConvertibleIntoValue auto &&...args) const
        requires std::derived_from<T, ValueBase>;

      /// Checks if this class is a subclass of another class.
      ///
      /// @param klass The class to check against.
      /// @return Whether this class is a subclass of the given class.
      template <typename S> bool is_subclass_of(ClassT<S> klass) const;
      /// Checks if this class is a superclass of another class.
      ///
      /// @param klass The class to check against.
      /// @return Whether this class is a superclass of the given class.
      template <typename S> bool is_superclass_of(ClassT<S> klass) const;
    };

    class Symbol: public ValueT<Symbol, Value> {
    public:
      using ValueT<Symbol, Value>::ValueT;
      template <size_t N> explicit Symbol(char const (&)[N]);
      explicit Symbol(std::string_view sv);

      static constexpr std::string_view class_name = "Symbol";
      static std::optional<Symbol> from_value(Value value) noexcept;

      /**
       * Returns Ruby-internal ID.
       *
       * The ID returned by this method may be dynamic and subject to garbage collection.
       * So do not store, whether on stack or in heap.
       */
      ID as_ID() const noexcept;
    };

    class String: public ValueT<String, Value> {
    public:
      using ValueT<String, Value>::ValueT;

      static constexpr std::string_view class_name = "String";
      static std::optional<String> from_value(Value value) noexcept;

      template <concepts::StringLike S> static String intern_from(S &&s);
      template <concepts::CharLike CharT> static String intern_from(CharT const *EMBRB_Nonnull s);
      template <concepts::StringLike S> static String copy_from(S &&s);
      template <concepts::CharLike CharT> static String copy_from(CharT const *EMBRB_Nonnull s);

      size_t size() const noexcept;
      char *EMBRB_Nonnull data() const;
      char const *EMBRB_Nonnull cdata() const noexcept;
      /// Borrows the content of the string.
      ///
      /// @warning The view is valid only while the string is alive and not modified.
      explicit operator std::string_view() const noexcept;
    };

    class Array: public ValueT<Array, Value> {
    public:
      using ValueT<Array, Value>::ValueT;

      static constexpr std::string_view class_name = "Array";
      static std::optional<Array> from_value(Value value) noexcept;

      size_t size() const noexcept;
      template <concepts::ConvertibleFromValue T = Value> decltype(auto) at(size_t i) const;
      Value operator[](size_t i) const;

      template <std::ranges::contiguous_range R>
#ifdef HAVE_STD_IS_LAYOUT_COMPATIBLE
        requires std::is_layout_compatible_v<std::ranges::range_value_t<R>, ValueBase>
#else
        requires(std::derived_from<std::ranges::range_value_t<R>, ValueBase> &&
                 sizeof(std::ranges::range_value_t<R>) == sizeof(ValueBase))
#endif
      static Array new_from(R const &elements);

      static Array new_from(std::initializer_list<ValueBase> elements);

      template <std::derived_from<ValueBase>... T>
      static Array new_from(std::tuple<T...> const &elements);

      static Array new_array();
      static Array new_array(long capacity);

      template <concepts::ConvertibleIntoValue T = Value> Array push_back(T value) const;
      template <concepts::ConvertibleFromValue T = Value> T pop_back() const;
      template <concepts::ConvertibleIntoValue T = Value> Array push_front(T value) const;
      template <concepts::ConvertibleFromValue T = Value> T pop_front() const;
    };

    class Proc: public ValueT<Proc, Value> {
    public:
      using ValueT<Proc, Value>::ValueT;

      static constexpr std::string_view class_name = "Proc";
      static std::optional<Proc> from_value(Value value) noexcept;

      /// Creates a `Proc` that calls a C++ function.
      ///
      /// The function object is owned by the `Proc` and destroyed when the `Proc` is
      /// garbage-collected. C++ exceptions thrown by the function are raised in Ruby:
      /// \ref embrb::Error as its exception, other exceptions as `RuntimeError`.
      ///
      /// @param function The function to be called with the arguments of `Proc#call`.
      /// @return The newly created `Proc`.
      static Proc new_from_function(std::function<detail::ProcFunc> function);

      bool is_lambda() const;
      Value call(Array args) const;
    };

    class Exception: public ValueT<Exception, Value> {
    public:
      using ValueT<Exception, Value>::ValueT;

      static constexpr std::string_view class_name = "Exception";
      static std::optional<Exception> from_value(Value value) noexcept;

      template <std::derived_from<Exception> E, typename... Args>
      static E format(ClassT<E> cls, fmt::format_string<Args...> format_str, Args &&...args);

      /// Returns the message of the exception.
      ///
      /// @return The result of `#message`.
      String message() const;
    };

    /// Represents an instance of `Numeric` or its subclasses.
    ///
    /// This wrapper checks the class hierarchy rather than the type tag, because instances of
    /// user-defined subclasses of `Numeric` are plain objects.
    class Numeric: public ValueT<Numeric, Value> {
    public:
      using ValueT<Numeric, Value>::ValueT;

      static constexpr std::string_view class_name = "Numeric";
      static std::optional<Numeric> from_value(Value value) noexcept;
    };

    /// Represents an `Integer`, either a Fixnum or a Bignum.
    ///
    class Integer: public ValueT<Integer, Numeric> {
    public:
      using ValueT<Integer, Numeric>::ValueT;

      static constexpr std::string_view class_name = "Integer";
      static std::optional<Integer> from_value(Value value) noexcept;

      static Integer from_i64(std::int64_t n);
      static Integer from_u64(std::uint64_t n);

      bool is_fixnum() const noexcept;
      std::int64_t to_i64() const;
    };

    /// Represents a `Float`, either a flonum or a heap-allocated float.
    ///
    class Float: public ValueT<Float, Numeric> {
    public:
      using ValueT<Float, Numeric>::ValueT;

      static constexpr std::string_view class_name = "Float";
      static std::optional<Float> from_value(Value value) noexcept;

      static Float from_f64(double n);

      double to_f64() const noexcept;
    };

    /// Represents a `Rational`.
    ///
    class Rational: public ValueT<Rational, Numeric> {
    public:
      using ValueT<Rational, Numeric>::ValueT;

      static constexpr std::string_view class_name = "Rational";
      static std::optional<Rational> from_value(Value value) noexcept;
    };

    /// Represents a `Complex`.
    ///
    class Complex: public ValueT<Complex, Numeric> {
    public:
      using ValueT<Complex, Numeric>::ValueT;

      static constexpr std::string_view class_name = "Complex";
      /// Narrows a value into a `Complex`.
      ///
      /// @param value The value to check.
      /// @return The `Complex` if the value has the `T_COMPLEX` type tag.
      static std::optional<Complex> from_value(Value value) noexcept;

      /// Creates a `Complex` from its rectangular form.
      ///
      /// @param real The real part.
      /// @param imag The imaginary part.
      /// @return The newly created `Complex`.
      static Complex new_complex(
          concepts::NumericValue auto real, concepts::NumericValue auto imag);

      /// Creates a `Complex` from its polar form.
      ///
      /// The multiplication and trigonometric functions are dispatched on the arguments, so this
      /// may raise for a `Numeric` that does not support them.
      ///
      /// @param abs The absolute value.
      /// @param arg The argument in radians.
      /// @return The newly created `Complex`.
      /// @throw embrb::Error When the runtime raises.
      static Complex polar(concepts::NumericValue auto abs, concepts::NumericValue auto arg);

      /// Returns the real part.
      ///
      /// @tparam T The type the real part should be converted into.
      template <concepts::ConvertibleFromValue T = Value> decltype(auto) real() const;

      /// Returns the imaginary part.
      ///
      /// @tparam T The type the imaginary part should be converted into.
      template <concepts::ConvertibleFromValue T = Value> decltype(auto) imag() const;

      /// Returns the complex conjugate.
      ///
      Complex conjugate() const;

      /// Returns the absolute value (magnitude).
      ///
      double abs() const;

      /// Returns the argument (angle) of the polar form.
      ///
      double arg() const;
    };

    /// Represents a `MatchData`.
    ///
    class Match: public ValueT<Match, Value> {
    public:
      using ValueT<Match, Value>::ValueT;

      static constexpr std::string_view class_name = "MatchData";
      static std::optional<Match> from_value(Value value) noexcept;
    };
  }

  namespace capability {
    template <> inline constexpr bool numeric<value::Numeric> = true;
    template <> inline constexpr bool numeric<value::Integer> = true;
    template <> inline constexpr bool numeric<value::Float> = true;
    template <> inline constexpr bool numeric<value::Rational> = true;
    template <> inline constexpr bool numeric<value::Complex> = true;

    template <> inline constexpr bool object<value::Module> = true;
    template <typename T> inline constexpr bool object<value::ClassT<T>> = true;
    template <> inline constexpr bool object<value::String> = true;
    template <> inline constexpr bool object<value::Array> = true;
    template <> inline constexpr bool object<value::Proc> = true;
    template <> inline constexpr bool object<value::Exception> = true;
    template <> inline constexpr bool object<value::Match> = true;
  }

  /// Built-in classes.
  ///
  /// These are functions because the class objects exist only after the VM is initialized.
  namespace builtin {
    /// `NilClass` class
    ///
    inline value::Class NilClass() {
      return detail::unsafe_coerce<value::Class>(::rb_cNilClass);
    }
    /// `TrueClass` class
    ///
    inline value::Class TrueClass() {
      return detail::unsafe_coerce<value::Class>(::rb_cTrueClass);
    }
    /// `FalseClass` class
    ///
    inline value::Class FalseClass() {
      return detail::unsafe_coerce<value::Class>(::rb_cFalseClass);
    }
    /// `Class` class
    ///
    inline value::ClassT<value::Class> Class() {
      return detail::unsafe_coerce<value::ClassT<value::Class>>(::rb_cClass);
    }
    /// `Module` class
    ///
    inline value::ClassT<value::Module> Module() {
      return detail::unsafe_coerce<value::ClassT<value::Module>>(::rb_cModule);
    }
    /// `BasicObject` class
    ///
    inline value::Class BasicObject() {
      return detail::unsafe_coerce<value::Class>(::rb_cBasicObject);
    }
    /// `Object` class
    ///
    inline value::Class Object() {
      return detail::unsafe_coerce<value::Class>(::rb_cObject);
    }
    /// `String` class
    ///
    inline value::ClassT<value::String> String() {
      return detail::unsafe_coerce<value::ClassT<value::String>>(::rb_cString);
    }
    /// `Symbol` class
    ///
    inline value::ClassT<value::Symbol> Symbol() {
      return detail::unsafe_coerce<value::ClassT<value::Symbol>>(::rb_cSymbol);
    }
    /// `Regexp` class
    ///
    inline value::Class Regexp() {
      return detail::unsafe_coerce<value::Class>(::rb_cRegexp);
    }
    /// `MatchData` class
    ///
    inline value::ClassT<value::Match> MatchData() {
      return detail::unsafe_coerce<value::ClassT<value::Match>>(::rb_cMatch);
    }
    /// `Array` class
    ///
    inline value::ClassT<value::Array> Array() {
      return detail::unsafe_coerce<value::ClassT<value::Array>>(::rb_cArray);
    }
    /// `Hash` class
    ///
    inline value::Class Hash() {
      return detail::unsafe_coerce<value::Class>(::rb_cHash);
    }
    /// `Proc` class
    ///
    inline value::ClassT<value::Proc> Proc() {
      return detail::unsafe_coerce<value::ClassT<value::Proc>>(::rb_cProc);
    }
    /// `Numeric` class
    ///
    inline value::ClassT<value::Numeric> Numeric() {
      return detail::unsafe_coerce<value::ClassT<value::Numeric>>(::rb_cNumeric);
    }
    /// `Integer` class
    ///
    inline value::ClassT<value::Integer> Integer() {
      return detail::unsafe_coerce<value::ClassT<value::Integer>>(::rb_cInteger);
    }
    /// `Float` class
    ///
    inline value::ClassT<value::Float> Float() {
      return detail::unsafe_coerce<value::ClassT<value::Float>>(::rb_cFloat);
    }
    /// `Rational` class
    ///
    inline value::ClassT<value::Rational> Rational() {
      return detail::unsafe_coerce<value::ClassT<value::Rational>>(::rb_cRational);
    }
    /// `Complex` class
    ///
    inline value::ClassT<value::Complex> Complex() {
      return detail::unsafe_coerce<value::ClassT<value::Complex>>(::rb_cComplex);
    }

    /// `Exception` class
    ///
    inline value::ClassT<value::Exception> Exception() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eException);
    }
    /// `StandardError` class
    ///
    inline value::ClassT<value::Exception> StandardError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eStandardError);
    }
    /// `Interrupt` class
    ///
    inline value::ClassT<value::Exception> Interrupt() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eInterrupt);
    }
    /// `SignalException` class
    ///
    inline value::ClassT<value::Exception> SignalException() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eSignal);
    }
    /// `ArgumentError` class
    ///
    inline value::ClassT<value::Exception> ArgumentError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eArgError);
    }
    /// `IndexError` class
    ///
    inline value::ClassT<value::Exception> IndexError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eIndexError);
    }
    /// `RangeError` class
    ///
    inline value::ClassT<value::Exception> RangeError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eRangeError);
    }
    /// `RuntimeError` class
    ///
    inline value::ClassT<value::Exception> RuntimeError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eRuntimeError);
    }
    /// `FrozenError` class
    ///
    inline value::ClassT<value::Exception> FrozenError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eFrozenError);
    }
    /// `TypeError` class
    ///
    inline value::ClassT<value::Exception> TypeError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eTypeError);
    }
    /// `ZeroDivisionError` class
    ///
    inline value::ClassT<value::Exception> ZeroDivisionError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eZeroDivError);
    }
    /// `NoMethodError` class
    ///
    inline value::ClassT<value::Exception> NoMethodError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eNoMethodError);
    }
    /// `NameError` class
    ///
    inline value::ClassT<value::Exception> NameError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eNameError);
    }
    /// `SyntaxError` class
    ///
    inline value::ClassT<value::Exception> SyntaxError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eSyntaxError);
    }
    /// `EncodingError` class
    ///
    inline value::ClassT<value::Exception> EncodingError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eEncodingError);
    }
    /// `LocalJumpError` class
    ///
    inline value::ClassT<value::Exception> LocalJumpError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eLocalJumpError);
    }
    /// `Math::DomainError` class
    ///
    inline value::ClassT<value::Exception> MathDomainError() {
      return detail::unsafe_coerce<value::ClassT<value::Exception>>(::rb_eMathDomainError);
    }
  };

  /// Reference-counted registration of a Ruby object as a GC root.
  ///
  /// The object will not be garbage-collected or moved while any copy of this handle is alive.
  /// Use this to keep a value in heap memory or across native frames.
  template <std::derived_from<ValueBase> T> class PinnedOpt {
    struct Storage {
      T value;

      explicit Storage(T v);
      Storage(Storage const &) = embrb_delete("Storage is registered by address");
      Storage &operator=(Storage const &) = embrb_delete("Storage is registered by address");
      ~Storage();
    };

    std::shared_ptr<Storage> ptr_;

  public:
    /// Initializes the handle with no value.
    ///
    PinnedOpt() = default;
    /// Registers the value.
    ///
    explicit PinnedOpt(T value);

    T &operator*() const noexcept;
    T *EMBRB_Nullable operator->() const noexcept;
    explicit operator bool() const noexcept;
  };

  /// Non-empty version of \ref embrb::PinnedOpt.
  ///
  template <std::derived_from<ValueBase> T> class Pinned: public PinnedOpt<T> {
  public:
    explicit Pinned(T value);

    T *EMBRB_Nonnull operator->() const noexcept;
  };

  /// Leaking object container.
  ///
  /// The contained Ruby object will not be garbage-collected or moved.
  /// Use this container if you want to store Ruby objects in global variables or static block
  /// variables.
  template <std::derived_from<ValueBase> T> class Leak {
    union {
      // T has a VALUE as its first field.
      T value_;
      VALUE raw_value_;
    };
    bool init_;
    bool registered_;

  public:
    /// Initializes the container with no value.
    ///
    Leak() noexcept;
    Leak(Leak<T> const &) = embrb_delete("Leak<T> cannot be copied");
    /// Initializes the container with the given value.
    ///
    Leak(T value);
    Leak<T> &operator=(Leak<T> const &) = embrb_delete("Leak<T> cannot be copied");
    /// Copies the given value into the container, destroying the existing value if any.
    ///
    Leak<T> &operator=(T value);
    /// Gets the value in the container.
    ///
    /// @throw std::runtime_error When the container has no value.
    T get() const;
    /// Copies the given value into the container, destroying the existing value if any.
    ///
    void set(T value);
    /// Gets the value in the container.
    ///
    /// @throw std::runtime_error When the container has no value.
    T operator*() const;
    T const *EMBRB_Nonnull operator->() const;
    /// Clears the container.
    ///
    /// The value originally in the container will be no longer pinned.
    void clear() noexcept;
  };
  template <std::derived_from<ValueBase> T> Leak(T) -> Leak<T>;

  /// The kinds of \ref embrb::Error.
  ///
  enum class ErrorKind {
    /// Wraps an exception object raised by the runtime.
    RuntimeException,
    /// A message created by the host, with the exception class to raise it as.
    HostMessage,
    /// A non-local jump without an exception object (`throw`, `return`, `break`, ...).
    ///
    /// The jump is resumed when the error reaches Ruby through a host callback. The VM keeps
    /// the jump's target in its state, so it can be resumed only before the next call into
    /// the runtime.
    Jump,
  };

  /// Errors from the runtime or from conversions.
  ///
  /// The error keeps its Ruby objects registered as GC roots while it is alive, so it can be
  /// stored or thrown freely. It must not outlive the VM.
  class Error: public std::exception {
    struct RuntimeException {
      Pinned<Exception> exception;
    };
    struct HostMessage {
      Pinned<ClassT<Exception>> klass;
    };
    struct Jump {
      detail::JumpTag tag;
    };

    std::variant<RuntimeException, HostMessage, Jump> repr_;
    std::string message_;
    std::string what_;

  public:
    /// Wraps an exception object raised by the runtime.
    ///
    /// @param exception The exception object.
    explicit Error(Exception exception);
    /// Creates an error from a message.
    ///
    /// @param klass The class of the exception this error is raised as.
    /// @param message The message.
    Error(ClassT<Exception> klass, std::string message);
    /// Creates an error for a jump stopped by `rb_protect`.
    ///
    /// @param tag The state returned by `rb_protect`; must not be `tag_none` or `tag_raise`.
    explicit Error(detail::JumpTag tag);

    template <typename... Args>
    static Error format(
        ClassT<Exception> klass, fmt::format_string<Args...> format_str, Args &&...args);

    ErrorKind kind() const noexcept;
    /// Returns the exception object raised by the runtime.
    ///
    /// @return The identical object that was raised, or nullopt for a host message.
    std::optional<Exception> runtime_exception() const noexcept;
    /// Returns the state of the jump for an error of kind `ErrorKind::Jump`.
    ///
    std::optional<detail::JumpTag> jump_tag() const noexcept;
    /// Returns the class of the exception.
    ///
    /// A jump is reported as `LocalJumpError`.
    ClassT<Exception> exception_class() const noexcept;
    /// Returns the message of the exception.
    ///
    std::string_view message() const noexcept;
    /// Checks if the exception is a kind of the class.
    ///
    bool is_kind_of(ClassT<Exception> klass) const;
    /// Returns the exception object for this error.
    ///
    /// @return The original object for a runtime exception; a new instance otherwise.
    Exception to_exception() const;

    char const *EMBRB_Nonnull what() const noexcept override;
  };

  /// A value narrowed by its type tag.
  ///
  /// `Value` is the alternative for values of any other type.
  using Classified =
      std::variant<Integer, Float, Rational, Complex, Match, String, Symbol, Array, Value>;

  /// Narrows a value by inspecting its type tag once.
  ///
  /// @param value The value to classify.
  /// @return The typed wrapper for the value.
  Classified classify(Value value) noexcept;

  /// Evaluates a Ruby program.
  ///
  /// @tparam T The type the result should be converted into.
  /// @param code The source code.
  /// @return The value of the last expression.
  /// @throw embrb::Error When the program raises, including `SyntaxError`.
  template <concepts::ConvertibleFromValue T = Value> auto eval(std::string_view code) -> auto;

  /// Embedding the VM.
  ///
  namespace embed {
    class Cleanup;

    /// Initializes the Ruby VM.
    ///
    /// Call this once in the process, from `main` or another frame that outlives all the use of
    /// Ruby, on the thread that will run Ruby.
    ///
    /// @param options Command line options for the interpreter, e.g. `--disable-gems`.
    /// @return The handle that tears down the VM when destroyed.
    /// @throw std::runtime_error When the VM failed to start or was initialized before.
    [[nodiscard]] Cleanup init(std::initializer_list<char const *> options = {});

    /// Tears down the VM when destroyed.
    ///
    /// No Ruby value may be used after the VM is torn down.
    class Cleanup {
      bool active_;

      Cleanup() noexcept;
      friend Cleanup init(std::initializer_list<char const *>);

    public:
      Cleanup(Cleanup &&other) noexcept;
      Cleanup(Cleanup const &) = embrb_delete("Cleanup cannot be copied");
      Cleanup &operator=(Cleanup const &) = embrb_delete("Cleanup cannot be copied");
      Cleanup &operator=(Cleanup &&) = embrb_delete("Cleanup cannot be reassigned");
      ~Cleanup();
    };
  }
}

namespace fmt {
  /// Formats a value with its `#to_s` method, or `#inspect` with the `#` flag.
  ///
  template <std::derived_from<embrb::Value> T> struct formatter<T, char> {
    bool inspect = false;

    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) -> decltype(ctx.begin());
    template <typename FormatContext>
    auto format(T value, FormatContext &ctx) const -> decltype(ctx.out());
  };
}
