#include <iostream>

#include <embrb/embrb.hpp>

int main() {
  auto cleanup = embrb::embed::init({"--disable-gems"});

  try {
    auto const z = embrb::Complex::new_complex(
        embrb::Integer::from_i64(3), embrb::Integer::from_i64(-4));
    std::cout << fmt::format("z={} |z|={} conj={:#}", z, z.abs(), z.conjugate()) << std::endl;

    auto const w =
        embrb::Complex::polar(embrb::Integer::from_i64(2), embrb::Integer::from_i64(3));
    std::cout << fmt::format("polar(2, 3)={}", w) << std::endl;

    auto const square = embrb::Proc::new_from_function([](std::span<embrb::Value const> args) {
      auto const c = embrb::from_Value<embrb::Complex>(args[0]);
      return c.send("*", c);
    });
    auto const squared = embrb::eval<embrb::Proc>("->(f) { f.call(Complex(1, 1)) }")
                             .call(embrb::Array::new_from({square}));
    std::cout << fmt::format("(1+1i)**2={}", squared) << std::endl;
  } catch(embrb::Error const &err) {
    std::cerr << err.what() << std::endl;
    return 1;
  }
}
