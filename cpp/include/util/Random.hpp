#pragma once

#include <concepts>
#include <random>

/*
 * Process-wide source of randomness, used for the random-move mode of the SearchEngine.
 *
 * The default prng is seeded from the clock. Pass --seed (see Params) to make a run reproducible,
 * after which util::Random::init() must be called with the parsed params.
 *
 * The overloads taking a std::mt19937& let callers keep an independent prng.
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  static void set_seed(int seed);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * T and U should be integral types, and lower must be less than upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
