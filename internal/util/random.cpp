#include "random.hpp"

#include <random>

namespace devicefarm::util {

std::string RandomAlphanumeric(std::size_t length) {
  static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i)
    out.push_back(kAlphabet[pick(rng)]);

  return out;
}

} // namespace devicefarm::util
