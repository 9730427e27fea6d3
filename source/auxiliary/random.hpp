#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <mutex>
#include <random>

namespace swr
{
template<typename T, T Min, T Max>
T generate_random_in_range()
{
  static std::mutex lock;
  static std::mt19937_64 rng {std::random_device {}()};
  static std::uniform_int_distribution<T> uni {Min, Max};

  std::lock_guard guard {lock};
  return uni(rng);
}

template<typename T>
T generate_random_in_range(T min, T max)
{
  static std::mutex lock;
  static std::mt19937_64 rng {std::random_device {}()};
  std::uniform_int_distribution<T> uni {min, max};

  std::lock_guard guard {lock};
  return uni(rng);
}

template<size_t N>
void fill_random(std::array<uint8_t, N>& out, size_t from = 0)
{
  std::generate(out.begin() + from,
                out.end(),
                [] {
                  return static_cast<uint8_t>(
                      generate_random_in_range<uint16_t, 0, 255>());
                });
}
}  // namespace swr
