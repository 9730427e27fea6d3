#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#ifndef SWR_PACKED
#  if defined SWR_BROKEN_GCC_STRUCTURE_PACKING && defined __GNUC__
// Used for gcc tool chains accepting but not supporting pragma pack
// See http://gcc.gnu.org/onlinedocs/gcc/Type-Attributes.html
#    define SWR_PACKED __attribute__((__packed__))
#  else
#    define SWR_PACKED
#  endif
#endif

namespace swr
{
template<typename T>
constexpr T to_network_order(T value)
{
  if constexpr (std::endian::native == std::endian::little) {
    return std::byteswap(value);
  } else {
    return value;
  }
}

#pragma pack(push, 1)

/// Integer stored in network byte order, usable as a member of packed wire
/// structs.
template<typename T>
class SWR_PACKED BigEndian
{
public:
  constexpr BigEndian()
      : m_value {0}
  {
  }

  constexpr BigEndian(T value)
      : m_value {to_network_order(value)}
  {
  }

  BigEndian& operator=(T value)
  {
    m_value = to_network_order(value);
    return *this;
  }

  constexpr operator T() const { return to_network_order(m_value); }

private:
  T m_value;
};

using byte = uint8_t;
using int32_big = BigEndian<int32_t>;
using uint16_big = BigEndian<uint16_t>;
using uint32_big = BigEndian<uint32_t>;
using uint64_big = BigEndian<uint64_t>;

#pragma pack(pop)

template<typename T>
T load_big(const uint8_t* data)
{
  T value;
  std::memcpy(&value, data, sizeof(T));
  return to_network_order(value);
}

template<typename T>
void append_big(std::vector<uint8_t>& out, T value)
{
  auto be = to_network_order(value);
  auto bytes = reinterpret_cast<const uint8_t*>(&be);
  out.insert(out.end(), bytes, bytes + sizeof(T));
}

/// Appends the raw bytes of a packed wire struct.
template<typename Packed>
void append_struct(std::vector<uint8_t>& out, const Packed& value)
{
  auto bytes = reinterpret_cast<const uint8_t*>(&value);
  out.insert(out.end(), bytes, bytes + sizeof(Packed));
}
}  // namespace swr
