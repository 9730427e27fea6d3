#include <algorithm>
#include <bit>

#include "torrent/bitfield/bitfield.hpp"

namespace swr::aux
{
namespace
{
constexpr size_t BITS_PER_BYTE = 8;

uint8_t mask_of(size_t piece_index)
{
  return static_cast<uint8_t>(1u << (7 - piece_index % BITS_PER_BYTE));
}
}  // namespace

BitField::BitField(size_t piece_count)
    : m_bitfield(byte_length(piece_count))
    , m_size {piece_count}
{
}

BitField::BitField(std::vector<uint8_t> bitfield, size_t piece_count)
    : m_bitfield(std::move(bitfield))
    , m_size {piece_count}
{
  m_bitfield.resize(byte_length(piece_count));

  if (auto spare = m_size % BITS_PER_BYTE; spare != 0) {
    m_bitfield.back() &= static_cast<uint8_t>(0xFF << (BITS_PER_BYTE - spare));
  }
}

void BitField::mark(size_t piece_index, bool value)
{
  if (piece_index >= m_size) {
    return;
  }

  auto& container = m_bitfield[piece_index / BITS_PER_BYTE];

  if (value) {
    container |= mask_of(piece_index);
  } else {
    container &= static_cast<uint8_t>(~mask_of(piece_index));
  }
}

bool BitField::get(size_t piece_index) const
{
  if (piece_index >= m_size) {
    return false;
  }

  return (m_bitfield[piece_index / BITS_PER_BYTE] & mask_of(piece_index)) != 0;
}

size_t BitField::count() const
{
  size_t total = 0;

  for (auto u : m_bitfield) {
    total += std::popcount(u);
  }

  return total;
}

bool BitField::is_empty() const
{
  return std::all_of(
      m_bitfield.cbegin(), m_bitfield.cend(), [](uint8_t u) { return u == 0; });
}

bool BitField::all() const
{
  return count() == m_size;
}

bool BitField::is_subset_of(const BitField& other) const
{
  for (size_t i = 0; i < m_bitfield.size(); i++) {
    uint8_t theirs = i < other.m_bitfield.size() ? other.m_bitfield[i] : 0;

    if ((m_bitfield[i] & ~theirs) != 0) {
      return false;
    }
  }

  return true;
}
}  // namespace swr::aux
