#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace swr::aux
{
/// Piece bitfield in wire order: bit 7 of byte 0 is piece 0.
class BitField
{
  std::vector<uint8_t> m_bitfield;
  size_t m_size = 0;

public:
  BitField() = default;

  explicit BitField(size_t piece_count);

  /// Adopts raw wire bytes; bits past piece_count are cleared.
  BitField(std::vector<uint8_t> bitfield, size_t piece_count);

  void mark(size_t piece_index, bool value);

  bool get(size_t piece_index) const;

  size_t size() const { return m_size; }

  size_t count() const;

  bool is_empty() const;

  bool all() const;

  const std::vector<uint8_t>& as_raw() const { return m_bitfield; }

  /// True when every piece set here is also set in other.
  bool is_subset_of(const BitField& other) const;

  bool operator==(const BitField&) const = default;

  static size_t byte_length(size_t piece_count) { return (piece_count + 7) / 8; }
};
}  // namespace swr::aux
