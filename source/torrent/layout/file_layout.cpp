#include <algorithm>
#include <stdexcept>

#include "torrent/layout/file_layout.hpp"

namespace swr
{
std::string_view to_string(LayoutError error)
{
  switch (error) {
    case LayoutError::PieceOutOfRange:
      return "piece index out of range";
    case LayoutError::RangeOutOfPiece:
      return "range exceeds piece bounds";
  }

  return "unknown";
}

FileLayout::FileLayout(std::vector<FileEntry> files, uint32_t piece_length)
    : m_files {std::move(files)}
    , m_piece_length {piece_length}
{
  if (m_piece_length == 0) {
    throw std::invalid_argument("piece length must be positive");
  }

  if (m_files.empty()) {
    throw std::invalid_argument("layout needs at least one file");
  }

  m_file_starts.reserve(m_files.size());

  for (const auto& file : m_files) {
    m_file_starts.push_back(m_total_length);
    m_total_length += file.length;
  }

  m_piece_count = static_cast<uint32_t>(
      (m_total_length + m_piece_length - 1) / m_piece_length);

  m_piece_segments.reserve(m_piece_count);

  for (uint32_t piece = 0; piece < m_piece_count; piece++) {
    m_piece_segments.push_back(
        slice(static_cast<uint64_t>(piece) * m_piece_length, piece_size(piece)));
  }
}

uint32_t FileLayout::piece_size(uint32_t piece_index) const
{
  if (piece_index >= m_piece_count) {
    return 0;
  }

  auto start = static_cast<uint64_t>(piece_index) * m_piece_length;

  return static_cast<uint32_t>(
      std::min<uint64_t>(m_piece_length, m_total_length - start));
}

std::expected<std::vector<FileSegment>, LayoutError> FileLayout::map(
    uint32_t piece_index, uint32_t intra_offset, uint32_t length) const
{
  if (piece_index >= m_piece_count) {
    return std::unexpected(LayoutError::PieceOutOfRange);
  }

  auto size = piece_size(piece_index);

  if (intra_offset > size || length > size - intra_offset) {
    return std::unexpected(LayoutError::RangeOutOfPiece);
  }

  if (intra_offset == 0 && length == size) {
    return m_piece_segments[piece_index];
  }

  return slice(static_cast<uint64_t>(piece_index) * m_piece_length + intra_offset,
               length);
}

const std::vector<FileSegment>& FileLayout::piece_segments(
    uint32_t piece_index) const
{
  return m_piece_segments.at(piece_index);
}

std::vector<FileSegment> FileLayout::slice(uint64_t absolute_offset,
                                           uint32_t length) const
{
  std::vector<FileSegment> segments;

  // last file starting at or before the offset
  auto it = std::upper_bound(
      m_file_starts.begin(), m_file_starts.end(), absolute_offset);
  auto file_index = static_cast<size_t>(std::distance(m_file_starts.begin(), it));
  file_index = file_index == 0 ? 0 : file_index - 1;

  uint64_t remaining = length;
  uint64_t file_offset = absolute_offset - m_file_starts[file_index];

  for (; remaining > 0 && file_index < m_files.size(); file_index++) {
    const auto& file = m_files[file_index];

    if (file_offset < file.length) {
      auto take = std::min(file.length - file_offset, remaining);

      segments.push_back(FileSegment {.file_index = file_index,
                                      .path = file.path,
                                      .file_offset = file_offset,
                                      .length = static_cast<uint32_t>(take)});
      remaining -= take;
      file_offset = 0;
    } else {
      file_offset -= file.length;
    }
  }

  return segments;
}
}  // namespace swr
