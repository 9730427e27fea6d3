#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace swr
{
struct FileEntry
{
  std::string path;
  uint64_t length;
};

/// Byte range of one destination file covered by (part of) a piece.
struct FileSegment
{
  size_t file_index;
  std::string path;
  uint64_t file_offset;
  uint32_t length;

  bool operator==(const FileSegment&) const = default;
};

enum class LayoutError : uint8_t
{
  PieceOutOfRange,
  RangeOutOfPiece,
};

std::string_view to_string(LayoutError error);

/// Maps piece addresses onto the files of a single- or multi-file transfer.
/// All files are laid out back to back in the order given; paths are
/// relative to the download root.
class FileLayout
{
  std::vector<FileEntry> m_files;
  std::vector<uint64_t> m_file_starts;
  std::vector<std::vector<FileSegment>> m_piece_segments;

  uint64_t m_total_length = 0;
  uint32_t m_piece_length;
  uint32_t m_piece_count = 0;

public:
  FileLayout(std::vector<FileEntry> files, uint32_t piece_length);

  /// Segments covering [intra_offset, intra_offset + length) of a piece, in
  /// ascending logical order. Zero-length files never appear.
  std::expected<std::vector<FileSegment>, LayoutError> map(
      uint32_t piece_index, uint32_t intra_offset, uint32_t length) const;

  /// Precomputed segments of a whole piece.
  const std::vector<FileSegment>& piece_segments(uint32_t piece_index) const;

  uint32_t piece_size(uint32_t piece_index) const;

  uint32_t piece_count() const { return m_piece_count; }

  uint32_t piece_length() const { return m_piece_length; }

  uint64_t total_length() const { return m_total_length; }

  const std::vector<FileEntry>& files() const { return m_files; }

private:
  std::vector<FileSegment> slice(uint64_t absolute_offset, uint32_t length) const;
};
}  // namespace swr
