#pragma once

#include <array>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "torrent/layout/file_layout.hpp"
#include "torrent/metadata/bencode.hpp"

namespace swr
{
using InfoHash = std::array<uint8_t, 20>;
using PieceHash = std::array<uint8_t, 20>;

struct TorrentFileMetadata
{
  std::string name;
  bool is_private = false;
  std::string comment;
  std::string created_by;
  std::chrono::seconds creation_date {0};
};

struct TorrentFile
{
  TorrentFileMetadata metadata;

  InfoHash info_hash {};
  std::vector<FileEntry> files;
  std::vector<std::string> trackers;
  std::vector<PieceHash> piece_hashes;

  uint64_t total_length = 0;
  uint32_t piece_length = 0;
};

enum class TorrentFileParseError : uint8_t
{
  Malformed,
  MissingField,
  InvalidField,
  Overflow,
};

std::string_view to_string(TorrentFileParseError error);

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    const bencode::BeValue& file);

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    std::string_view encoded);

std::string to_hex(const InfoHash& hash);

/// Parses 40 hex digits (either case).
std::optional<InfoHash> info_hash_from_hex(std::string_view hex);

}  // namespace swr
