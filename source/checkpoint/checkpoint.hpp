#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "torrent/bitfield/bitfield.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace swr
{
/// What a transfer needs besides the bitfield to resume without fetching
/// metadata again.
struct CheckpointMetadata
{
  uint32_t piece_length = 0;
  uint64_t total_length = 0;

  // path of the .torrent file or a magnet link
  std::string source;
  std::string display_name;
  std::string output_dir;
  std::vector<std::string> announce_urls;

  int64_t created_at = 0;  // unix seconds

  bool operator==(const CheckpointMetadata&) const = default;
};

struct Checkpoint
{
  static constexpr uint8_t CURRENT_VERSION = 1;

  uint8_t version = CURRENT_VERSION;
  InfoHash info_hash {};
  uint32_t piece_count = 0;

  // verified pieces only
  aux::BitField bitfield;

  CheckpointMetadata metadata;
  int64_t updated_at = 0;  // unix seconds

  bool operator==(const Checkpoint&) const = default;
};
}  // namespace swr
