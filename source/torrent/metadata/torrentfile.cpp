#include <algorithm>
#include <charconv>
#include <limits>

#include "torrent/metadata/torrentfile.hpp"

#include <fmt/format.h>
#include <openssl/sha.h>

using swr::bencode::Dict;
using swr::bencode::List;

namespace swr
{
namespace
{
constexpr size_t SHA1_HASH_SIZE = 20;

std::expected<std::vector<std::string>, TorrentFileParseError> parse_announcers(
    const Dict& top_level)
{
  std::vector<std::string> announcers;

  if (auto announce = bencode::find_string(top_level, "announce")) {
    announcers.push_back(*announce);
  }

  if (auto tiers = bencode::find_list(top_level, "announce-list")) {
    for (const auto& tier : *tiers) {
      if (tier.which() != bencode::IList) {
        return std::unexpected {TorrentFileParseError::InvalidField};
      }

      for (const auto& item : boost::get<List>(tier)) {
        if (item.which() != bencode::IString) {
          return std::unexpected {TorrentFileParseError::InvalidField};
        }

        const auto& url = boost::get<std::string>(item);
        if (std::find(announcers.begin(), announcers.end(), url)
            == announcers.end())
        {
          announcers.push_back(url);
        }
      }
    }
  }

  return announcers;
}

std::expected<std::vector<FileEntry>, TorrentFileParseError> parse_files(
    const Dict& info, const std::string& name)
{
  std::vector<FileEntry> files;

  if (auto length = bencode::find_int(info, "length")) {
    if (*length < 0) {
      return std::unexpected {TorrentFileParseError::InvalidField};
    }

    files.push_back(FileEntry {name, static_cast<uint64_t>(*length)});
    return files;
  }

  auto list = bencode::find_list(info, "files");
  if (list == nullptr) {
    return std::unexpected {TorrentFileParseError::MissingField};
  }

  for (const auto& file_entry : *list) {
    if (file_entry.which() != bencode::IDict) {
      return std::unexpected {TorrentFileParseError::InvalidField};
    }

    const auto& file_dict = boost::get<Dict>(file_entry);

    auto length = bencode::find_int(file_dict, "length");
    auto path = bencode::find_list(file_dict, "path");

    if (length == nullptr || path == nullptr || *length < 0 || path->empty()) {
      return std::unexpected {TorrentFileParseError::InvalidField};
    }

    std::string full_path = name;
    for (const auto& path_part : *path) {
      if (path_part.which() != bencode::IString) {
        return std::unexpected {TorrentFileParseError::InvalidField};
      }

      const auto& part = boost::get<std::string>(path_part);
      if (part.empty() || part == "." || part == "..") {
        return std::unexpected {TorrentFileParseError::InvalidField};
      }

      full_path += "/" + part;
    }

    files.push_back(FileEntry {std::move(full_path), static_cast<uint64_t>(*length)});
  }

  return files;
}
}  // namespace

std::string_view to_string(TorrentFileParseError error)
{
  switch (error) {
    case TorrentFileParseError::Malformed:
      return "malformed bencoding";
    case TorrentFileParseError::MissingField:
      return "missing field";
    case TorrentFileParseError::InvalidField:
      return "invalid field";
    case TorrentFileParseError::Overflow:
      return "value out of range";
  }

  return "unknown";
}

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    const bencode::BeValue& file)
{
  TorrentFile torrent {};

  if (file.which() != bencode::IDict) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }
  const auto& top_level = boost::get<Dict>(file);

  auto trackers = parse_announcers(top_level);
  if (!trackers) {
    return std::unexpected {trackers.error()};
  }
  torrent.trackers = std::move(*trackers);

  auto info = bencode::find_dict(top_level, "info");
  if (info == nullptr) {
    return std::unexpected {TorrentFileParseError::MissingField};
  }

  auto encoded_info = bencode::encode(*info);
  SHA1(reinterpret_cast<const unsigned char*>(encoded_info.data()),
       encoded_info.length(),
       torrent.info_hash.data());

  auto name = bencode::find_string(*info, "name");
  if (name == nullptr) {
    return std::unexpected {TorrentFileParseError::MissingField};
  }
  torrent.metadata.name = *name;

  auto piece_length = bencode::find_int(*info, "piece length");
  if (piece_length == nullptr) {
    return std::unexpected {TorrentFileParseError::MissingField};
  }
  if (*piece_length <= 0
      || *piece_length > std::numeric_limits<uint32_t>::max())
  {
    return std::unexpected {TorrentFileParseError::Overflow};
  }
  torrent.piece_length = static_cast<uint32_t>(*piece_length);

  auto pieces = bencode::find_string(*info, "pieces");
  if (pieces == nullptr) {
    return std::unexpected {TorrentFileParseError::MissingField};
  }
  if (pieces->size() % SHA1_HASH_SIZE != 0) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }

  for (size_t i = 0; i < pieces->size(); i += SHA1_HASH_SIZE) {
    PieceHash hash {};
    std::copy_n(pieces->data() + i, SHA1_HASH_SIZE, hash.begin());
    torrent.piece_hashes.push_back(hash);
  }

  auto files = parse_files(*info, torrent.metadata.name);
  if (!files) {
    return std::unexpected {files.error()};
  }
  torrent.files = std::move(*files);

  for (const auto& entry : torrent.files) {
    torrent.total_length += entry.length;
  }

  auto expected_pieces =
      (torrent.total_length + torrent.piece_length - 1) / torrent.piece_length;
  if (expected_pieces != torrent.piece_hashes.size()) {
    return std::unexpected {TorrentFileParseError::InvalidField};
  }

  if (auto is_private = bencode::find_int(*info, "private")) {
    torrent.metadata.is_private = *is_private == 1;
  }
  if (auto comment = bencode::find_string(top_level, "comment")) {
    torrent.metadata.comment = *comment;
  }
  if (auto created_by = bencode::find_string(top_level, "created by")) {
    torrent.metadata.created_by = *created_by;
  }
  if (auto creation_date = bencode::find_int(top_level, "creation date")) {
    torrent.metadata.creation_date = std::chrono::seconds(*creation_date);
  }

  return torrent;
}

std::expected<TorrentFile, TorrentFileParseError> load_torrent_file(
    std::string_view encoded)
{
  auto decoded = bencode::BDecoder {}(encoded);
  if (!decoded) {
    return std::unexpected {TorrentFileParseError::Malformed};
  }

  return load_torrent_file(*decoded);
}

std::string to_hex(const InfoHash& hash)
{
  std::string result;
  result.reserve(hash.size() * 2);

  for (uint8_t byte : hash) {
    result += fmt::format("{:02x}", byte);
  }

  return result;
}

std::optional<InfoHash> info_hash_from_hex(std::string_view hex)
{
  InfoHash hash {};

  if (hex.size() != hash.size() * 2) {
    return std::nullopt;
  }

  for (size_t i = 0; i < hash.size(); i++) {
    auto pair = hex.substr(i * 2, 2);
    auto result = std::from_chars(pair.data(), pair.data() + pair.size(), hash[i], 16);

    if (result.ec != std::errc {} || result.ptr != pair.data() + pair.size()) {
      return std::nullopt;
    }
  }

  return hash;
}

}  // namespace swr
