#include <algorithm>
#include <array>
#include <cstring>
#include <limits>

#include "checkpoint/checkpoint_codec.hpp"

#include <openssl/sha.h>
#include <zlib.h>

#include "auxiliary/big_endian.hpp"
#include "auxiliary/error_propagation_macro.hpp"
#include "torrent/metadata/bencode.hpp"

using swr::bencode::Dict;
using swr::bencode::List;

namespace swr
{
namespace
{
constexpr char BINARY_MAGIC[4] = {'S', 'W', 'R', 'C'};
constexpr char COMPRESSED_MAGIC[4] = {'S', 'W', 'R', 'Z'};

// inflated checkpoints larger than this are refused
constexpr uint32_t MAX_INFLATED_LENGTH = 64 * 1024 * 1024;

using Digest = std::array<uint8_t, SHA_DIGEST_LENGTH>;

#pragma pack(push, 1)

struct SWR_PACKED BinaryHeader
{
  char magic[4];
  uint8_t version;
  uint8_t encoding;
  uint8_t info_hash[20];
  uint64_big updated_at;
  uint32_big piece_count;
};

#pragma pack(pop)

static_assert(sizeof(BinaryHeader) == 38);

std::string as_string(std::span<const uint8_t> bytes)
{
  return std::string(bytes.begin(), bytes.end());
}

Digest digest_of(std::span<const uint8_t> bytes)
{
  Digest digest {};
  SHA1(bytes.data(), bytes.size(), digest.data());
  return digest;
}

Digest digest_of(std::string_view text)
{
  return digest_of(
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

template<typename T>
std::expected<T, CheckpointError> bounded_int(const Dict& dict,
                                              const std::string& key,
                                              int64_t min = 0,
                                              int64_t max = std::numeric_limits<T>::max())
{
  auto value = bencode::find_int(dict, key);

  if (value == nullptr) {
    return std::unexpected(CheckpointError::Malformed);
  }

  if (*value < min || *value > max) {
    return std::unexpected(CheckpointError::Malformed);
  }

  return static_cast<T>(*value);
}

std::expected<std::string, CheckpointError> required_string(const Dict& dict,
                                                            const std::string& key)
{
  auto value = bencode::find_string(dict, key);

  if (value == nullptr) {
    return std::unexpected(CheckpointError::Malformed);
  }

  return *value;
}

void put_metadata(Dict& dict, const CheckpointMetadata& metadata)
{
  List announce;
  for (const auto& url : metadata.announce_urls) {
    announce.emplace_back(url);
  }

  dict["announce"] = std::move(announce);
  dict["created_at"] = metadata.created_at;
  dict["name"] = metadata.display_name;
  dict["output_dir"] = metadata.output_dir;
  dict["piece_length"] = static_cast<int64_t>(metadata.piece_length);
  dict["source"] = metadata.source;
  dict["total_length"] = static_cast<int64_t>(metadata.total_length);
}

std::expected<CheckpointMetadata, CheckpointError> take_metadata(const Dict& dict)
{
  CheckpointMetadata metadata;

  metadata.piece_length = SWR_TRY(bounded_int<uint32_t>(dict, "piece_length"));
  metadata.total_length = SWR_TRY(
      bounded_int<uint64_t>(dict, "total_length", 0, std::numeric_limits<int64_t>::max()));
  metadata.created_at = SWR_TRY(bounded_int<int64_t>(
      dict, "created_at", std::numeric_limits<int64_t>::min()));
  metadata.source = SWR_TRY(required_string(dict, "source"));
  metadata.display_name = SWR_TRY(required_string(dict, "name"));
  metadata.output_dir = SWR_TRY(required_string(dict, "output_dir"));

  auto announce = bencode::find_list(dict, "announce");
  if (announce == nullptr) {
    return std::unexpected(CheckpointError::Malformed);
  }

  for (const auto& url : *announce) {
    if (url.which() != bencode::IString) {
      return std::unexpected(CheckpointError::Malformed);
    }
    metadata.announce_urls.push_back(boost::get<std::string>(url));
  }

  return metadata;
}

std::expected<Checkpoint, CheckpointError> validated(Checkpoint checkpoint)
{
  if (checkpoint.bitfield.size() != checkpoint.piece_count) {
    return std::unexpected(CheckpointError::Inconsistent);
  }

  const auto& metadata = checkpoint.metadata;

  if (metadata.piece_length > 0) {
    auto expected_pieces =
        (metadata.total_length + metadata.piece_length - 1) / metadata.piece_length;

    if (expected_pieces != checkpoint.piece_count) {
      return std::unexpected(CheckpointError::Inconsistent);
    }
  }

  return checkpoint;
}

std::vector<uint8_t> encode_binary(const Checkpoint& checkpoint)
{
  BinaryHeader header {};
  std::copy(std::begin(BINARY_MAGIC), std::end(BINARY_MAGIC), header.magic);
  header.version = checkpoint.version;
  header.encoding = static_cast<uint8_t>(CheckpointFormat::Binary);
  std::copy(checkpoint.info_hash.begin(), checkpoint.info_hash.end(), header.info_hash);
  header.updated_at = static_cast<uint64_t>(checkpoint.updated_at);
  header.piece_count = checkpoint.piece_count;

  Dict metadata;
  put_metadata(metadata, checkpoint.metadata);
  auto encoded_metadata = bencode::encode(metadata);

  std::vector<uint8_t> out;
  append_struct(out, header);

  const auto& raw = checkpoint.bitfield.as_raw();
  out.insert(out.end(), raw.begin(), raw.end());

  append_big<uint32_t>(out, static_cast<uint32_t>(encoded_metadata.size()));
  out.insert(out.end(), encoded_metadata.begin(), encoded_metadata.end());

  // SHA-1 of everything before it
  auto digest = digest_of(out);
  out.insert(out.end(), digest.begin(), digest.end());

  return out;
}

std::expected<Checkpoint, CheckpointError> decode_binary(std::span<const uint8_t> data)
{
  if (data.size() < sizeof(BinaryHeader) + SHA_DIGEST_LENGTH) {
    return std::unexpected(CheckpointError::Truncated);
  }

  BinaryHeader header;
  std::memcpy(&header, data.data(), sizeof(header));

  if (!std::equal(std::begin(BINARY_MAGIC), std::end(BINARY_MAGIC), header.magic)) {
    return std::unexpected(CheckpointError::BadMagic);
  }

  if (header.version != Checkpoint::CURRENT_VERSION) {
    return std::unexpected(CheckpointError::UnsupportedVersion);
  }

  if (header.encoding != static_cast<uint8_t>(CheckpointFormat::Binary)) {
    return std::unexpected(CheckpointError::WrongEncoding);
  }

  auto body = data.first(data.size() - SHA_DIGEST_LENGTH);
  auto trailer = data.last(SHA_DIGEST_LENGTH);
  auto digest = digest_of(body);

  if (!std::equal(digest.begin(), digest.end(), trailer.begin())) {
    return std::unexpected(CheckpointError::Malformed);
  }

  Checkpoint checkpoint;
  checkpoint.version = header.version;
  std::copy(std::begin(header.info_hash),
            std::end(header.info_hash),
            checkpoint.info_hash.begin());
  checkpoint.updated_at = static_cast<int64_t>(static_cast<uint64_t>(header.updated_at));
  checkpoint.piece_count = header.piece_count;

  auto rest = body.subspan(sizeof(BinaryHeader));
  auto bitfield_length = aux::BitField::byte_length(checkpoint.piece_count);

  if (rest.size() < bitfield_length + sizeof(uint32_t)) {
    return std::unexpected(CheckpointError::Truncated);
  }

  checkpoint.bitfield = aux::BitField(
      std::vector<uint8_t>(rest.begin(), rest.begin() + bitfield_length),
      checkpoint.piece_count);
  rest = rest.subspan(bitfield_length);

  auto metadata_length = load_big<uint32_t>(rest.data());
  rest = rest.subspan(sizeof(uint32_t));

  if (rest.size() != metadata_length) {
    return std::unexpected(rest.size() < metadata_length ? CheckpointError::Truncated
                                                         : CheckpointError::Malformed);
  }

  auto decoded = bencode::BDecoder {}(
      std::string_view(reinterpret_cast<const char*>(rest.data()), rest.size()));

  if (!decoded || decoded->which() != bencode::IDict) {
    return std::unexpected(CheckpointError::Malformed);
  }

  checkpoint.metadata = SWR_TRY(take_metadata(boost::get<Dict>(*decoded)));

  return validated(std::move(checkpoint));
}

std::vector<uint8_t> encode_bencode(const Checkpoint& checkpoint)
{
  Dict dict;
  put_metadata(dict, checkpoint.metadata);

  dict["bitfield"] = as_string(checkpoint.bitfield.as_raw());
  dict["encoding"] = std::string(to_string(CheckpointFormat::Bencode));
  dict["info_hash"] = as_string(checkpoint.info_hash);
  dict["piece_count"] = static_cast<int64_t>(checkpoint.piece_count);
  dict["updated_at"] = checkpoint.updated_at;
  dict["version"] = static_cast<int64_t>(checkpoint.version);

  // SHA-1 of the dictionary encoded without this key
  auto digest = digest_of(bencode::encode(dict));
  dict["digest"] = as_string(digest);

  auto encoded = bencode::encode(dict);
  return std::vector<uint8_t>(encoded.begin(), encoded.end());
}

std::expected<Checkpoint, CheckpointError> decode_bencode(std::span<const uint8_t> data)
{
  auto decoded = bencode::BDecoder {}(
      std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));

  if (!decoded) {
    return std::unexpected(decoded.error() == bencode::DecodeError::Truncated
                               ? CheckpointError::Truncated
                               : CheckpointError::Malformed);
  }

  if (decoded->which() != bencode::IDict) {
    return std::unexpected(CheckpointError::Malformed);
  }

  auto dict = boost::get<Dict>(*decoded);

  auto stored_digest = SWR_TRY(required_string(dict, "digest"));
  dict.erase("digest");

  // decoding is canonical, so re-encoding gives back the digested bytes
  auto digest = digest_of(bencode::encode(dict));

  if (stored_digest.size() != digest.size()
      || !std::equal(digest.begin(), digest.end(), stored_digest.begin()))
  {
    return std::unexpected(CheckpointError::Malformed);
  }

  auto encoding = SWR_TRY(required_string(dict, "encoding"));
  if (encoding != to_string(CheckpointFormat::Bencode)) {
    return std::unexpected(CheckpointError::WrongEncoding);
  }

  Checkpoint checkpoint;
  checkpoint.version = SWR_TRY(bounded_int<uint8_t>(dict, "version"));

  if (checkpoint.version != Checkpoint::CURRENT_VERSION) {
    return std::unexpected(CheckpointError::UnsupportedVersion);
  }

  auto info_hash = SWR_TRY(required_string(dict, "info_hash"));
  if (info_hash.size() != checkpoint.info_hash.size()) {
    return std::unexpected(CheckpointError::Malformed);
  }
  std::copy(info_hash.begin(), info_hash.end(), checkpoint.info_hash.begin());

  checkpoint.piece_count = SWR_TRY(bounded_int<uint32_t>(dict, "piece_count"));
  checkpoint.updated_at = SWR_TRY(bounded_int<int64_t>(
      dict, "updated_at", std::numeric_limits<int64_t>::min()));

  auto bitfield = SWR_TRY(required_string(dict, "bitfield"));
  if (bitfield.size() != aux::BitField::byte_length(checkpoint.piece_count)) {
    return std::unexpected(CheckpointError::Inconsistent);
  }
  checkpoint.bitfield = aux::BitField(std::vector<uint8_t>(bitfield.begin(), bitfield.end()),
                                      checkpoint.piece_count);

  checkpoint.metadata = SWR_TRY(take_metadata(dict));

  return validated(std::move(checkpoint));
}
}  // namespace

std::string_view to_string(CheckpointError error)
{
  switch (error) {
    case CheckpointError::NotFound:
      return "no checkpoint";
    case CheckpointError::IoFailed:
      return "checkpoint i/o failed";
    case CheckpointError::BadMagic:
      return "not a checkpoint file";
    case CheckpointError::UnsupportedVersion:
      return "unsupported checkpoint version";
    case CheckpointError::WrongEncoding:
      return "checkpoint declares another encoding";
    case CheckpointError::Truncated:
      return "checkpoint truncated";
    case CheckpointError::Malformed:
      return "checkpoint malformed";
    case CheckpointError::Inconsistent:
      return "checkpoint fields disagree";
    case CheckpointError::CompressionFailed:
      return "checkpoint compression failed";
  }

  return "unknown";
}

std::string_view to_string(CheckpointFormat format)
{
  switch (format) {
    case CheckpointFormat::Binary:
      return "binary";
    case CheckpointFormat::Bencode:
      return "bencode";
  }

  return "unknown";
}

std::optional<CheckpointFormat> parse_checkpoint_format(std::string_view name)
{
  if (name == "binary") {
    return CheckpointFormat::Binary;
  }

  if (name == "bencode") {
    return CheckpointFormat::Bencode;
  }

  return std::nullopt;
}

std::vector<uint8_t> encode_checkpoint(const Checkpoint& checkpoint,
                                       CheckpointFormat format)
{
  switch (format) {
    case CheckpointFormat::Bencode:
      return encode_bencode(checkpoint);
    case CheckpointFormat::Binary:
      break;
  }

  return encode_binary(checkpoint);
}

std::expected<Checkpoint, CheckpointError> decode_checkpoint(
    std::span<const uint8_t> data, CheckpointFormat format)
{
  if (is_compressed_checkpoint(data)) {
    auto inflated = SWR_TRY(decompress_checkpoint(data));

    if (is_compressed_checkpoint(inflated)) {
      return std::unexpected(CheckpointError::Malformed);
    }

    return decode_checkpoint(inflated, format);
  }

  auto declared = sniff_checkpoint_format(data);

  if (declared && *declared != format) {
    return std::unexpected(CheckpointError::WrongEncoding);
  }

  switch (format) {
    case CheckpointFormat::Bencode:
      return decode_bencode(data);
    case CheckpointFormat::Binary:
      break;
  }

  return decode_binary(data);
}

std::optional<CheckpointFormat> sniff_checkpoint_format(std::span<const uint8_t> data)
{
  if (data.size() >= sizeof(BINARY_MAGIC)
      && std::equal(std::begin(BINARY_MAGIC), std::end(BINARY_MAGIC), data.begin()))
  {
    return CheckpointFormat::Binary;
  }

  if (!data.empty() && data.front() == 'd') {
    return CheckpointFormat::Bencode;
  }

  return std::nullopt;
}

std::expected<Checkpoint, CheckpointError> decode_any_checkpoint(
    std::span<const uint8_t> data)
{
  if (is_compressed_checkpoint(data)) {
    auto inflated = SWR_TRY(decompress_checkpoint(data));

    if (is_compressed_checkpoint(inflated)) {
      return std::unexpected(CheckpointError::Malformed);
    }

    return decode_any_checkpoint(inflated);
  }

  auto format = sniff_checkpoint_format(data);
  if (!format) {
    return std::unexpected(CheckpointError::BadMagic);
  }

  return decode_checkpoint(data, *format);
}

bool is_compressed_checkpoint(std::span<const uint8_t> data)
{
  return data.size() >= sizeof(COMPRESSED_MAGIC)
      && std::equal(std::begin(COMPRESSED_MAGIC), std::end(COMPRESSED_MAGIC), data.begin());
}

std::expected<std::vector<uint8_t>, CheckpointError> compress_checkpoint(
    std::span<const uint8_t> data)
{
  if (data.size() > MAX_INFLATED_LENGTH) {
    return std::unexpected(CheckpointError::CompressionFailed);
  }

  std::vector<uint8_t> out(std::begin(COMPRESSED_MAGIC), std::end(COMPRESSED_MAGIC));
  append_big<uint32_t>(out, static_cast<uint32_t>(data.size()));

  auto header_length = out.size();
  auto bound = compressBound(static_cast<uLong>(data.size()));
  out.resize(header_length + bound);

  uLongf compressed_length = bound;
  int result = compress2(out.data() + header_length,
                         &compressed_length,
                         data.data(),
                         static_cast<uLong>(data.size()),
                         Z_BEST_COMPRESSION);

  if (result != Z_OK) {
    return std::unexpected(CheckpointError::CompressionFailed);
  }

  out.resize(header_length + compressed_length);
  return out;
}

std::expected<std::vector<uint8_t>, CheckpointError> decompress_checkpoint(
    std::span<const uint8_t> data)
{
  constexpr auto HEADER_LENGTH = sizeof(COMPRESSED_MAGIC) + sizeof(uint32_t);

  if (!is_compressed_checkpoint(data)) {
    return std::unexpected(CheckpointError::BadMagic);
  }

  if (data.size() < HEADER_LENGTH) {
    return std::unexpected(CheckpointError::Truncated);
  }

  auto inflated_length = load_big<uint32_t>(data.data() + sizeof(COMPRESSED_MAGIC));

  if (inflated_length == 0 || inflated_length > MAX_INFLATED_LENGTH) {
    return std::unexpected(CheckpointError::Malformed);
  }

  std::vector<uint8_t> out(inflated_length);
  uLongf out_length = inflated_length;

  auto compressed = data.subspan(HEADER_LENGTH);
  int result = uncompress(
      out.data(), &out_length, compressed.data(), static_cast<uLong>(compressed.size()));

  if (result != Z_OK || out_length != inflated_length) {
    return std::unexpected(CheckpointError::Malformed);
  }

  return out;
}
}  // namespace swr
