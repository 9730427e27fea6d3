#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "auxiliary/big_endian.hpp"
#include "auxiliary/peer_id.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace swr
{
#pragma pack(push, 1)

constexpr uint8_t ID_KEEPALIVE = 255;
constexpr uint8_t ID_CHOKE = 0;
constexpr uint8_t ID_UNCHOKE = 1;
constexpr uint8_t ID_INTERESTED = 2;
constexpr uint8_t ID_NOT_INTERESTED = 3;
constexpr uint8_t ID_HAVE = 4;
constexpr uint8_t ID_BITFIELD = 5;
constexpr uint8_t ID_REQUEST = 6;
constexpr uint8_t ID_PIECE = 7;
constexpr uint8_t ID_CANCEL = 8;
constexpr uint8_t ID_PORT = 9;

template<uint8_t Length>
struct SWR_PACKED FixedString
{
  constexpr FixedString(const char (&s)[Length + 1])
  {
    std::copy(s, s + Length, m_data);
  }

  bool operator==(const FixedString& other) const
  {
    return std::equal(m_data, m_data + Length, other.m_data);
  }

  char m_data[Length];
};

struct SWR_PACKED Handshake
{
  Handshake(const InfoHash& info_hash, const PeerId& id)
  {
    std::copy(id.as_raw().cbegin(), id.as_raw().cend(), peer_id);
    std::copy(info_hash.cbegin(), info_hash.cend(), infohash);
  }

  Handshake() = default;

  bool is_valid() const
  {
    return plen == 19 && pname == FixedString<19> {"BitTorrent protocol"};
  }

  InfoHash info_hash() const
  {
    InfoHash hash {};
    std::copy(std::begin(infohash), std::end(infohash), hash.begin());
    return hash;
  }

  PeerIdBytes remote_id() const
  {
    PeerIdBytes id {};
    std::copy(std::begin(peer_id), std::end(peer_id), id.begin());
    return id;
  }

  int8_t plen = 19;
  FixedString<19> pname {"BitTorrent protocol"};
  uint8_t reserved[8] {0};
  uint8_t infohash[20] {0};
  uint8_t peer_id[20] {0};
};

struct SWR_PACKED Keepalive
{
  int32_big length = 0;
};

template<uint32_t Length = 0, uint8_t Id = ID_KEEPALIVE>
struct SWR_PACKED MessageMetadata
{
  void add_length(uint32_t some_length) { length = length + some_length; }

  uint32_big length = Length;
  uint8_t id = Id;
};

struct SWR_PACKED Have
{
  Have() = default;
  explicit Have(uint32_t piece_index)
      : piece_index {piece_index}
  {
  }

private:
  MessageMetadata<5, ID_HAVE> metadata;

public:
  uint32_big piece_index;
};

struct SWR_PACKED Request
{
  Request() = default;
  Request(uint32_t piece_index, uint32_t offset_within_piece, uint32_t length)
      : piece_index {piece_index}
      , offset_within_piece {offset_within_piece}
      , length {length}
  {
  }

private:
  MessageMetadata<13, ID_REQUEST> metadata;

public:
  uint32_big piece_index;
  uint32_big offset_within_piece;
  uint32_big length;
};

struct SWR_PACKED Cancel
{
  Cancel() = default;
  Cancel(uint32_t piece_index, uint32_t offset_within_piece, uint32_t length)
      : piece_index {piece_index}
      , offset_within_piece {offset_within_piece}
      , length {length}
  {
  }

private:
  MessageMetadata<13, ID_CANCEL> metadata;

public:
  uint32_big piece_index;
  uint32_big offset_within_piece;
  uint32_big length;
};

struct SWR_PACKED Port
{
private:
  MessageMetadata<3, ID_PORT> metadata;

public:
  uint16_big port;
};

using Choke = MessageMetadata<1, ID_CHOKE>;
using Unchoke = MessageMetadata<1, ID_UNCHOKE>;
using Interested = MessageMetadata<1, ID_INTERESTED>;
using NotInterested = MessageMetadata<1, ID_NOT_INTERESTED>;

// dynamic length messages

struct SWR_PACKED PieceMetadata
{
  PieceMetadata() = default;
  PieceMetadata(uint32_t piece_index, uint32_t offset_within_piece)
      : piece_index {piece_index}
      , offset_within_piece {offset_within_piece}
  {
  }

  void add_length(uint32_t some_length) { metadata.add_length(some_length); }

private:
  MessageMetadata<9, ID_PIECE> metadata;

public:
  uint32_big piece_index;
  uint32_big offset_within_piece;
};

#pragma pack(pop)

template<typename T>
concept SupportsDynamicLength = requires(T metadata, uint32_t some_length) {
  metadata.add_length(some_length);
};

template<SupportsDynamicLength Metadata>
struct DynamicLengthMessage
{
  DynamicLengthMessage(std::vector<uint8_t> data, Metadata metadata = {})
      : m_metadata {metadata}
      , m_payload {std::move(data)}
  {
    m_metadata.add_length(static_cast<uint32_t>(m_payload.size()));
  }

  const std::vector<uint8_t>& get_payload() const { return m_payload; }

  std::vector<uint8_t> take_payload() { return std::move(m_payload); }

  Metadata get_metadata() const { return m_metadata; }

private:
  Metadata m_metadata;
  std::vector<uint8_t> m_payload;
};

using BitFieldMessage = DynamicLengthMessage<MessageMetadata<1, ID_BITFIELD>>;
using Piece = DynamicLengthMessage<PieceMetadata>;

using TorrentMessage = std::variant<Keepalive,
                                    Choke,
                                    Unchoke,
                                    Interested,
                                    NotInterested,
                                    Have,
                                    BitFieldMessage,
                                    Request,
                                    Piece,
                                    Cancel,
                                    Port>;
}  // namespace swr
