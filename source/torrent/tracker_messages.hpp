#pragma once

#include <algorithm>
#include <array>
#include <cstdint>

#include "auxiliary/big_endian.hpp"
#include "auxiliary/peer_id.hpp"
#include "auxiliary/random.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace swr
{
#pragma pack(push, 1)

/// UDP tracker protocol (BEP 15).

enum class Actions : int32_t
{
  Connect = 0,
  Announce = 1,
  Scrape = 2,
  Error = 3,  // Only sent by tracker to client
};

enum class AnnounceEvent : uint32_t
{
  None = 0,
  Completed = 1,
  Started = 2,
  Stopped = 3,
};

constexpr uint64_t ANNOUNCER_MAGIC = 0x41727101980;

inline uint32_t new_transaction_id()
{
  return generate_random_in_range<uint32_t, 0, UINT32_MAX>();
}

struct SWR_PACKED ConnectRequest
{
  uint64_big protocol_id = ANNOUNCER_MAGIC;
  uint32_big action = static_cast<uint32_t>(Actions::Connect);
  uint32_big transaction_id = new_transaction_id();
};

struct SWR_PACKED ConnectResponse
{
  uint32_big action = static_cast<uint32_t>(Actions::Connect);
  uint32_big transaction_id;
  uint64_big connection_id;
};

struct SWR_PACKED AnnounceRequest
{
  AnnounceRequest() = default;

  AnnounceRequest(uint64_t p_connection_id,
                  const InfoHash& p_info_hash,
                  const PeerId& id,
                  uint64_t p_left,
                  AnnounceEvent p_event,
                  uint16_t p_port)
  {
    connection_id = p_connection_id;
    action = static_cast<uint32_t>(Actions::Announce);
    transaction_id = new_transaction_id();

    std::copy(id.as_raw().cbegin(), id.as_raw().cend(), peer_id);
    std::copy(p_info_hash.cbegin(), p_info_hash.cend(), info_hash);

    left = p_left;
    event = static_cast<uint32_t>(p_event);
    key = generate_random_in_range<uint32_t, 0, UINT32_MAX>();
    port = p_port;
  }

  uint64_big connection_id;
  uint32_big action;
  uint32_big transaction_id;

  uint8_t info_hash[20] {0};
  uint8_t peer_id[20] {0};
  uint64_big downloaded;
  uint64_big left;
  uint64_big uploaded;
  uint32_big event = 0;  // AnnounceEvent
  uint32_big ip_address = 0;  // default, your ip, 0 = this ip
  uint32_big key;  // random unique key
  int32_big num_want = -1;  // num of peers in reply (-1 = default)
  uint16_big port;  // your listening port
};

struct SWR_PACKED IpV4Port
{
  uint32_big ip;
  uint16_big port;
};

struct SWR_PACKED AnnounceResponse
{
  uint32_big action = static_cast<uint32_t>(Actions::Announce);
  uint32_big transaction_id;
  uint32_big interval;
  uint32_big leechers;
  uint32_big seeders;
  // IpV4Port[N]...
};

// followed by the message text, not terminated
struct SWR_PACKED ErrorResponse
{
  uint32_big action = static_cast<uint32_t>(Actions::Error);
  uint32_big transaction_id;
};

#pragma pack(pop)

static_assert(sizeof(ConnectRequest) == 16);
static_assert(sizeof(ConnectResponse) == 16);
static_assert(sizeof(AnnounceRequest) == 98);
static_assert(sizeof(IpV4Port) == 6);
static_assert(sizeof(AnnounceResponse) == 20);
}  // namespace swr
