#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "auxiliary/random.hpp"

namespace swr
{
using PeerIdBytes = std::array<uint8_t, 20>;

/*
 * Azureus-style client id: -SW0100-<12 random bytes>
 */
class PeerId
{
public:
  PeerId()
      : m_peer_id {'-', 'S', 'W', '0', '1', '0', '0', '-'}
  {
    fill_random(m_peer_id, CLIENT_PREFIX_LENGTH);
  }

  explicit PeerId(const PeerIdBytes& raw)
      : m_peer_id {raw}
  {
  }

  const PeerIdBytes& as_raw() const { return m_peer_id; }

  std::string client_prefix() const
  {
    return std::string(m_peer_id.begin(),
                       m_peer_id.begin() + CLIENT_PREFIX_LENGTH);
  }

private:
  static constexpr size_t CLIENT_PREFIX_LENGTH = 8;

  PeerIdBytes m_peer_id;
};
}  // namespace swr
