#pragma once

#include <cstdint>
#include <functional>

#include <utility>
#include <boost/asio/ip/address.hpp>

#include "torrent/metadata/torrentfile.hpp"

namespace swr
{
/// A source of peer addresses. The core only sees addresses through the
/// callback; how they are found is up to the implementation.
class PeerDiscovery
{
public:
  using PeerCallback = std::function<void(
      const InfoHash& content_id, const boost::asio::ip::address& ip, uint16_t port)>;

  virtual ~PeerDiscovery() = default;

  virtual void on_peer(PeerCallback callback) = 0;

  /// Makes the local node known as a source of content_id.
  virtual void announce(const InfoHash& content_id) = 0;
};
}  // namespace swr
