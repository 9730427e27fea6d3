#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <span>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "torrent/metadata/torrentfile.hpp"
#include "torrent/tracker_messages.hpp"

namespace swr
{
struct TrackerServerPolicy
{
  uint32_t announce_interval = 1800;  // seconds
  size_t max_peers_per_reply = 50;
  std::chrono::seconds peer_expiry = std::chrono::seconds {3600};
};

/// Minimal UDP tracker: answers connect and announce, keeps the announcing
/// peers of every info hash and hands them to each other.
///
/// Replies report zero seeders and leechers; only IPv4 peers are tracked.
class TrackerServer
{
public:
  explicit TrackerServer(TrackerServerPolicy policy = {});

  /// Reply to one request datagram; empty when nothing should be sent.
  std::vector<uint8_t> handle_datagram(std::span<const uint8_t> datagram,
                                       const boost::asio::ip::udp::endpoint& sender);

  /// Answers requests on socket until it is closed.
  boost::asio::awaitable<void> serve(boost::asio::ip::udp::socket& socket);

  size_t peer_count(const InfoHash& info_hash) const;

private:
  struct Announcer
  {
    uint32_t ip;
    uint16_t port;
    std::chrono::steady_clock::time_point seen;

    auto key() const { return std::pair {ip, port}; }
  };

  std::vector<uint8_t> connect_reply(uint32_t transaction_id);

  std::vector<uint8_t> announce_reply(const AnnounceRequest& request,
                                      const boost::asio::ip::udp::endpoint& sender);

  static std::vector<uint8_t> error_reply(uint32_t transaction_id, std::string_view message);

  void expire(std::vector<Announcer>& announcers) const;

  TrackerServerPolicy m_policy;
  std::map<InfoHash, std::vector<Announcer>> m_swarms;
};
}  // namespace swr
