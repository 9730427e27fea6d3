#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "auxiliary/peer_id.hpp"
#include "torrent/metadata/torrentfile.hpp"
#include "torrent/tracker_messages.hpp"

namespace swr
{
enum class TrackerError : uint8_t
{
  UnsupportedUrl,
  ResolveFailed,
  Timeout,
  NetworkFailure,
  BadResponse,
  TransactionMismatch,
  Rejected,
};

std::string_view to_string(TrackerError error);

struct TrackerUrl
{
  std::string host;
  std::string port;
};

/// Host and port of a udp://host:port[/path] announce url.
std::optional<TrackerUrl> parse_udp_tracker_url(std::string_view url);

struct AnnounceParameters
{
  InfoHash info_hash {};
  PeerId peer_id;
  uint64_t left = 0;
  AnnounceEvent event = AnnounceEvent::None;
  uint16_t port = 0;
};

struct AnnounceResult
{
  uint32_t interval = 0;
  uint32_t leechers = 0;
  uint32_t seeders = 0;
  std::vector<boost::asio::ip::tcp::endpoint> peers;
};

/// 6-byte big-endian IPv4 and port entries; a trailing partial entry and
/// zero addresses are skipped.
std::vector<boost::asio::ip::tcp::endpoint> parse_compact_peers(
    std::span<const uint8_t> compact);

std::expected<uint64_t, TrackerError> parse_connect_response(
    std::span<const uint8_t> datagram, uint32_t transaction_id);

std::expected<AnnounceResult, TrackerError> parse_announce_response(
    std::span<const uint8_t> datagram, uint32_t transaction_id);

/// Client side of a UDP tracker: connect, then announce.
class Tracker
{
  boost::asio::ip::udp::endpoint m_endpoint;

public:
  explicit Tracker(boost::asio::ip::udp::endpoint endpoint);

  static boost::asio::awaitable<std::expected<Tracker, TrackerError>> resolve(
      std::string_view url);

  /// Both exchanges together must finish within timeout.
  boost::asio::awaitable<std::expected<AnnounceResult, TrackerError>> announce(
      const AnnounceParameters& parameters, std::chrono::milliseconds timeout) const;

  const boost::asio::ip::udp::endpoint& endpoint() const { return m_endpoint; }
};
}  // namespace swr
