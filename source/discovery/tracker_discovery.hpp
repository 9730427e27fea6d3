#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "client/settings.hpp"
#include "client/tracker/tracker.hpp"
#include "discovery/peer_discovery.hpp"
#include "discovery/seen_messages.hpp"

namespace swr
{
/// Peer discovery through the UDP trackers of each transfer. Addresses
/// already reported within the dedup window are not reported again.
class TrackerDiscovery
    : public PeerDiscovery
    , public std::enable_shared_from_this<TrackerDiscovery>
{
public:
  using RemainingBytes = std::function<uint64_t(const InfoHash&)>;

  TrackerDiscovery(boost::asio::any_io_executor executor,
                   PeerId local_id,
                   TrackerPolicy policy,
                   SeenMessageArena& seen,
                   RemainingBytes remaining);

  void add_trackers(const InfoHash& content_id, std::vector<std::string> urls);

  void on_peer(PeerCallback callback) override;

  void announce(const InfoHash& content_id) override;

  /// Announces to every tracker of content_id in turn; returns how many
  /// new addresses were reported.
  boost::asio::awaitable<size_t> announce_once(const InfoHash& content_id,
                                               AnnounceEvent event = AnnounceEvent::None);

  /// Reports an address unless it was reported recently.
  bool deliver(const InfoHash& content_id, const boost::asio::ip::tcp::endpoint& peer);

private:
  boost::asio::any_io_executor m_executor;
  PeerId m_local_id;
  TrackerPolicy m_policy;
  SeenMessageArena& m_seen;
  RemainingBytes m_remaining;

  std::map<InfoHash, std::vector<std::string>> m_trackers;
  std::vector<PeerCallback> m_callbacks;
  std::map<InfoHash, bool> m_announced;
};
}  // namespace swr
