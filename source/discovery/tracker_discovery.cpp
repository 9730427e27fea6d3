#include <algorithm>
#include <utility>

#include "discovery/tracker_discovery.hpp"

#include "auxiliary/format_aux.hpp"
#include "auxiliary/log.hpp"

using boost::asio::awaitable;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "discovery";
}

TrackerDiscovery::TrackerDiscovery(boost::asio::any_io_executor executor,
                                   PeerId local_id,
                                   TrackerPolicy policy,
                                   SeenMessageArena& seen,
                                   RemainingBytes remaining)
    : m_executor {std::move(executor)}
    , m_local_id {local_id}
    , m_policy {policy}
    , m_seen {seen}
    , m_remaining {std::move(remaining)}
{
}

void TrackerDiscovery::add_trackers(const InfoHash& content_id, std::vector<std::string> urls)
{
  auto& known = m_trackers[content_id];

  for (auto& url : urls) {
    if (std::ranges::find(known, url) == known.end()) {
      known.push_back(std::move(url));
    }
  }
}

void TrackerDiscovery::on_peer(PeerCallback callback)
{
  m_callbacks.push_back(std::move(callback));
}

void TrackerDiscovery::announce(const InfoHash& content_id)
{
  auto event = m_announced[content_id] ? AnnounceEvent::None : AnnounceEvent::Started;
  m_announced[content_id] = true;

  boost::asio::co_spawn(
      m_executor,
      [self = shared_from_this(), content_id, event]() -> awaitable<void>
      { co_await self->announce_once(content_id, event); },
      boost::asio::detached);
}

awaitable<size_t> TrackerDiscovery::announce_once(const InfoHash& content_id,
                                                  AnnounceEvent event)
{
  auto it = m_trackers.find(content_id);

  if (it == m_trackers.end()) {
    co_return 0;
  }

  // copied, the list may grow while we are suspended
  auto urls = it->second;
  size_t reported = 0;

  for (const auto& url : urls) {
    auto tracker = co_await Tracker::resolve(url);

    if (!tracker) {
      log::debug(COMPONENT, "skipping {}: {}", url, to_string(tracker.error()));
      continue;
    }

    AnnounceParameters parameters {
        .info_hash = content_id,
        .peer_id = m_local_id,
        .left = m_remaining ? m_remaining(content_id) : 0,
        .event = event,
        .port = m_policy.listen_port,
    };

    auto result = co_await tracker->announce(
        parameters,
        std::chrono::duration_cast<std::chrono::milliseconds>(m_policy.announce_timeout));

    if (!result) {
      log::info(COMPONENT, "announce to {} failed: {}", url, to_string(result.error()));
      continue;
    }

    for (const auto& peer : result->peers) {
      if (deliver(content_id, peer)) {
        reported++;
      }
    }
  }

  if (reported > 0) {
    log::info(COMPONENT, "{} new peers for {}", reported, to_hex(content_id));
  }

  co_return reported;
}

bool TrackerDiscovery::deliver(const InfoHash& content_id,
                               const boost::asio::ip::tcp::endpoint& peer)
{
  std::vector<uint8_t> message(content_id.begin(), content_id.end());

  auto address = peer.address().to_string();
  message.insert(message.end(), address.begin(), address.end());
  message.push_back(static_cast<uint8_t>(peer.port() >> 8));
  message.push_back(static_cast<uint8_t>(peer.port() & 0xFF));

  if (!m_seen.first_sighting(message)) {
    return false;
  }

  for (const auto& callback : m_callbacks) {
    callback(content_id, peer.address(), peer.port());
  }

  return true;
}
}  // namespace swr
