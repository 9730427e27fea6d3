#include <algorithm>
#include <cstring>

#include "client/tracker/tracker_server.hpp"

#include "auxiliary/format_aux.hpp"
#include "auxiliary/log.hpp"

using boost::asio::ip::udp;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "tracker-server";

// connection id, action and transaction id
constexpr size_t REQUEST_HEADER = 16;
}  // namespace

TrackerServer::TrackerServer(TrackerServerPolicy policy)
    : m_policy {policy}
{
}

std::vector<uint8_t> TrackerServer::handle_datagram(std::span<const uint8_t> datagram,
                                                    const udp::endpoint& sender)
{
  if (datagram.size() < REQUEST_HEADER) {
    log::debug(COMPONENT, "ignoring {} byte datagram from {}", datagram.size(), sender);
    return {};
  }

  auto action = load_big<uint32_t>(datagram.data() + 8);
  auto transaction_id = load_big<uint32_t>(datagram.data() + 12);

  switch (static_cast<Actions>(action)) {
    case Actions::Connect:
      return connect_reply(transaction_id);
    case Actions::Announce: {
      if (datagram.size() < sizeof(AnnounceRequest)) {
        return error_reply(transaction_id, "malformed announce");
      }

      AnnounceRequest request;
      std::memcpy(&request, datagram.data(), sizeof(request));
      return announce_reply(request, sender);
    }
    default:
      return error_reply(transaction_id, "unsupported action");
  }
}

std::vector<uint8_t> TrackerServer::connect_reply(uint32_t transaction_id)
{
  ConnectResponse response;
  response.transaction_id = transaction_id;
  response.connection_id = generate_random_in_range<uint64_t>(1, UINT64_MAX);

  std::vector<uint8_t> out;
  append_struct(out, response);
  return out;
}

std::vector<uint8_t> TrackerServer::announce_reply(const AnnounceRequest& request,
                                                   const udp::endpoint& sender)
{
  InfoHash info_hash {};
  std::copy(std::begin(request.info_hash), std::end(request.info_hash), info_hash.begin());

  auto& announcers = m_swarms[info_hash];
  expire(announcers);

  Announcer self {0, 0, std::chrono::steady_clock::now()};

  if (sender.address().is_v4()) {
    self.ip = sender.address().to_v4().to_uint();
    self.port = request.port != 0 ? static_cast<uint16_t>(request.port) : sender.port();
  }

  AnnounceResponse response;
  response.transaction_id = static_cast<uint32_t>(request.transaction_id);
  response.interval = m_policy.announce_interval;
  response.leechers = 0;
  response.seeders = 0;

  std::vector<uint8_t> out;
  append_struct(out, response);

  size_t listed = 0;

  for (const auto& announcer : announcers) {
    if (listed == m_policy.max_peers_per_reply) {
      break;
    }

    if (announcer.key() == self.key()) {
      continue;
    }

    append_struct(out, IpV4Port {announcer.ip, announcer.port});
    listed++;
  }

  auto existing = std::ranges::find_if(
      announcers, [&self](const Announcer& a) { return a.key() == self.key(); });

  if (static_cast<AnnounceEvent>(static_cast<uint32_t>(request.event)) == AnnounceEvent::Stopped) {
    if (existing != announcers.end()) {
      announcers.erase(existing);
    }
  } else if (self.ip != 0) {
    if (existing != announcers.end()) {
      existing->seen = self.seen;
    } else {
      announcers.push_back(self);
    }
  }

  log::debug(COMPONENT,
             "announce from {} for {}: {} peers returned",
             sender,
             to_hex(info_hash),
             listed);

  return out;
}

std::vector<uint8_t> TrackerServer::error_reply(uint32_t transaction_id,
                                                std::string_view message)
{
  ErrorResponse response;
  response.transaction_id = transaction_id;

  std::vector<uint8_t> out;
  append_struct(out, response);
  out.insert(out.end(), message.begin(), message.end());
  return out;
}

void TrackerServer::expire(std::vector<Announcer>& announcers) const
{
  auto cutoff = std::chrono::steady_clock::now() - m_policy.peer_expiry;
  std::erase_if(announcers, [cutoff](const Announcer& a) { return a.seen < cutoff; });
}

size_t TrackerServer::peer_count(const InfoHash& info_hash) const
{
  auto it = m_swarms.find(info_hash);
  return it == m_swarms.end() ? 0 : it->second.size();
}

boost::asio::awaitable<void> TrackerServer::serve(udp::socket& socket)
{
  std::vector<uint8_t> buffer(UINT16_MAX);
  udp::endpoint sender;

  log::info(COMPONENT, "listening on {}", socket.local_endpoint());

  while (socket.is_open()) {
    boost::system::error_code ec;
    auto received = co_await socket.async_receive_from(
        boost::asio::buffer(buffer),
        sender,
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (ec == boost::asio::error::operation_aborted || !socket.is_open()) {
      break;
    }

    if (ec) {
      log::debug(COMPONENT, "receive failed: {}", ec.message());
      continue;
    }

    auto reply = handle_datagram(std::span {buffer.data(), received}, sender);

    if (!reply.empty()) {
      co_await socket.async_send_to(
          boost::asio::buffer(reply),
          sender,
          boost::asio::redirect_error(boost::asio::use_awaitable, ec));

      if (ec) {
        log::debug(COMPONENT, "reply to {} failed: {}", sender, ec.message());
      }
    }
  }
}
}  // namespace swr
