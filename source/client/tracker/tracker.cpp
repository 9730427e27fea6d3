#include <algorithm>
#include <utility>

#include "client/tracker/tracker.hpp"

#include "auxiliary/deadline.hpp"
#include "auxiliary/format_aux.hpp"
#include "auxiliary/log.hpp"

using boost::asio::awaitable;
using boost::asio::ip::tcp;
using boost::asio::ip::udp;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "tracker";

// action and transaction id
constexpr size_t COMMON_HEADER = 8;

uint32_t action_of(std::span<const uint8_t> datagram)
{
  return load_big<uint32_t>(datagram.data());
}

uint32_t transaction_of(std::span<const uint8_t> datagram)
{
  return load_big<uint32_t>(datagram.data() + sizeof(uint32_t));
}

std::expected<void, TrackerError> check_header(std::span<const uint8_t> datagram,
                                               Actions expected_action,
                                               size_t minimum_size,
                                               uint32_t transaction_id)
{
  if (datagram.size() < COMMON_HEADER) {
    return std::unexpected(TrackerError::BadResponse);
  }

  if (transaction_of(datagram) != transaction_id) {
    return std::unexpected(TrackerError::TransactionMismatch);
  }

  if (action_of(datagram) == static_cast<uint32_t>(Actions::Error)) {
    std::string message(datagram.begin() + COMMON_HEADER, datagram.end());
    log::warn(COMPONENT, "tracker refused: {}", message);
    return std::unexpected(TrackerError::Rejected);
  }

  if (action_of(datagram) != static_cast<uint32_t>(expected_action)
      || datagram.size() < minimum_size)
  {
    return std::unexpected(TrackerError::BadResponse);
  }

  return {};
}

// Waits for the next datagram from the tracker; others are dropped.
awaitable<std::vector<uint8_t>> receive_from(udp::socket& socket, const udp::endpoint& from)
{
  std::vector<uint8_t> buffer(UINT16_MAX);
  udp::endpoint sender;

  while (true) {
    auto received = co_await socket.async_receive_from(
        boost::asio::buffer(buffer), sender, boost::asio::use_awaitable);

    if (sender == from) {
      buffer.resize(received);
      co_return buffer;
    }

    log::debug(COMPONENT, "dropping datagram from {}", sender);
  }
}
}  // namespace

std::string_view to_string(TrackerError error)
{
  switch (error) {
    case TrackerError::UnsupportedUrl:
      return "unsupported tracker url";
    case TrackerError::ResolveFailed:
      return "cannot resolve tracker";
    case TrackerError::Timeout:
      return "tracker timed out";
    case TrackerError::NetworkFailure:
      return "network failure";
    case TrackerError::BadResponse:
      return "malformed tracker response";
    case TrackerError::TransactionMismatch:
      return "transaction id mismatch";
    case TrackerError::Rejected:
      return "tracker returned an error";
  }

  return "unknown";
}

std::optional<TrackerUrl> parse_udp_tracker_url(std::string_view url)
{
  constexpr std::string_view SCHEME = "udp://";

  if (!url.starts_with(SCHEME)) {
    return std::nullopt;
  }

  url.remove_prefix(SCHEME.size());
  url = url.substr(0, url.find('/'));

  auto colon = url.rfind(':');

  if (colon == std::string_view::npos || colon == 0 || colon + 1 == url.size()) {
    return std::nullopt;
  }

  auto port = url.substr(colon + 1);
  if (!std::ranges::all_of(port, [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }

  return TrackerUrl {std::string(url.substr(0, colon)), std::string(port)};
}

std::vector<tcp::endpoint> parse_compact_peers(std::span<const uint8_t> compact)
{
  std::vector<tcp::endpoint> peers;

  for (size_t i = 0; i + sizeof(IpV4Port) <= compact.size(); i += sizeof(IpV4Port)) {
    auto ip = load_big<uint32_t>(compact.data() + i);
    auto port = load_big<uint16_t>(compact.data() + i + sizeof(uint32_t));

    if (ip == 0 || port == 0) {
      continue;
    }

    peers.emplace_back(boost::asio::ip::make_address_v4(ip), port);
  }

  return peers;
}

std::expected<uint64_t, TrackerError> parse_connect_response(std::span<const uint8_t> datagram,
                                                             uint32_t transaction_id)
{
  if (auto checked = check_header(
          datagram, Actions::Connect, sizeof(ConnectResponse), transaction_id);
      !checked)
  {
    return std::unexpected(checked.error());
  }

  return load_big<uint64_t>(datagram.data() + COMMON_HEADER);
}

std::expected<AnnounceResult, TrackerError> parse_announce_response(
    std::span<const uint8_t> datagram, uint32_t transaction_id)
{
  if (auto checked = check_header(
          datagram, Actions::Announce, sizeof(AnnounceResponse), transaction_id);
      !checked)
  {
    return std::unexpected(checked.error());
  }

  AnnounceResult result;
  result.interval = load_big<uint32_t>(datagram.data() + 8);
  result.leechers = load_big<uint32_t>(datagram.data() + 12);
  result.seeders = load_big<uint32_t>(datagram.data() + 16);
  result.peers = parse_compact_peers(datagram.subspan(sizeof(AnnounceResponse)));

  return result;
}

Tracker::Tracker(udp::endpoint endpoint)
    : m_endpoint {std::move(endpoint)}
{
}

awaitable<std::expected<Tracker, TrackerError>> Tracker::resolve(std::string_view url)
{
  auto parsed = parse_udp_tracker_url(url);

  if (!parsed) {
    co_return std::unexpected(TrackerError::UnsupportedUrl);
  }

  udp::resolver resolver {co_await boost::asio::this_coro::executor};

  try {
    auto results = co_await resolver.async_resolve(
        parsed->host, parsed->port, boost::asio::use_awaitable);

    for (const auto& entry : results) {
      if (entry.endpoint().address().is_v4()) {
        co_return Tracker {entry.endpoint()};
      }
    }
  } catch (const boost::system::system_error& e) {
    log::debug(COMPONENT, "cannot resolve {}: {}", parsed->host, e.code().message());
  }

  co_return std::unexpected(TrackerError::ResolveFailed);
}

awaitable<std::expected<AnnounceResult, TrackerError>> Tracker::announce(
    const AnnounceParameters& parameters, std::chrono::milliseconds timeout) const
{
  udp::socket socket {co_await boost::asio::this_coro::executor};
  socket.open(m_endpoint.protocol());

  Deadline deadline {socket, timeout};

  try {
    ConnectRequest connect {};
    co_await socket.async_send_to(
        boost::asio::buffer(&connect, sizeof(connect)), m_endpoint, boost::asio::use_awaitable);

    auto connected = parse_connect_response(co_await receive_from(socket, m_endpoint),
                                            connect.transaction_id);
    if (!connected) {
      co_return std::unexpected(connected.error());
    }

    AnnounceRequest request {*connected,
                             parameters.info_hash,
                             parameters.peer_id,
                             parameters.left,
                             parameters.event,
                             parameters.port};

    co_await socket.async_send_to(
        boost::asio::buffer(&request, sizeof(request)), m_endpoint, boost::asio::use_awaitable);

    auto result = parse_announce_response(co_await receive_from(socket, m_endpoint),
                                          request.transaction_id);

    if (result) {
      log::debug(COMPONENT, "{} returned {} peers", m_endpoint, result->peers.size());
    }

    co_return result;
  } catch (const boost::system::system_error& e) {
    if (deadline.expired()) {
      co_return std::unexpected(TrackerError::Timeout);
    }

    log::debug(COMPONENT, "announce to {} failed: {}", m_endpoint, e.code().message());
  }

  co_return std::unexpected(TrackerError::NetworkFailure);
}
}  // namespace swr
