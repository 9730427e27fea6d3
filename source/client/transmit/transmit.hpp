#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "torrent/messages.hpp"

namespace swr
{
enum class WireError : uint8_t
{
  LengthMismatch,
  UnknownId,
  Oversized,
};

std::string_view to_string(WireError error);

/// Length-prefixed wire form of a message.
std::vector<uint8_t> serialize(const TorrentMessage& message);

/// Parses a message body (id byte and payload, without the length prefix).
std::expected<TorrentMessage, WireError> parse_message(std::span<const uint8_t> body);

boost::asio::awaitable<void> send_message(boost::asio::ip::tcp::socket& socket,
                                          const TorrentMessage& message);

/// Reads one message. Bodies longer than max_length are rejected before
/// they are read.
boost::asio::awaitable<std::expected<TorrentMessage, WireError>> read_message(
    boost::asio::ip::tcp::socket& socket, uint32_t max_length);

boost::asio::awaitable<Handshake> read_handshake(boost::asio::ip::tcp::socket& socket);

boost::asio::awaitable<void> send_handshake(boost::asio::ip::tcp::socket& socket,
                                            const Handshake& handshake);
}  // namespace swr
