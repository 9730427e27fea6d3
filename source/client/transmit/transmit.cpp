#include <cstring>
#include <utility>

#include "client/transmit/transmit.hpp"

using boost::asio::awaitable;
using boost::asio::ip::tcp;

namespace swr
{
namespace
{
template<typename PackedStruct>
void put(std::vector<uint8_t>& out, const PackedStruct& message)
{
  append_struct(out, message);
}

template<SupportsDynamicLength Metadata>
void put(std::vector<uint8_t>& out, const DynamicLengthMessage<Metadata>& message)
{
  append_struct(out, message.get_metadata());

  const auto& payload = message.get_payload();
  out.insert(out.end(), payload.begin(), payload.end());
}

// Fixed size messages are copied whole, length prefix included.
template<typename T>
std::expected<TorrentMessage, WireError> copy_fixed(std::span<const uint8_t> body)
{
  constexpr auto PREFIX = sizeof(uint32_big);

  if (body.size() + PREFIX != sizeof(T)) {
    return std::unexpected(WireError::LengthMismatch);
  }

  std::vector<uint8_t> framed;
  append_big<uint32_t>(framed, static_cast<uint32_t>(body.size()));
  framed.insert(framed.end(), body.begin(), body.end());

  T value;
  std::memcpy(&value, framed.data(), sizeof(T));
  return value;
}
}  // namespace

std::string_view to_string(WireError error)
{
  switch (error) {
    case WireError::LengthMismatch:
      return "message length does not match its id";
    case WireError::UnknownId:
      return "unknown message id";
    case WireError::Oversized:
      return "message exceeds size limit";
  }

  return "unknown";
}

std::vector<uint8_t> serialize(const TorrentMessage& message)
{
  std::vector<uint8_t> out;

  std::visit([&out](const auto& value) { put(out, value); }, message);

  return out;
}

std::expected<TorrentMessage, WireError> parse_message(std::span<const uint8_t> body)
{
  if (body.empty()) {
    return Keepalive {};
  }

  auto payload = body.subspan(1);

  switch (body.front()) {
    case ID_CHOKE:
      return copy_fixed<Choke>(body);
    case ID_UNCHOKE:
      return copy_fixed<Unchoke>(body);
    case ID_INTERESTED:
      return copy_fixed<Interested>(body);
    case ID_NOT_INTERESTED:
      return copy_fixed<NotInterested>(body);
    case ID_HAVE:
      return copy_fixed<Have>(body);
    case ID_BITFIELD:
      return BitFieldMessage {std::vector<uint8_t>(payload.begin(), payload.end())};
    case ID_REQUEST:
      return copy_fixed<Request>(body);
    case ID_PIECE: {
      constexpr auto HEADER = sizeof(uint32_t) * 2;

      if (payload.size() < HEADER) {
        return std::unexpected(WireError::LengthMismatch);
      }

      return Piece {std::vector<uint8_t>(payload.begin() + HEADER, payload.end()),
                    PieceMetadata {load_big<uint32_t>(payload.data()),
                                   load_big<uint32_t>(payload.data() + sizeof(uint32_t))}};
    }
    case ID_CANCEL:
      return copy_fixed<Cancel>(body);
    case ID_PORT:
      return copy_fixed<Port>(body);
    default:
      return std::unexpected(WireError::UnknownId);
  }
}

awaitable<void> send_message(tcp::socket& socket, const TorrentMessage& message)
{
  auto wire = serialize(message);

  co_await boost::asio::async_write(
      socket, boost::asio::buffer(wire), boost::asio::use_awaitable);
}

awaitable<std::expected<TorrentMessage, WireError>> read_message(tcp::socket& socket,
                                                                 uint32_t max_length)
{
  uint32_big message_length;

  co_await boost::asio::async_read(
      socket,
      boost::asio::buffer(&message_length, sizeof(message_length)),
      boost::asio::use_awaitable);

  if (message_length == 0) {
    co_return Keepalive {};
  }

  if (message_length > max_length) {
    co_return std::unexpected(WireError::Oversized);
  }

  std::vector<uint8_t> body(message_length);

  co_await boost::asio::async_read(
      socket, boost::asio::buffer(body), boost::asio::use_awaitable);

  co_return parse_message(body);
}

awaitable<Handshake> read_handshake(tcp::socket& socket)
{
  Handshake handshake {};

  co_await boost::asio::async_read(
      socket,
      boost::asio::buffer(&handshake, sizeof(handshake)),
      boost::asio::use_awaitable);

  co_return handshake;
}

awaitable<void> send_handshake(tcp::socket& socket, const Handshake& handshake)
{
  co_await boost::asio::async_write(
      socket,
      boost::asio::buffer(&handshake, sizeof(handshake)),
      boost::asio::use_awaitable);
}
}  // namespace swr
