#include <algorithm>
#include <utility>

#include "client/peer_session.hpp"

#include "auxiliary/deadline.hpp"
#include "auxiliary/format_aux.hpp"
#include "auxiliary/log.hpp"
#include "auxiliary/variant_aux.hpp"
#include "client/transfer.hpp"
#include "client/transmit/transmit.hpp"

using boost::asio::awaitable;
using boost::asio::ip::tcp;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "peer";

constexpr uint32_t MAX_REQUEST_LENGTH = 128 * 1024;

bool is_normal_closure(const boost::system::error_code& ec)
{
  return ec == boost::asio::error::eof || ec == boost::asio::error::operation_aborted
      || ec == boost::asio::error::connection_reset
      || ec == boost::asio::error::bad_descriptor;
}
}  // namespace

PeerSession::PeerSession(std::shared_ptr<Transfer> transfer,
                         tcp::socket socket,
                         tcp::endpoint address,
                         PeerKey key)
    : m_transfer {std::move(transfer)}
    , m_socket {std::move(socket)}
    , m_address {std::move(address)}
    , m_key {key}
    , m_send_signal {m_socket.get_executor()}
{
  m_status.remote_pieces = aux::BitField {m_transfer->pieces().piece_count()};
  m_activity.started = std::chrono::steady_clock::now();
  m_activity.last_received = m_activity.started;
}

awaitable<void> PeerSession::run_incoming(Handshake remote)
{
  co_await run(remote);
}

awaitable<void> PeerSession::run_outgoing()
{
  auto self = shared_from_this();

  try {
    Deadline deadline {m_socket, m_transfer->settings().peer.connect_timeout};
    co_await m_socket.async_connect(m_address, boost::asio::use_awaitable);
  } catch (const boost::system::system_error& e) {
    log::debug(COMPONENT, "{} connect failed: {}", m_address, e.code().message());
    record_error(e.code().message());
    finish();
    co_return;
  }

  co_await run(std::nullopt);
}

awaitable<void> PeerSession::run(std::optional<Handshake> remote)
{
  auto self = shared_from_this();

  try {
    if (co_await handshake(std::move(remote))) {
      boost::asio::co_spawn(
          m_socket.get_executor(),
          [self]() { return self->send_loop(); },
          boost::asio::detached);

      if (m_transfer->pieces().verified_count() > 0) {
        send(BitFieldMessage {m_transfer->pieces().bitfield().as_raw()});
      }

      co_await receive_loop();
    }
  } catch (const boost::system::system_error& e) {
    if (!is_normal_closure(e.code())) {
      record_error(e.code().message());
      log::debug(COMPONENT, "{} connection lost: {}", m_address, e.code().message());
    }
  } catch (const std::exception& e) {
    record_error(e.what());
    log::warn(COMPONENT, "{} session aborted: {}", m_address, e.what());
  }

  finish();
}

awaitable<bool> PeerSession::handshake(std::optional<Handshake> remote)
{
  Deadline deadline {m_socket, m_transfer->settings().peer.handshake_timeout};

  Handshake local {m_transfer->info_hash(), m_transfer->local_id()};

  if (!remote) {
    co_await send_handshake(m_socket, local);
    remote = co_await read_handshake(m_socket);
  } else {
    co_await send_handshake(m_socket, local);
  }

  if (!remote->is_valid() || remote->info_hash() != m_transfer->info_hash()) {
    log::debug(COMPONENT, "{} sent a handshake for another transfer", m_address);
    record_error("bad handshake");
    co_return false;
  }

  if (remote->remote_id() == m_transfer->local_id().as_raw()) {
    log::debug(COMPONENT, "{} is ourselves", m_address);
    co_return false;
  }

  log::debug(COMPONENT, "{} handshake complete", m_address);
  co_return true;
}

awaitable<void> PeerSession::send_loop()
{
  const auto keepalive = m_transfer->settings().peer.keepalive_interval;

  try {
    while (!m_closed) {
      if (m_outbox.empty()) {
        m_send_signal.expires_after(keepalive);

        boost::system::error_code ec;
        co_await m_send_signal.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (!ec && !m_closed && m_outbox.empty()) {
          m_outbox.emplace_back(Keepalive {});
        }
        continue;
      }

      auto message = std::move(m_outbox.front());
      m_outbox.pop_front();

      co_await send_message(m_socket, message);
    }
  } catch (const boost::system::system_error& e) {
    if (!is_normal_closure(e.code())) {
      record_error(e.code().message());
    }
    close();
  }
}

awaitable<void> PeerSession::receive_loop()
{
  const auto max_length = m_transfer->settings().peer.max_message_length;

  while (!m_closed) {
    auto message = co_await read_message(m_socket, max_length);
    m_activity.last_received = std::chrono::steady_clock::now();

    if (!message) {
      log::warn(COMPONENT, "{} protocol violation: {}", m_address, to_string(message.error()));
      record_error(std::string {to_string(message.error())});
      co_return;
    }

    if (!co_await handle(std::move(*message))) {
      co_return;
    }

    m_bitfield_allowed = false;
  }
}

awaitable<bool> PeerSession::handle(TorrentMessage message)
{
  if (auto* piece = std::get_if<Piece>(&message)) {
    co_return co_await on_piece(std::move(*piece));
  }

  if (auto* request = std::get_if<Request>(&message)) {
    co_return co_await on_request(*request);
  }

  co_return std::visit(
      overloaded {
          [](const Keepalive&) { return true; },
          [this](const Choke&)
          {
            on_choked();
            return true;
          },
          [this](const Unchoke&)
          {
            m_status.self_choked = false;
            fill_pipeline();
            return true;
          },
          [this](const Interested&)
          {
            m_status.remote_interested = true;
            if (m_status.remote_choked) {
              m_status.remote_choked = false;
              send(Unchoke {});
            }
            return true;
          },
          [this](const NotInterested&)
          {
            m_status.remote_interested = false;
            return true;
          },
          [this](const Have& have) { return on_have(have.piece_index); },
          [this](const BitFieldMessage& bitfield) { return on_bitfield(bitfield); },
          [this](const Cancel& cancel)
          {
            on_cancel(cancel);
            return true;
          },
          [](const Port&) { return true; },
          [](const auto&) { return true; },
      },
      message);
}

awaitable<bool> PeerSession::on_piece(Piece piece)
{
  const auto metadata = piece.get_metadata();
  const uint32_t index = metadata.piece_index;
  const uint32_t offset = metadata.offset_within_piece;

  if (index >= m_transfer->pieces().piece_count()) {
    log::warn(COMPONENT, "{} sent block of unknown piece {}", m_address, index);
    record_error("bad piece index");
    co_return false;
  }

  auto data = piece.take_payload();
  m_outstanding.erase(Block {index, offset, static_cast<uint32_t>(data.size())});
  m_activity.blocks_received++;

  co_await m_transfer->on_block(index, offset, std::move(data), m_key);

  if (!m_closed) {
    fill_pipeline();
  }

  co_return true;
}

awaitable<bool> PeerSession::on_request(const Request& request)
{
  const uint32_t index = request.piece_index;
  const uint32_t offset = request.offset_within_piece;
  const uint32_t length = request.length;

  if (index >= m_transfer->pieces().piece_count()) {
    log::warn(COMPONENT, "{} requested unknown piece {}", m_address, index);
    record_error("bad piece index");
    co_return false;
  }

  if (length == 0 || length > MAX_REQUEST_LENGTH) {
    log::warn(COMPONENT, "{} requested {} bytes", m_address, length);
    record_error("bad request length");
    co_return false;
  }

  if (m_status.remote_choked
      || m_transfer->pieces().state(index) != PieceState::Verified)
  {
    co_return true;
  }

  auto block = co_await m_transfer->read_block(index, offset, length);

  if (!block) {
    log::debug(COMPONENT,
               "cannot serve {}:{} to {}: {}",
               index,
               offset,
               m_address,
               to_string(block.error()));
    co_return true;
  }

  if (m_closed) {
    co_return false;
  }

  m_activity.blocks_uploaded++;
  m_transfer->count_upload(block->size());
  send(Piece {std::move(*block), PieceMetadata {index, offset}});

  co_return true;
}

bool PeerSession::on_bitfield(const BitFieldMessage& message)
{
  const auto piece_count = m_transfer->pieces().piece_count();

  if (!m_bitfield_allowed
      || message.get_payload().size() != aux::BitField::byte_length(piece_count))
  {
    log::warn(COMPONENT, "{} sent an invalid bitfield", m_address);
    record_error("bad bitfield");
    return false;
  }

  m_transfer->pieces().remove_peer_bitfield(m_status.remote_pieces);
  m_status.remote_pieces = aux::BitField {message.get_payload(), piece_count};
  m_transfer->pieces().add_peer_bitfield(m_status.remote_pieces);

  refill();
  return true;
}

bool PeerSession::on_have(uint32_t piece_index)
{
  if (piece_index >= m_transfer->pieces().piece_count()) {
    log::warn(COMPONENT, "{} announced unknown piece {}", m_address, piece_index);
    record_error("bad piece index");
    return false;
  }

  if (!m_status.remote_pieces.get(piece_index)) {
    m_status.remote_pieces.mark(piece_index, true);
    m_transfer->pieces().on_have(piece_index);
    refill();
  }

  return true;
}

void PeerSession::on_choked()
{
  m_status.self_choked = true;

  for (const auto& block : m_outstanding) {
    m_transfer->pieces().release_request(m_key, block);
  }

  m_outstanding.clear();
}

void PeerSession::on_cancel(const Cancel& cancel)
{
  const uint32_t index = cancel.piece_index;
  const uint32_t offset = cancel.offset_within_piece;
  const uint32_t length = cancel.length;

  std::erase_if(m_outbox,
                [&](const TorrentMessage& queued)
                {
                  const auto* piece = std::get_if<Piece>(&queued);
                  return piece && piece->get_metadata().piece_index == index
                      && piece->get_metadata().offset_within_piece == offset
                      && piece->get_payload().size() == length;
                });
}

void PeerSession::update_interest()
{
  const auto& pieces = m_transfer->pieces();
  bool wanted = false;

  for (uint32_t i = 0; i < pieces.piece_count() && !wanted; i++) {
    wanted = m_status.remote_pieces.get(i) && pieces.state(i) != PieceState::Verified;
  }

  if (wanted != m_status.self_interested) {
    m_status.self_interested = wanted;

    if (wanted) {
      send(Interested {});
    } else {
      send(NotInterested {});
    }
  }
}

void PeerSession::fill_pipeline()
{
  if (m_closed || m_status.self_choked || m_transfer->halted()) {
    return;
  }

  const auto depth = m_transfer->settings().peer.pipeline_depth;

  while (m_outstanding.size() < depth) {
    auto block = m_transfer->pieces().select_next_request(m_status.remote_pieces, m_key);

    if (!block) {
      break;
    }

    m_outstanding.insert(*block);
    send(Request {block->piece, block->offset, block->length});
  }
}

void PeerSession::refill()
{
  if (m_closed) {
    return;
  }

  update_interest();
  fill_pipeline();
}

void PeerSession::send(TorrentMessage message)
{
  if (m_closed) {
    return;
  }

  m_outbox.push_back(std::move(message));
  m_send_signal.cancel();
}

void PeerSession::cancel_block(const Block& block)
{
  if (m_outstanding.erase(block) > 0) {
    send(Cancel {block.piece, block.offset, block.length});
  }
}

void PeerSession::announce_piece(uint32_t piece_index)
{
  send(Have {piece_index});

  // a piece we now hold may end our interest in this peer
  if (!m_closed) {
    update_interest();
  }
}

void PeerSession::close()
{
  if (m_closed) {
    return;
  }

  m_closed = true;

  boost::system::error_code ignored;
  m_socket.shutdown(tcp::socket::shutdown_both, ignored);
  m_socket.close(ignored);
  m_send_signal.cancel();
}

std::chrono::steady_clock::duration PeerSession::idle_for() const
{
  return std::chrono::steady_clock::now() - m_activity.last_received;
}

void PeerSession::record_error(std::string message)
{
  m_activity.recent_errors.push_back(std::move(message));
}

void PeerSession::finish()
{
  if (m_finished) {
    return;
  }

  m_finished = true;
  close();
  m_outbox.clear();
  m_outstanding.clear();

  m_transfer->detach_session(m_key, m_status.remote_pieces);
}
}  // namespace swr
