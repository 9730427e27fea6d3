#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include <utility>
#include <boost/asio.hpp>
#include <boost/circular_buffer.hpp>

#include "piece/piece_manager.hpp"
#include "torrent/bitfield/bitfield.hpp"
#include "torrent/messages.hpp"

namespace swr
{
class Transfer;

struct PeerStatus
{
  bool self_choked = true;
  bool self_interested = false;
  bool remote_choked = true;
  bool remote_interested = false;

  aux::BitField remote_pieces;
};

struct PeerActivity
{
  std::chrono::steady_clock::time_point started;
  std::chrono::steady_clock::time_point last_received;

  uint64_t blocks_received = 0;
  uint64_t blocks_uploaded = 0;

  boost::circular_buffer<std::string> recent_errors {3};
};

/// One peer wire connection of a transfer.
///
/// After the handshake the two sides exchange bitfields, and requests are
/// kept pipelined from the piece manager while the remote side has us
/// unchoked. Blocks of verified pieces are served back to interested
/// peers. Any socket error or protocol violation ends the session; its
/// outstanding blocks go back to the request pool.
///
/// Runs on the transfer's executor.
class PeerSession : public std::enable_shared_from_this<PeerSession>
{
public:
  PeerSession(std::shared_ptr<Transfer> transfer,
              boost::asio::ip::tcp::socket socket,
              boost::asio::ip::tcp::endpoint address,
              PeerKey key);

  /// Accepted connection; the remote handshake has been read already.
  boost::asio::awaitable<void> run_incoming(Handshake remote);

  /// Connects, then exchanges handshakes.
  boost::asio::awaitable<void> run_outgoing();

  void send(TorrentMessage message);

  /// Tells the remote side a block is no longer wanted.
  void cancel_block(const Block& block);

  void announce_piece(uint32_t piece_index);

  /// Re-evaluates interest and tops up the request pipeline.
  void refill();

  /// Closes the socket; the running loops wind down on their own.
  void close();

  PeerKey key() const { return m_key; }
  const boost::asio::ip::tcp::endpoint& address() const { return m_address; }
  const PeerStatus& status() const { return m_status; }
  const PeerActivity& activity() const { return m_activity; }
  bool closed() const { return m_closed; }

  std::chrono::steady_clock::duration idle_for() const;

private:
  boost::asio::awaitable<void> run(std::optional<Handshake> remote);

  boost::asio::awaitable<bool> handshake(std::optional<Handshake> remote);

  boost::asio::awaitable<void> send_loop();

  boost::asio::awaitable<void> receive_loop();

  boost::asio::awaitable<bool> handle(TorrentMessage message);

  boost::asio::awaitable<bool> on_piece(Piece piece);

  boost::asio::awaitable<bool> on_request(const Request& request);

  bool on_bitfield(const BitFieldMessage& message);

  bool on_have(uint32_t piece_index);

  void on_choked();

  void on_cancel(const Cancel& cancel);

  void update_interest();

  void fill_pipeline();

  void record_error(std::string message);

  void finish();

  std::shared_ptr<Transfer> m_transfer;
  boost::asio::ip::tcp::socket m_socket;
  boost::asio::ip::tcp::endpoint m_address;
  PeerKey m_key;

  std::deque<TorrentMessage> m_outbox;
  boost::asio::steady_timer m_send_signal;

  PeerStatus m_status;
  PeerActivity m_activity;

  std::set<Block> m_outstanding;

  bool m_bitfield_allowed = true;
  bool m_closed = false;
  bool m_finished = false;
};
}  // namespace swr
