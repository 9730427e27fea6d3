#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>

#include "client/settings.hpp"
#include "torrent/messages.hpp"

namespace swr
{
enum class SlotState : uint8_t
{
  Queued,
  Rejected,
  Active,
};

std::string_view to_string(SlotState state);

/// The admission side of a transfer.
class AdmissionTarget
{
public:
  virtual ~AdmissionTarget() = default;

  /// Takes a connection slot if the transfer is below its maximum. The
  /// check and the increment happen under one lock.
  virtual bool try_reserve_connection() = 0;

  /// Gives back a slot taken with try_reserve_connection.
  virtual void release_connection() = 0;

  /// Peer protocol handoff for a reserved slot. From here on the transfer
  /// owns the socket and releases the slot when the session ends.
  virtual void accept_incoming(boost::asio::ip::tcp::socket socket,
                               const Handshake& handshake,
                               boost::asio::ip::tcp::endpoint address) = 0;
};

/// Lookup of live transfers by info hash.
class TransferDirectory
{
public:
  virtual ~TransferDirectory() = default;

  virtual std::shared_ptr<AdmissionTarget> find_target(const InfoHash& info_hash) = 0;
};

/// Resolves the directory; empty while it is not initialised yet.
using DirectoryAccessor = std::function<std::shared_ptr<TransferDirectory>()>;

struct AdmissionStats
{
  uint64_t admitted = 0;
  uint64_t rejected = 0;
  uint64_t queued = 0;
  uint64_t timed_out = 0;
  uint64_t overflowed = 0;
  size_t waiting = 0;
};

/// Decides the fate of inbound connections whose handshake has been read.
///
/// Connections that arrive before the transfer directory exists wait in a
/// bounded queue; run() retries them every poll interval and closes those
/// still unresolved after the grace period. A full queue closes the new
/// connection straight away. Scheduler thread only.
class IncomingPeerAdmission
{
public:
  IncomingPeerAdmission(boost::asio::any_io_executor executor,
                        AdmissionPolicy policy,
                        DirectoryAccessor directory);

  SlotState on_incoming(boost::asio::ip::tcp::socket socket,
                        const Handshake& handshake,
                        boost::asio::ip::tcp::endpoint address);

  /// Queue processor; returns after shutdown().
  boost::asio::awaitable<void> run();

  /// Closes every queued connection and stops run().
  void shutdown();

  AdmissionStats stats() const;

  size_t waiting() const { return m_queue.size(); }

private:
  struct PendingConnection
  {
    boost::asio::ip::tcp::socket socket;
    Handshake handshake;
    boost::asio::ip::tcp::endpoint address;
    std::chrono::steady_clock::time_point deadline;
  };

  enum class Resolution : uint8_t
  {
    Unavailable,
    Rejected,
    Admitted,
  };

  Resolution resolve(boost::asio::ip::tcp::socket& socket,
                     const Handshake& handshake,
                     const boost::asio::ip::tcp::endpoint& address);

  void drain_queue();

  static void close_quietly(boost::asio::ip::tcp::socket& socket);

  boost::asio::any_io_executor m_executor;
  AdmissionPolicy m_policy;
  DirectoryAccessor m_directory;

  std::deque<PendingConnection> m_queue;
  boost::asio::steady_timer m_wakeup;
  bool m_stopping = false;

  AdmissionStats m_stats;
};
}  // namespace swr
