#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "auxiliary/peer_id.hpp"
#include "checkpoint/checkpoint_store.hpp"
#include "client/admission/incoming_admission.hpp"
#include "client/settings.hpp"
#include "piece/piece_manager.hpp"
#include "storage/disk_io_engine.hpp"
#include "storage/file_gate.hpp"
#include "torrent/layout/file_layout.hpp"
#include "torrent/metadata/torrentfile.hpp"

namespace swr
{
class PeerSession;

struct TransferStats
{
  uint32_t verified_pieces = 0;
  uint32_t piece_count = 0;
  uint64_t hash_failures = 0;
  uint64_t write_failures = 0;
  uint64_t read_failures = 0;
  uint64_t bytes_received = 0;
  uint64_t bytes_uploaded = 0;
  size_t connections = 0;
  size_t sessions = 0;
  bool halted = false;
};

/// One download or seed: pieces, their files on disk and the peer sessions
/// working on them.
///
/// Accepted blocks go to disk through the file layout; a complete piece is
/// read back and hashed on the worker pool, and verified pieces are
/// persisted through the checkpoint store. A destination that cannot be
/// created halts the transfer.
///
/// Everything except the connection counter runs on the scheduler.
class Transfer
    : public AdmissionTarget
    , public std::enable_shared_from_this<Transfer>
{
public:
  Transfer(boost::asio::any_io_executor executor,
           TorrentFile torrent,
           std::filesystem::path output_dir,
           DiskIOEngine& disk,
           std::shared_ptr<CheckpointStore> checkpoints,
           Settings settings,
           PeerId local_id,
           std::string source = {});

  ~Transfer() override;

  /// Restores verified pieces from a checkpoint, or from data already on
  /// disk when there is none, and registers the destination files.
  boost::asio::awaitable<void> start();

  /// Handles a block delivered by a peer. False when it was not accepted
  /// or could not be written.
  boost::asio::awaitable<bool> on_block(uint32_t piece_index,
                                        uint32_t offset,
                                        std::vector<uint8_t> data,
                                        PeerKey from);

  /// Reads a block of a verified piece for upload.
  boost::asio::awaitable<std::expected<std::vector<uint8_t>, DiskError>> read_block(
      uint32_t piece_index, uint32_t offset, uint32_t length);

  /// Persists the verified bitfield if it changed since the last save.
  /// Complete transfers are not checkpointed.
  boost::asio::awaitable<void> save_checkpoint(bool force = false);

  bool try_reserve_connection() override;
  void release_connection() override;
  void accept_incoming(boost::asio::ip::tcp::socket socket,
                       const Handshake& handshake,
                       boost::asio::ip::tcp::endpoint address) override;

  /// Opens an outgoing session if a connection slot is free.
  bool connect_to(boost::asio::ip::tcp::endpoint address);

  void attach_session(const std::shared_ptr<PeerSession>& session);

  /// Called by a session when it ends; returns its outstanding blocks.
  void detach_session(PeerKey key, const aux::BitField& remote_pieces);

  /// Closes sessions without traffic for longer than limit.
  size_t reap_stale(std::chrono::steady_clock::duration limit);

  void stop();

  PieceManager& pieces() { return m_pieces; }
  const PieceManager& pieces() const { return m_pieces; }
  const FileLayout& layout() const { return m_layout; }
  const InfoHash& info_hash() const { return m_torrent.info_hash; }
  const std::string& name() const { return m_torrent.metadata.name; }
  const PeerId& local_id() const { return m_local_id; }
  const Settings& settings() const { return m_settings; }
  boost::asio::any_io_executor executor() const { return m_executor; }

  bool halted() const { return m_halted; }
  bool stopped() const { return m_stopped; }
  size_t connection_count() const;

  TransferStats stats() const;

  /// Bytes of pieces not verified yet.
  uint64_t bytes_left() const;

  void count_upload(size_t bytes) { m_bytes_uploaded += bytes; }

private:
  boost::asio::awaitable<bool> write_block(const WriteInstruction& instruction);

  boost::asio::awaitable<std::expected<std::vector<uint8_t>, DiskError>> read_range(
      uint32_t piece_index, uint32_t offset, uint32_t length);

  boost::asio::awaitable<void> verify(uint32_t piece_index);

  boost::asio::awaitable<void> recheck_existing_data();

  boost::asio::awaitable<void> remove_checkpoint();

  void on_piece_verified(uint32_t piece_index);

  void halt(std::string_view reason);

  CheckpointMetadata checkpoint_metadata() const;

  std::filesystem::path full_path(const std::string& relative) const;

  boost::asio::any_io_executor m_executor;
  TorrentFile m_torrent;
  std::filesystem::path m_output_dir;
  FileLayout m_layout;
  PieceManager m_pieces;
  DiskIOEngine& m_disk;
  std::shared_ptr<CheckpointStore> m_checkpoints;
  Settings m_settings;
  PeerId m_local_id;
  std::string m_source;

  mutable std::mutex m_connection_lock;
  size_t m_connections = 0;

  std::map<PeerKey, std::weak_ptr<PeerSession>> m_sessions;
  PeerKey m_next_key = 1;

  std::map<uint32_t, uint32_t> m_inflight_writes;
  std::set<uint32_t> m_awaiting_verification;

  FileGate m_checkpoint_gate;
  int64_t m_created_at = 0;
  bool m_checkpoint_dirty = false;
  bool m_checkpoint_written = false;
  bool m_halted = false;
  bool m_stopped = false;

  uint64_t m_write_failures = 0;
  uint64_t m_read_failures = 0;
  uint64_t m_bytes_received = 0;
  uint64_t m_bytes_uploaded = 0;
};
}  // namespace swr
