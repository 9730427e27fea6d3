#include <algorithm>
#include <utility>

#include "client/transfer.hpp"

#include <fmt/format.h>

#include "auxiliary/format_aux.hpp"
#include "auxiliary/log.hpp"
#include "auxiliary/offload.hpp"
#include "client/peer_session.hpp"

using boost::asio::awaitable;
using boost::asio::ip::tcp;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "transfer";

int64_t unix_now()
{
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::vector<std::shared_ptr<PeerSession>> live_sessions(
    const std::map<PeerKey, std::weak_ptr<PeerSession>>& sessions)
{
  std::vector<std::shared_ptr<PeerSession>> result;

  for (const auto& [key, weak] : sessions) {
    if (auto session = weak.lock()) {
      result.push_back(std::move(session));
    }
  }

  return result;
}
}  // namespace

Transfer::Transfer(boost::asio::any_io_executor executor,
                   TorrentFile torrent,
                   std::filesystem::path output_dir,
                   DiskIOEngine& disk,
                   std::shared_ptr<CheckpointStore> checkpoints,
                   Settings settings,
                   PeerId local_id,
                   std::string source)
    : m_executor {std::move(executor)}
    , m_torrent {std::move(torrent)}
    , m_output_dir {std::move(output_dir)}
    , m_layout {m_torrent.files, m_torrent.piece_length}
    , m_pieces {m_torrent.piece_hashes,
                m_torrent.piece_length,
                m_torrent.total_length,
                settings.piece}
    , m_disk {disk}
    , m_checkpoints {std::move(checkpoints)}
    , m_settings {std::move(settings)}
    , m_local_id {local_id}
    , m_source {std::move(source)}
    , m_created_at {unix_now()}
{
}

Transfer::~Transfer() = default;

std::filesystem::path Transfer::full_path(const std::string& relative) const
{
  return m_output_dir / relative;
}

awaitable<void> Transfer::start()
{
  for (const auto& file : m_layout.files()) {
    m_disk.register_file(full_path(file.path), file.length);
  }

  bool resumed = false;

  if (m_checkpoints && m_checkpoints->policy().enabled) {
    auto checkpoint = co_await offload(
        m_disk.workers(),
        [store = m_checkpoints, id = info_hash()] { return store->load(id); });

    if (checkpoint && checkpoint->piece_count == m_pieces.piece_count()
        && checkpoint->metadata.piece_length == m_layout.piece_length()
        && checkpoint->metadata.total_length == m_layout.total_length())
    {
      m_pieces.restore(checkpoint->bitfield);
      m_created_at = checkpoint->metadata.created_at;
      m_checkpoint_written = true;
      resumed = true;

      log::info(COMPONENT,
                "{}: resumed with {}/{} pieces",
                name(),
                m_pieces.verified_count(),
                m_pieces.piece_count());
    } else if (checkpoint) {
      log::warn(COMPONENT, "{}: checkpoint does not match the torrent, ignoring", name());
    }
  }

  if (!resumed) {
    co_await recheck_existing_data();
  }

  for (const auto& file : m_layout.files()) {
    if (file.length != 0 && (!m_settings.disk.preallocate || m_pieces.is_complete())) {
      continue;
    }

    auto prepared = co_await m_disk.preallocate(full_path(file.path));

    if (!prepared) {
      if (prepared.error() == DiskError::CreateFailed) {
        halt("cannot create destination files");
        co_return;
      }

      log::warn(COMPONENT, "{}: cannot preallocate {}", name(), file.path);
    }
  }

  log::info(COMPONENT,
            "{}: started, {} pieces of {} bytes in {} files",
            name(),
            m_pieces.piece_count(),
            m_layout.piece_length(),
            m_layout.files().size());
}

awaitable<void> Transfer::recheck_existing_data()
{
  std::error_code ec;
  bool any_file = std::ranges::any_of(
      m_layout.files(),
      [&](const FileEntry& file)
      { return file.length > 0 && std::filesystem::exists(full_path(file.path), ec); });

  if (!any_file) {
    co_return;
  }

  aux::BitField verified {m_pieces.piece_count()};

  for (uint32_t piece = 0; piece < m_pieces.piece_count(); piece++) {
    bool on_disk = std::ranges::all_of(
        m_layout.piece_segments(piece),
        [&](const FileSegment& segment)
        {
          auto size = std::filesystem::file_size(full_path(segment.path), ec);
          return !ec && size >= segment.file_offset + segment.length;
        });

    if (!on_disk) {
      continue;
    }

    auto bytes = co_await read_range(piece, 0, m_pieces.piece_size(piece));
    if (!bytes) {
      continue;
    }

    auto digest = co_await offload(m_disk.workers(),
                                   [data = std::move(*bytes)]
                                   { return PieceManager::hash_bytes(data); });

    if (digest == m_torrent.piece_hashes[piece]) {
      verified.mark(piece, true);
    }
  }

  m_pieces.restore(verified);

  if (verified.count() > 0) {
    m_checkpoint_dirty = true;
  }

  log::info(COMPONENT,
            "{}: {}/{} pieces already on disk",
            name(),
            verified.count(),
            m_pieces.piece_count());
}

awaitable<bool> Transfer::on_block(uint32_t piece_index,
                                   uint32_t offset,
                                   std::vector<uint8_t> data,
                                   PeerKey from)
{
  if (m_halted || m_stopped) {
    co_return false;
  }

  auto instruction = m_pieces.on_block_received(piece_index, offset, std::move(data), from);

  if (!instruction) {
    co_return false;
  }

  m_bytes_received += instruction->data.size();

  if (!instruction->cancel_peers.empty()) {
    Block block {piece_index, offset, static_cast<uint32_t>(instruction->data.size())};

    for (auto& session : live_sessions(m_sessions)) {
      if (std::ranges::find(instruction->cancel_peers, session->key())
          != instruction->cancel_peers.end())
      {
        session->cancel_block(block);
      }
    }
  }

  m_inflight_writes[piece_index]++;

  bool written = co_await write_block(*instruction);

  if (--m_inflight_writes[piece_index] == 0) {
    m_inflight_writes.erase(piece_index);
  }

  if (written && instruction->piece_complete) {
    m_awaiting_verification.insert(piece_index);
  }

  // verification reads the piece back, so every write must have landed
  if (!m_inflight_writes.contains(piece_index)
      && m_awaiting_verification.erase(piece_index) > 0)
  {
    co_await verify(piece_index);
  }

  co_return written;
}

awaitable<bool> Transfer::write_block(const WriteInstruction& instruction)
{
  auto segments = m_layout.map(
      instruction.piece, instruction.offset, static_cast<uint32_t>(instruction.data.size()));

  if (!segments) {
    log::error(COMPONENT,
               "{}: block {}:{} outside the layout: {}",
               name(),
               instruction.piece,
               instruction.offset,
               to_string(segments.error()));
    m_pieces.on_write_failed(instruction.piece, instruction.offset);
    co_return false;
  }

  std::span<const uint8_t> remaining {instruction.data};

  for (const auto& segment : *segments) {
    auto result = co_await m_disk.write(
        full_path(segment.path), segment.file_offset, remaining.first(segment.length));

    if (!result) {
      m_write_failures++;
      m_pieces.on_write_failed(instruction.piece, instruction.offset);

      if (result.error() == DiskError::CreateFailed) {
        halt(fmt::format("cannot create {}", segment.path));
      } else {
        log::warn(COMPONENT,
                  "{}: write to {} failed ({}), block {}:{} will be requested again",
                  name(),
                  segment.path,
                  to_string(result.error()),
                  instruction.piece,
                  instruction.offset);
      }

      co_return false;
    }

    remaining = remaining.subspan(segment.length);
  }

  co_return true;
}

awaitable<std::expected<std::vector<uint8_t>, DiskError>> Transfer::read_range(
    uint32_t piece_index, uint32_t offset, uint32_t length)
{
  auto segments = m_layout.map(piece_index, offset, length);

  if (!segments) {
    co_return std::unexpected(DiskError::ReadFailed);
  }

  std::vector<uint8_t> assembled;
  assembled.reserve(length);

  for (const auto& segment : *segments) {
    auto chunk =
        co_await m_disk.read(full_path(segment.path), segment.file_offset, segment.length);

    if (!chunk) {
      co_return std::unexpected(chunk.error());
    }

    assembled.insert(assembled.end(), chunk->begin(), chunk->end());
  }

  co_return assembled;
}

awaitable<std::expected<std::vector<uint8_t>, DiskError>> Transfer::read_block(
    uint32_t piece_index, uint32_t offset, uint32_t length)
{
  if (m_pieces.state(piece_index) != PieceState::Verified) {
    co_return std::unexpected(DiskError::ReadFailed);
  }

  co_return co_await read_range(piece_index, offset, length);
}

awaitable<void> Transfer::verify(uint32_t piece_index)
{
  if (!m_pieces.begin_verification(piece_index)) {
    co_return;
  }

  auto bytes = co_await read_range(piece_index, 0, m_pieces.piece_size(piece_index));

  bool verified = false;

  if (bytes) {
    auto digest = co_await offload(m_disk.workers(),
                                   [data = std::move(*bytes)]
                                   { return PieceManager::hash_bytes(data); });
    verified = m_pieces.finish_verification(piece_index, digest);
  } else {
    log::warn(COMPONENT,
              "{}: cannot read back piece {}: {}",
              name(),
              piece_index,
              to_string(bytes.error()));
    m_read_failures++;
    m_pieces.abort_verification(piece_index);
  }

  if (!verified) {
    for (auto& session : live_sessions(m_sessions)) {
      session->refill();
    }
    co_return;
  }

  on_piece_verified(piece_index);

  if (m_pieces.is_complete()) {
    log::info(COMPONENT, "{}: download complete", name());
    co_await remove_checkpoint();
  } else if (!m_checkpoint_written) {
    co_await save_checkpoint();
  }
}

void Transfer::on_piece_verified(uint32_t piece_index)
{
  m_checkpoint_dirty = true;

  log::debug(COMPONENT,
             "{}: piece {} verified ({}/{})",
             name(),
             piece_index,
             m_pieces.verified_count(),
             m_pieces.piece_count());

  for (auto& session : live_sessions(m_sessions)) {
    session->announce_piece(piece_index);
  }
}

CheckpointMetadata Transfer::checkpoint_metadata() const
{
  return CheckpointMetadata {
      .piece_length = m_layout.piece_length(),
      .total_length = m_layout.total_length(),
      .source = m_source,
      .display_name = name(),
      .output_dir = m_output_dir.string(),
      .announce_urls = m_torrent.trackers,
      .created_at = m_created_at,
  };
}

awaitable<void> Transfer::save_checkpoint(bool force)
{
  if (!m_checkpoints || !m_checkpoints->policy().enabled) {
    co_return;
  }

  if (!force && !m_checkpoint_dirty) {
    co_return;
  }

  auto hold = co_await m_checkpoint_gate.acquire();

  // a finished transfer keeps no checkpoint
  if (m_pieces.is_complete()) {
    co_return;
  }

  m_checkpoint_dirty = false;

  // the bitfield must never claim data that is not durable yet
  if (auto flushed = co_await m_disk.flush(); !flushed) {
    log::warn(COMPONENT, "{}: flush before checkpoint failed: {}", name(), to_string(flushed.error()));
    m_checkpoint_dirty = true;
    co_return;
  }

  auto saved = co_await offload(m_disk.workers(),
                                [store = m_checkpoints,
                                 id = info_hash(),
                                 bitfield = m_pieces.bitfield(),
                                 metadata = checkpoint_metadata()]
                                { return store->save(id, bitfield, metadata); });

  if (!saved) {
    log::warn(COMPONENT, "{}: checkpoint save failed: {}", name(), to_string(saved.error()));
    m_checkpoint_dirty = true;
    co_return;
  }

  m_checkpoint_written = true;
  log::debug(COMPONENT, "{}: checkpoint written to {}", name(), saved->string());
}

awaitable<void> Transfer::remove_checkpoint()
{
  if (!m_checkpoints) {
    co_return;
  }

  auto hold = co_await m_checkpoint_gate.acquire();

  m_checkpoint_dirty = false;

  bool removed = co_await offload(m_disk.workers(),
                                  [store = m_checkpoints, id = info_hash()]
                                  { return store->remove(id); });

  if (removed) {
    log::debug(COMPONENT, "{}: checkpoint removed", name());
  }
}

bool Transfer::try_reserve_connection()
{
  std::lock_guard guard {m_connection_lock};

  if (m_connections >= m_settings.admission.max_connections_per_transfer) {
    return false;
  }

  m_connections++;
  return true;
}

void Transfer::release_connection()
{
  std::lock_guard guard {m_connection_lock};

  if (m_connections > 0) {
    m_connections--;
  }
}

size_t Transfer::connection_count() const
{
  std::lock_guard guard {m_connection_lock};
  return m_connections;
}

void Transfer::accept_incoming(tcp::socket socket,
                               const Handshake& handshake,
                               tcp::endpoint address)
{
  if (m_stopped || m_halted) {
    boost::system::error_code ignored;
    socket.close(ignored);
    release_connection();
    return;
  }

  auto session = std::make_shared<PeerSession>(
      shared_from_this(), std::move(socket), std::move(address), m_next_key++);
  attach_session(session);

  log::debug(COMPONENT, "{}: accepted {}", name(), session->address());

  boost::asio::co_spawn(
      m_executor,
      [session, handshake]() { return session->run_incoming(handshake); },
      boost::asio::detached);
}

bool Transfer::connect_to(tcp::endpoint address)
{
  if (m_stopped || m_halted || m_pieces.is_complete()) {
    return false;
  }

  for (auto& session : live_sessions(m_sessions)) {
    if (session->address() == address) {
      return false;
    }
  }

  if (!try_reserve_connection()) {
    return false;
  }

  auto session = std::make_shared<PeerSession>(
      shared_from_this(), tcp::socket {m_executor}, std::move(address), m_next_key++);
  attach_session(session);

  boost::asio::co_spawn(
      m_executor, [session]() { return session->run_outgoing(); }, boost::asio::detached);

  return true;
}

void Transfer::attach_session(const std::shared_ptr<PeerSession>& session)
{
  m_sessions[session->key()] = session;
}

void Transfer::detach_session(PeerKey key, const aux::BitField& remote_pieces)
{
  m_sessions.erase(key);

  m_pieces.on_peer_disconnected(key);
  m_pieces.remove_peer_bitfield(remote_pieces);
  release_connection();

  // blocks of the closed session are free again
  for (auto& session : live_sessions(m_sessions)) {
    session->refill();
  }
}

size_t Transfer::reap_stale(std::chrono::steady_clock::duration limit)
{
  size_t reaped = 0;

  for (auto& session : live_sessions(m_sessions)) {
    if (session->idle_for() > limit) {
      log::debug(COMPONENT, "{}: closing idle peer {}", name(), session->address());
      session->close();
      reaped++;
    }
  }

  return reaped;
}

void Transfer::stop()
{
  if (m_stopped) {
    return;
  }

  m_stopped = true;

  for (auto& session : live_sessions(m_sessions)) {
    session->close();
  }
}

void Transfer::halt(std::string_view reason)
{
  if (m_halted) {
    return;
  }

  m_halted = true;
  log::error(COMPONENT, "{}: halted: {}", name(), reason);
  stop();
}

uint64_t Transfer::bytes_left() const
{
  uint64_t left = 0;

  for (uint32_t i = 0; i < m_pieces.piece_count(); i++) {
    if (m_pieces.state(i) != PieceState::Verified) {
      left += m_pieces.piece_size(i);
    }
  }

  return left;
}

TransferStats Transfer::stats() const
{
  return TransferStats {
      .verified_pieces = m_pieces.verified_count(),
      .piece_count = m_pieces.piece_count(),
      .hash_failures = m_pieces.hash_failures(),
      .write_failures = m_write_failures,
      .read_failures = m_read_failures,
      .bytes_received = m_bytes_received,
      .bytes_uploaded = m_bytes_uploaded,
      .connections = connection_count(),
      .sessions = m_sessions.size(),
      .halted = m_halted,
  };
}
}  // namespace swr
