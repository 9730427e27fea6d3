#include <algorithm>
#include <limits>
#include <stdexcept>

#include "piece/piece_manager.hpp"

#include <openssl/sha.h>

#include "auxiliary/log.hpp"

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "pieces";
}

PieceManager::PieceManager(std::vector<PieceHash> piece_hashes,
                           uint32_t piece_length,
                           uint64_t total_length,
                           PiecePolicy policy)
    : m_hashes {std::move(piece_hashes)}
    , m_pieces(m_hashes.size())
    , m_availability(m_hashes.size(), 0)
    , m_verified {m_hashes.size()}
    , m_piece_length {piece_length}
    , m_total_length {total_length}
    , m_policy {policy}
{
  if (m_piece_length == 0 || m_policy.block_size == 0) {
    throw std::invalid_argument("piece and block length must be positive");
  }

  auto expected_pieces = (m_total_length + m_piece_length - 1) / m_piece_length;
  if (expected_pieces != m_hashes.size()) {
    throw std::invalid_argument("piece hash count does not match content length");
  }

  m_policy.endgame_duplicates = std::max<uint16_t>(m_policy.endgame_duplicates, 1);
}

uint32_t PieceManager::piece_size(uint32_t piece_index) const
{
  if (piece_index >= m_pieces.size()) {
    return 0;
  }

  auto start = static_cast<uint64_t>(piece_index) * m_piece_length;
  return static_cast<uint32_t>(std::min<uint64_t>(m_piece_length, m_total_length - start));
}

uint32_t PieceManager::block_count(uint32_t piece_index) const
{
  return (piece_size(piece_index) + m_policy.block_size - 1) / m_policy.block_size;
}

Block PieceManager::block_at(uint32_t piece_index, uint32_t block_index) const
{
  auto offset = block_index * m_policy.block_size;

  return Block {.piece = piece_index,
                .offset = offset,
                .length = std::min(m_policy.block_size, piece_size(piece_index) - offset)};
}

void PieceManager::start_piece(uint32_t piece_index)
{
  auto& progress = m_pieces[piece_index];

  if (progress.state != PieceState::Missing) {
    return;
  }

  progress.state = PieceState::InProgress;
  progress.blocks.assign(block_count(piece_index), BlockSlot {});
  progress.received = 0;
}

void PieceManager::reset_piece(uint32_t piece_index)
{
  auto& progress = m_pieces[piece_index];

  progress.state = PieceState::Missing;
  progress.blocks.clear();
  progress.received = 0;
  progress.verifying = false;
}

double PieceManager::completion_ratio() const
{
  if (m_pieces.empty()) {
    return 1.0;
  }

  return static_cast<double>(m_verified_count) / static_cast<double>(m_pieces.size());
}

bool PieceManager::in_endgame() const
{
  return !is_complete() && completion_ratio() > m_policy.endgame_threshold;
}

std::optional<uint32_t> PieceManager::pick_block(const PieceProgress& progress,
                                                 Pass pass,
                                                 PeerKey peer) const
{
  for (uint32_t i = 0; i < progress.blocks.size(); i++) {
    const auto& slot = progress.blocks[i];

    if (slot.received) {
      continue;
    }

    if (pass == Pass::Normal && slot.requested_by.empty()) {
      return i;
    }

    if (pass == Pass::Endgame
        && slot.requested_by.size() < m_policy.endgame_duplicates
        && std::find(slot.requested_by.begin(), slot.requested_by.end(), peer)
            == slot.requested_by.end())
    {
      return i;
    }
  }

  return std::nullopt;
}

std::optional<Block> PieceManager::select_next_request(const aux::BitField& peer_has,
                                                       PeerKey peer)
{
  auto passes = in_endgame() ? std::vector {Pass::Normal, Pass::Endgame}
                             : std::vector {Pass::Normal};

  for (auto pass : passes) {
    std::optional<uint32_t> best_piece;
    uint32_t best_block = 0;
    uint32_t best_availability = std::numeric_limits<uint32_t>::max();

    for (uint32_t index = 0; index < m_pieces.size(); index++) {
      const auto& progress = m_pieces[index];

      if (progress.state == PieceState::Verified || progress.verifying
          || !peer_has.get(index) || m_availability[index] >= best_availability)
      {
        continue;
      }

      if (progress.state == PieceState::Missing) {
        // every block of a missing piece is free
        best_piece = index;
        best_block = 0;
        best_availability = m_availability[index];
        continue;
      }

      if (auto block = pick_block(progress, pass, peer)) {
        best_piece = index;
        best_block = *block;
        best_availability = m_availability[index];
      }
    }

    if (best_piece) {
      start_piece(*best_piece);
      m_pieces[*best_piece].blocks[best_block].requested_by.push_back(peer);

      return block_at(*best_piece, best_block);
    }
  }

  return std::nullopt;
}

std::optional<WriteInstruction> PieceManager::on_block_received(uint32_t piece_index,
                                                                uint32_t offset,
                                                                std::vector<uint8_t> data,
                                                                PeerKey from)
{
  if (piece_index >= m_pieces.size() || offset % m_policy.block_size != 0) {
    return std::nullopt;
  }

  auto& progress = m_pieces[piece_index];

  if (progress.state == PieceState::Verified || progress.verifying) {
    return std::nullopt;
  }

  auto block_index = offset / m_policy.block_size;

  if (block_index >= block_count(piece_index)
      || data.size() != block_at(piece_index, block_index).length)
  {
    return std::nullopt;
  }

  start_piece(piece_index);

  auto& slot = progress.blocks[block_index];

  if (slot.received) {
    return std::nullopt;
  }

  slot.received = true;
  progress.received++;

  WriteInstruction instruction {.piece = piece_index,
                                .offset = offset,
                                .data = std::move(data),
                                .cancel_peers = {},
                                .piece_complete = progress.received == progress.blocks.size()};

  for (auto peer : slot.requested_by) {
    if (peer != from) {
      instruction.cancel_peers.push_back(peer);
    }
  }
  slot.requested_by.clear();

  return instruction;
}

void PieceManager::on_write_failed(uint32_t piece_index, uint32_t offset)
{
  if (piece_index >= m_pieces.size()) {
    return;
  }

  auto& progress = m_pieces[piece_index];
  auto block_index = offset / m_policy.block_size;

  if (progress.state != PieceState::InProgress || block_index >= progress.blocks.size()) {
    return;
  }

  auto& slot = progress.blocks[block_index];

  if (slot.received) {
    slot.received = false;
    progress.received--;
  }
}

PieceHash PieceManager::hash_bytes(std::span<const uint8_t> bytes)
{
  PieceHash digest {};
  SHA1(bytes.data(), bytes.size(), digest.data());
  return digest;
}

bool PieceManager::begin_verification(uint32_t piece_index)
{
  if (piece_index >= m_pieces.size()) {
    return false;
  }

  auto& progress = m_pieces[piece_index];

  if (progress.state != PieceState::InProgress || progress.verifying
      || progress.received != progress.blocks.size())
  {
    return false;
  }

  progress.verifying = true;
  return true;
}

bool PieceManager::finish_verification(uint32_t piece_index, const PieceHash& digest)
{
  if (piece_index >= m_pieces.size()) {
    return false;
  }

  auto& progress = m_pieces[piece_index];

  // the slot was never claimed, or the piece was reset meanwhile
  if (progress.state != PieceState::InProgress || !progress.verifying) {
    return false;
  }

  if (digest != m_hashes[piece_index]) {
    m_hash_failures++;
    reset_piece(piece_index);

    log::warn(COMPONENT, "piece {} failed hash check, requesting again", piece_index);

    if (m_on_verification_failed) {
      m_on_verification_failed(piece_index);
    }

    return false;
  }

  progress.state = PieceState::Verified;
  progress.verifying = false;
  progress.blocks.clear();
  progress.blocks.shrink_to_fit();

  m_verified.mark(piece_index, true);
  m_verified_count++;

  log::debug(COMPONENT,
             "piece {} verified ({}/{})",
             piece_index,
             m_verified_count,
             m_pieces.size());

  return true;
}

bool PieceManager::verify_piece(uint32_t piece_index, std::span<const uint8_t> assembled)
{
  if (piece_index < m_pieces.size() && m_pieces[piece_index].state == PieceState::Verified) {
    return true;
  }

  if (!begin_verification(piece_index)) {
    return false;
  }

  if (assembled.size() != piece_size(piece_index)) {
    return finish_verification(piece_index, PieceHash {});
  }

  return finish_verification(piece_index, hash_bytes(assembled));
}

bool PieceManager::abort_verification(uint32_t piece_index)
{
  if (piece_index >= m_pieces.size()) {
    return false;
  }

  auto& progress = m_pieces[piece_index];

  if (progress.state != PieceState::InProgress || !progress.verifying) {
    return false;
  }

  reset_piece(piece_index);

  log::warn(COMPONENT, "piece {} could not be checked, requesting again", piece_index);
  return true;
}

void PieceManager::on_peer_disconnected(PeerKey peer)
{
  for (auto& progress : m_pieces) {
    for (auto& slot : progress.blocks) {
      std::erase(slot.requested_by, peer);
    }
  }
}

void PieceManager::release_request(PeerKey peer, const Block& block)
{
  if (block.piece >= m_pieces.size()) {
    return;
  }

  auto& progress = m_pieces[block.piece];
  auto block_index = block.offset / m_policy.block_size;

  if (block_index < progress.blocks.size()) {
    std::erase(progress.blocks[block_index].requested_by, peer);
  }
}

void PieceManager::add_peer_bitfield(const aux::BitField& peer_has)
{
  for (uint32_t i = 0; i < m_availability.size(); i++) {
    if (peer_has.get(i)) {
      m_availability[i]++;
    }
  }
}

void PieceManager::remove_peer_bitfield(const aux::BitField& peer_has)
{
  for (uint32_t i = 0; i < m_availability.size(); i++) {
    if (peer_has.get(i) && m_availability[i] > 0) {
      m_availability[i]--;
    }
  }
}

void PieceManager::on_have(uint32_t piece_index)
{
  if (piece_index < m_availability.size()) {
    m_availability[piece_index]++;
  }
}

void PieceManager::restore(const aux::BitField& verified)
{
  for (uint32_t i = 0; i < m_pieces.size(); i++) {
    if (verified.get(i) && m_pieces[i].state != PieceState::Verified) {
      reset_piece(i);
      m_pieces[i].state = PieceState::Verified;
      m_verified.mark(i, true);
      m_verified_count++;
    }
  }
}

PieceState PieceManager::state(uint32_t piece_index) const
{
  if (piece_index >= m_pieces.size()) {
    return PieceState::Missing;
  }

  return m_pieces[piece_index].state;
}

uint32_t PieceManager::availability(uint32_t piece_index) const
{
  return piece_index < m_availability.size() ? m_availability[piece_index] : 0;
}

size_t PieceManager::outstanding_requests(PeerKey peer) const
{
  size_t total = 0;

  for (const auto& progress : m_pieces) {
    for (const auto& slot : progress.blocks) {
      total += std::count(slot.requested_by.begin(), slot.requested_by.end(), peer);
    }
  }

  return total;
}
}  // namespace swr
