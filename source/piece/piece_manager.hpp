#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "client/settings.hpp"
#include "torrent/bitfield/bitfield.hpp"

namespace swr
{
using PieceHash = std::array<uint8_t, 20>;

/// Identifies the peer a request was handed to. 0 is an anonymous caller.
using PeerKey = uint64_t;

enum class PieceState : uint8_t
{
  Missing,
  InProgress,
  Verified,
};

struct Block
{
  uint32_t piece;
  uint32_t offset;
  uint32_t length;

  auto operator<=>(const Block&) const = default;
};

/// Disk write the caller must perform for an accepted block.
struct WriteInstruction
{
  uint32_t piece;
  uint32_t offset;
  std::vector<uint8_t> data;

  // peers that still have the same block outstanding (endgame duplicates)
  std::vector<PeerKey> cancel_peers;

  bool piece_complete = false;
};

/// Owns piece verification state and decides which block to request next.
///
/// Selection is rarest first: among pieces that are not verified and still
/// have an unrequested block the peer can serve, the one held by the fewest
/// known peers wins, ties going to the lowest index. Once the verified ratio
/// passes the endgame threshold, blocks that are already requested may be
/// handed out again to other peers, up to the configured duplicate count.
///
/// Not thread safe; used from the scheduler only.
class PieceManager
{
public:
  using VerificationFailedCallback = std::function<void(uint32_t piece_index)>;

  PieceManager(std::vector<PieceHash> piece_hashes,
               uint32_t piece_length,
               uint64_t total_length,
               PiecePolicy policy = {});

  std::optional<Block> select_next_request(const aux::BitField& peer_has,
                                           PeerKey peer = 0);

  /// Records a delivered block. The first delivery is accepted and yields the
  /// write to perform; duplicates, blocks of verified pieces and blocks that
  /// do not match the block grid yield nothing.
  std::optional<WriteInstruction> on_block_received(uint32_t piece_index,
                                                    uint32_t offset,
                                                    std::vector<uint8_t> data,
                                                    PeerKey from = 0);

  /// Hashes the assembled piece and compares it with the expected hash. A
  /// mismatch resets the piece to missing and discards its blocks. Takes the
  /// verification slot, so it fails for incomplete pieces and for pieces
  /// already being verified.
  bool verify_piece(uint32_t piece_index, std::span<const uint8_t> assembled);

  /// Claims the single verification slot of a complete piece. False when the
  /// piece is not complete, already verified or already being verified.
  bool begin_verification(uint32_t piece_index);

  /// Applies the digest of a piece claimed with begin_verification. False
  /// when the slot is not held, e.g. after the piece was reset.
  bool finish_verification(uint32_t piece_index, const PieceHash& digest);

  /// Releases a claimed slot without a verdict: the piece goes back to
  /// missing, no hash failure is counted and no callback runs.
  bool abort_verification(uint32_t piece_index);

  /// A write for an accepted block failed; the block is requested again.
  void on_write_failed(uint32_t piece_index, uint32_t offset);

  /// Returns every block outstanding on the peer to the request pool.
  void on_peer_disconnected(PeerKey peer);

  /// Returns one outstanding block of a peer to the request pool.
  void release_request(PeerKey peer, const Block& block);

  void add_peer_bitfield(const aux::BitField& peer_has);
  void remove_peer_bitfield(const aux::BitField& peer_has);
  void on_have(uint32_t piece_index);

  /// Marks the pieces of a trusted bitfield (from a checkpoint) verified.
  void restore(const aux::BitField& verified);

  void on_verification_failed(VerificationFailedCallback callback)
  {
    m_on_verification_failed = std::move(callback);
  }

  PieceState state(uint32_t piece_index) const;
  uint32_t availability(uint32_t piece_index) const;
  uint32_t piece_size(uint32_t piece_index) const;
  uint32_t piece_count() const { return static_cast<uint32_t>(m_pieces.size()); }
  uint32_t verified_count() const { return m_verified_count; }
  uint64_t hash_failures() const { return m_hash_failures; }
  double completion_ratio() const;
  bool in_endgame() const;
  bool is_complete() const { return m_verified_count == m_pieces.size(); }
  const aux::BitField& bitfield() const { return m_verified; }
  size_t outstanding_requests(PeerKey peer) const;

  static PieceHash hash_bytes(std::span<const uint8_t> bytes);

private:
  struct BlockSlot
  {
    bool received = false;
    std::vector<PeerKey> requested_by;
  };

  struct PieceProgress
  {
    PieceState state = PieceState::Missing;
    std::vector<BlockSlot> blocks;
    uint32_t received = 0;
    bool verifying = false;
  };

  enum class Pass : uint8_t
  {
    Normal,
    Endgame,
  };

  std::optional<uint32_t> pick_block(const PieceProgress& progress,
                                     Pass pass,
                                     PeerKey peer) const;

  uint32_t block_count(uint32_t piece_index) const;
  Block block_at(uint32_t piece_index, uint32_t block_index) const;
  void start_piece(uint32_t piece_index);
  void reset_piece(uint32_t piece_index);

  std::vector<PieceHash> m_hashes;
  std::vector<PieceProgress> m_pieces;
  std::vector<uint32_t> m_availability;
  aux::BitField m_verified;

  uint32_t m_piece_length;
  uint64_t m_total_length;
  PiecePolicy m_policy;

  uint32_t m_verified_count = 0;
  uint64_t m_hash_failures = 0;

  VerificationFailedCallback m_on_verification_failed;
};
}  // namespace swr
