#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "checkpoint/checkpoint.hpp"
#include "checkpoint/checkpoint_codec.hpp"
#include "client/settings.hpp"

namespace swr
{
struct CheckpointEntry
{
  InfoHash info_hash;
  CheckpointFormat format;
  std::filesystem::path path;
  uintmax_t size;
  std::filesystem::file_time_type modified;
};

/// Durable per-transfer checkpoints, one file per transfer id (info hash)
/// and format, named <hex id>.checkpoint.<bin|bencode>.
///
/// With compression enabled the encoded bytes are zlib-compressed; loads
/// accept compressed and plain files alike.
///
/// Every operation on one id holds that id's lock, so calls for different
/// ids never wait on each other. All calls block; callers on the scheduler
/// go through the disk worker pool.
class CheckpointStore
{
public:
  explicit CheckpointStore(CheckpointPolicy policy);

  /// Writes atomically (temp file, fsync, rename) in the configured format.
  std::expected<std::filesystem::path, CheckpointError> save(
      const InfoHash& id,
      const aux::BitField& bitfield,
      const CheckpointMetadata& metadata);

  std::expected<std::filesystem::path, CheckpointError> save(const Checkpoint& checkpoint,
                                                             CheckpointFormat format);

  /// Tries the configured format, then the other one. Missing, corrupt or
  /// mismatched files read as no checkpoint.
  std::optional<Checkpoint> load(const InfoHash& id);

  std::optional<Checkpoint> load(const InfoHash& id, CheckpointFormat format);

  /// Deletes every format stored for the id. True when something was deleted.
  bool remove(const InfoHash& id);

  /// Newest first.
  std::vector<CheckpointEntry> list() const;

  /// Deletes checkpoint files not modified for at least age; returns how
  /// many were deleted.
  size_t cleanup_older_than(std::chrono::seconds age);

  /// Re-encodes a stored checkpoint; the source file is kept.
  std::expected<std::filesystem::path, CheckpointError> convert(const InfoHash& id,
                                                                CheckpointFormat from,
                                                                CheckpointFormat to);

  /// Writes a portable copy (compressed binary) to destination.
  std::expected<std::filesystem::path, CheckpointError> backup(
      const InfoHash& id, const std::filesystem::path& destination);

  /// Reads a backup of either format and stores it in the configured one.
  /// Fails with Inconsistent when the backup belongs to another id.
  std::expected<Checkpoint, CheckpointError> restore(const std::filesystem::path& file,
                                                     const InfoHash& expected_id);

  std::filesystem::path path_for(const InfoHash& id, CheckpointFormat format) const;

  const CheckpointPolicy& policy() const { return m_policy; }

  /// Ids with a per-id lock currently allocated.
  size_t tracked_ids() const;

private:
  std::shared_ptr<std::mutex> lock_for(const InfoHash& id);

  /// Drops the table entry of id unless someone else holds it.
  void release_lock(const InfoHash& id);

  std::expected<Checkpoint, CheckpointError> read(const InfoHash& id,
                                                  CheckpointFormat format) const;

  std::expected<std::filesystem::path, CheckpointError> write(const Checkpoint& checkpoint,
                                                              CheckpointFormat format);

  CheckpointPolicy m_policy;

  mutable std::mutex m_table_lock;
  std::map<InfoHash, std::shared_ptr<std::mutex>> m_locks;
};
}  // namespace swr
