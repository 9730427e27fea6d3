#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string_view>

#include "checkpoint/checkpoint_store.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

#include "auxiliary/error_propagation_macro.hpp"
#include "auxiliary/log.hpp"

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "checkpoint";
constexpr std::string_view MARKER = ".checkpoint.";

std::string_view extension_of(CheckpointFormat format)
{
  switch (format) {
    case CheckpointFormat::Bencode:
      return "bencode";
    case CheckpointFormat::Binary:
      break;
  }

  return "bin";
}

CheckpointFormat other_format(CheckpointFormat format)
{
  return format == CheckpointFormat::Binary ? CheckpointFormat::Bencode
                                            : CheckpointFormat::Binary;
}

int64_t unix_now()
{
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool write_fully(int descriptor, const std::vector<uint8_t>& data)
{
  size_t written = 0;

  while (written < data.size()) {
    auto result = ::write(descriptor, data.data() + written, data.size() - written);

    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }

    written += static_cast<size_t>(result);
  }

  return true;
}

void sync_directory(const std::filesystem::path& directory);

// temp file, fsync, rename
std::expected<void, CheckpointError> replace_file(const std::filesystem::path& target,
                                                  const std::vector<uint8_t>& data)
{
  auto temporary = target;
  temporary += ".tmp";

  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    log::error(COMPONENT,
               "cannot create directory {}: {}",
               target.parent_path().string(),
               ec.message());
    return std::unexpected(CheckpointError::IoFailed);
  }

  int descriptor =
      ::open(temporary.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
  if (descriptor < 0) {
    log::error(COMPONENT, "cannot create {}: {}", temporary.string(), std::strerror(errno));
    return std::unexpected(CheckpointError::IoFailed);
  }

  bool durable = write_fully(descriptor, data) && ::fsync(descriptor) == 0;
  int saved_errno = errno;
  ::close(descriptor);

  if (!durable) {
    log::error(COMPONENT, "cannot write {}: {}", temporary.string(), std::strerror(saved_errno));
    std::filesystem::remove(temporary, ec);
    return std::unexpected(CheckpointError::IoFailed);
  }

  std::filesystem::rename(temporary, target, ec);
  if (ec) {
    log::error(COMPONENT, "cannot replace {}: {}", target.string(), ec.message());
    std::filesystem::remove(temporary, ec);
    return std::unexpected(CheckpointError::IoFailed);
  }

  sync_directory(target.parent_path());
  return {};
}

std::expected<std::vector<uint8_t>, CheckpointError> read_file(
    const std::filesystem::path& path)
{
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(CheckpointError::NotFound);
  }

  std::ifstream file {path, std::ios::binary};
  if (!file) {
    return std::unexpected(CheckpointError::IoFailed);
  }

  std::vector<uint8_t> data {std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>()};

  if (file.bad()) {
    return std::unexpected(CheckpointError::IoFailed);
  }

  return data;
}

void sync_directory(const std::filesystem::path& directory)
{
  int descriptor = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);

  if (descriptor < 0) {
    log::debug(COMPONENT, "cannot open {} for sync: {}", directory.string(), std::strerror(errno));
    return;
  }

  if (::fsync(descriptor) != 0) {
    log::debug(COMPONENT, "directory sync of {} failed: {}", directory.string(), std::strerror(errno));
  }

  ::close(descriptor);
}

// <40 hex>.checkpoint.<bin|bencode>
std::optional<std::pair<InfoHash, CheckpointFormat>> parse_file_name(const std::string& name)
{
  auto marker = name.find(MARKER);

  if (marker == std::string::npos) {
    return std::nullopt;
  }

  auto id = info_hash_from_hex(std::string_view(name).substr(0, marker));
  auto extension = std::string_view(name).substr(marker + MARKER.size());

  if (!id) {
    return std::nullopt;
  }

  for (auto format : {CheckpointFormat::Binary, CheckpointFormat::Bencode}) {
    if (extension == extension_of(format)) {
      return std::pair {*id, format};
    }
  }

  return std::nullopt;
}
}  // namespace

CheckpointStore::CheckpointStore(CheckpointPolicy policy)
    : m_policy {std::move(policy)}
{
  std::error_code ec;
  std::filesystem::create_directories(m_policy.directory, ec);

  if (ec) {
    log::warn(COMPONENT,
              "cannot create checkpoint directory {}: {}",
              m_policy.directory.string(),
              ec.message());
  }
}

std::filesystem::path CheckpointStore::path_for(const InfoHash& id,
                                                CheckpointFormat format) const
{
  return m_policy.directory
      / fmt::format("{}{}{}", to_hex(id), MARKER, extension_of(format));
}

std::shared_ptr<std::mutex> CheckpointStore::lock_for(const InfoHash& id)
{
  std::lock_guard guard {m_table_lock};

  auto& lock = m_locks[id];
  if (!lock) {
    lock = std::make_shared<std::mutex>();
  }

  return lock;
}

size_t CheckpointStore::tracked_ids() const
{
  std::lock_guard guard {m_table_lock};
  return m_locks.size();
}

void CheckpointStore::release_lock(const InfoHash& id)
{
  std::lock_guard guard {m_table_lock};

  auto it = m_locks.find(id);

  // one reference in the table and one held by the caller
  if (it != m_locks.end() && it->second.use_count() <= 2) {
    m_locks.erase(it);
  }
}

std::expected<std::filesystem::path, CheckpointError> CheckpointStore::write(
    const Checkpoint& checkpoint, CheckpointFormat format)
{
  auto target = path_for(checkpoint.info_hash, format);
  auto encoded = encode_checkpoint(checkpoint, format);

  if (m_policy.compress) {
    encoded = SWR_TRY(compress_checkpoint(encoded));
  }

  SWR_TRY(replace_file(target, encoded));

  log::debug(COMPONENT,
             "saved {} ({}{}, {}/{} pieces)",
             to_hex(checkpoint.info_hash),
             to_string(format),
             m_policy.compress ? ", compressed" : "",
             checkpoint.bitfield.count(),
             checkpoint.piece_count);

  return target;
}

std::expected<Checkpoint, CheckpointError> CheckpointStore::read(
    const InfoHash& id, CheckpointFormat format) const
{
  auto data = SWR_TRY(read_file(path_for(id, format)));
  auto checkpoint = decode_checkpoint(data, format);

  if (checkpoint && checkpoint->info_hash != id) {
    return std::unexpected(CheckpointError::Inconsistent);
  }

  return checkpoint;
}

std::expected<std::filesystem::path, CheckpointError> CheckpointStore::save(
    const InfoHash& id, const aux::BitField& bitfield, const CheckpointMetadata& metadata)
{
  Checkpoint checkpoint {.version = Checkpoint::CURRENT_VERSION,
                         .info_hash = id,
                         .piece_count = static_cast<uint32_t>(bitfield.size()),
                         .bitfield = bitfield,
                         .metadata = metadata,
                         .updated_at = unix_now()};

  return save(checkpoint, m_policy.format);
}

std::expected<std::filesystem::path, CheckpointError> CheckpointStore::save(
    const Checkpoint& checkpoint, CheckpointFormat format)
{
  auto lock = lock_for(checkpoint.info_hash);
  std::lock_guard guard {*lock};

  return write(checkpoint, format);
}

std::optional<Checkpoint> CheckpointStore::load(const InfoHash& id)
{
  auto lock = lock_for(id);
  std::lock_guard guard {*lock};

  for (auto format : {m_policy.format, other_format(m_policy.format)}) {
    auto checkpoint = read(id, format);

    if (checkpoint) {
      return std::move(*checkpoint);
    }

    if (checkpoint.error() != CheckpointError::NotFound) {
      log::warn(COMPONENT,
                "ignoring {} checkpoint of {}: {}",
                to_string(format),
                to_hex(id),
                to_string(checkpoint.error()));
    }
  }

  return std::nullopt;
}

std::optional<Checkpoint> CheckpointStore::load(const InfoHash& id, CheckpointFormat format)
{
  auto lock = lock_for(id);
  std::lock_guard guard {*lock};

  auto checkpoint = read(id, format);

  if (!checkpoint) {
    if (checkpoint.error() != CheckpointError::NotFound) {
      log::warn(COMPONENT,
                "ignoring {} checkpoint of {}: {}",
                to_string(format),
                to_hex(id),
                to_string(checkpoint.error()));
    }
    return std::nullopt;
  }

  return std::move(*checkpoint);
}

bool CheckpointStore::remove(const InfoHash& id)
{
  auto lock = lock_for(id);
  std::lock_guard guard {*lock};

  bool removed = false;

  for (auto format : {CheckpointFormat::Binary, CheckpointFormat::Bencode}) {
    std::error_code ec;
    auto path = path_for(id, format);

    if (std::filesystem::remove(path, ec)) {
      removed = true;
      log::debug(COMPONENT, "deleted {}", path.string());
    } else if (ec) {
      log::warn(COMPONENT, "cannot delete {}: {}", path.string(), ec.message());
    }
  }

  release_lock(id);

  return removed;
}

std::vector<CheckpointEntry> CheckpointStore::list() const
{
  std::vector<CheckpointEntry> entries;

  std::error_code ec;
  std::filesystem::directory_iterator it {m_policy.directory, ec};

  if (ec) {
    return entries;
  }

  for (const auto& file : it) {
    auto parsed = parse_file_name(file.path().filename().string());

    if (!parsed || !file.is_regular_file(ec)) {
      continue;
    }

    auto size = file.file_size(ec);
    if (ec) {
      continue;
    }

    auto modified = file.last_write_time(ec);
    if (ec) {
      continue;
    }

    entries.push_back(CheckpointEntry {.info_hash = parsed->first,
                                       .format = parsed->second,
                                       .path = file.path(),
                                       .size = size,
                                       .modified = modified});
  }

  std::sort(entries.begin(),
            entries.end(),
            [](const auto& a, const auto& b) { return a.modified > b.modified; });

  return entries;
}

size_t CheckpointStore::cleanup_older_than(std::chrono::seconds age)
{
  auto cutoff = std::filesystem::file_time_type::clock::now() - age;
  size_t deleted = 0;

  for (const auto& entry : list()) {
    if (entry.modified >= cutoff) {
      continue;
    }

    auto lock = lock_for(entry.info_hash);
    std::lock_guard guard {*lock};

    std::error_code ec;
    if (std::filesystem::remove(entry.path, ec)) {
      deleted++;
      log::debug(COMPONENT, "cleaned up {}", entry.path.string());
    } else if (ec) {
      log::warn(COMPONENT, "cannot clean up {}: {}", entry.path.string(), ec.message());
    }
  }

  if (deleted > 0) {
    log::info(COMPONENT, "cleaned up {} old checkpoints", deleted);
  }

  return deleted;
}

std::expected<std::filesystem::path, CheckpointError> CheckpointStore::convert(
    const InfoHash& id, CheckpointFormat from, CheckpointFormat to)
{
  auto lock = lock_for(id);
  std::lock_guard guard {*lock};

  auto checkpoint = read(id, from);
  if (!checkpoint) {
    return std::unexpected(checkpoint.error());
  }

  return write(*checkpoint, to);
}

std::expected<std::filesystem::path, CheckpointError> CheckpointStore::backup(
    const InfoHash& id, const std::filesystem::path& destination)
{
  auto lock = lock_for(id);
  std::lock_guard guard {*lock};

  auto checkpoint = read(id, m_policy.format);
  if (!checkpoint && checkpoint.error() == CheckpointError::NotFound) {
    checkpoint = read(id, other_format(m_policy.format));
  }

  if (!checkpoint) {
    return std::unexpected(checkpoint.error());
  }

  auto encoded =
      SWR_TRY(compress_checkpoint(encode_checkpoint(*checkpoint, CheckpointFormat::Binary)));
  SWR_TRY(replace_file(destination, encoded));

  log::info(COMPONENT, "backed up {} to {}", to_hex(id), destination.string());
  return destination;
}

std::expected<Checkpoint, CheckpointError> CheckpointStore::restore(
    const std::filesystem::path& file, const InfoHash& expected_id)
{
  auto data = SWR_TRY(read_file(file));
  auto checkpoint = SWR_TRY(decode_any_checkpoint(data));

  if (checkpoint.info_hash != expected_id) {
    log::warn(COMPONENT,
              "backup {} belongs to {}, not {}",
              file.string(),
              to_hex(checkpoint.info_hash),
              to_hex(expected_id));
    return std::unexpected(CheckpointError::Inconsistent);
  }

  SWR_TRY(save(checkpoint, m_policy.format));

  log::info(COMPONENT, "restored {} from {}", to_hex(expected_id), file.string());
  return checkpoint;
}
}  // namespace swr
