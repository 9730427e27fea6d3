#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

#include "client/settings.hpp"
#include "storage/file_gate.hpp"
#include "storage/io_capabilities.hpp"

namespace swr
{
enum class IoPath : uint8_t
{
  Kernel,
  WorkerPool,
};

std::string_view to_string(IoPath path);

enum class DiskError : uint8_t
{
  CreateFailed,
  OpenFailed,
  ReadFailed,
  WriteFailed,
  ShortRead,
  SyncFailed,
};

std::string_view to_string(DiskError error);

struct DiskStats
{
  uint64_t operations = 0;
  uint64_t bytes_read = 0;
  uint64_t bytes_written = 0;
  uint64_t fast_path_errors = 0;
  uint64_t fallback_operations = 0;
  uint64_t failed_operations = 0;
  IoPath active_path = IoPath::WorkerPool;
};

/// Offset-addressed reads and writes against destination files.
///
/// Calls are made from the scheduler executor. When the kernel path is
/// active (asio file objects over io_uring) it is tried first; any failure
/// there is counted and the call is replayed on the worker pool with
/// blocking pread/pwrite, whose errors are returned to the caller.
///
/// Writes to one file are serialised, writes to different files run
/// concurrently. The first write to a file that does not exist yet creates
/// its parent directories and sizes it to its registered length.
class DiskIOEngine
{
public:
  DiskIOEngine(boost::asio::any_io_executor scheduler,
               DiskPolicy policy = {},
               IoCapabilities capabilities = probe_io_capabilities());

  ~DiskIOEngine();

  DiskIOEngine(const DiskIOEngine&) = delete;
  DiskIOEngine& operator=(const DiskIOEngine&) = delete;

  /// Final length of a destination file, used when it is first created.
  void register_file(const std::filesystem::path& path, uint64_t length);

  boost::asio::awaitable<std::expected<std::vector<uint8_t>, DiskError>> read(
      std::filesystem::path path, uint64_t offset, uint32_t length);

  /// data must stay valid until the returned awaitable completes.
  boost::asio::awaitable<std::expected<size_t, DiskError>> write(
      std::filesystem::path path, uint64_t offset, std::span<const uint8_t> data);

  /// Creates and sizes a registered file ahead of the first write.
  boost::asio::awaitable<std::expected<void, DiskError>> preallocate(
      std::filesystem::path path);

  boost::asio::awaitable<std::expected<void, DiskError>> flush();

  void close_all();

  DiskStats stats() const;

  IoPath active_path() const { return m_active_path; }

  /// Bounded pool shared with other blocking work such as hashing.
  boost::asio::thread_pool& workers() { return m_workers; }

private:
  struct OpenFile;

  std::shared_ptr<OpenFile> handle_for(const std::filesystem::path& path);

  boost::asio::awaitable<std::expected<void, DiskError>> prepare(
      std::shared_ptr<OpenFile> file, uint64_t minimum_length);

  boost::asio::awaitable<bool> try_kernel_write(std::shared_ptr<OpenFile> file,
                                                uint64_t offset,
                                                std::span<const uint8_t> data);

  boost::asio::awaitable<bool> try_kernel_read(std::shared_ptr<OpenFile> file,
                                               uint64_t offset,
                                               std::vector<uint8_t>& buffer);

  void record_fast_path_error(std::string_view operation,
                              const std::filesystem::path& path,
                              std::string_view reason);

  boost::asio::any_io_executor m_scheduler;
  DiskPolicy m_policy;
  IoCapabilities m_capabilities;
  IoPath m_active_path;

  boost::asio::thread_pool m_workers;

  std::map<std::filesystem::path, std::shared_ptr<OpenFile>> m_files;
  std::map<std::filesystem::path, uint64_t> m_registered_lengths;

  std::atomic<uint64_t> m_operations {0};
  std::atomic<uint64_t> m_bytes_read {0};
  std::atomic<uint64_t> m_bytes_written {0};
  std::atomic<uint64_t> m_fast_path_errors {0};
  std::atomic<uint64_t> m_fallback_operations {0};
  std::atomic<uint64_t> m_failed_operations {0};
};
}  // namespace swr
