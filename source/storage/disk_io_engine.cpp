#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include "storage/disk_io_engine.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "auxiliary/log.hpp"
#include "auxiliary/offload.hpp"

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "disk";

std::expected<void, DiskError> create_sized(const std::filesystem::path& path,
                                            uint64_t length)
{
  std::error_code ec;

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      log::error(COMPONENT,
                 "cannot create directory {}: {}",
                 path.parent_path().string(),
                 ec.message());
      return std::unexpected(DiskError::CreateFailed);
    }
  }

  if (std::filesystem::exists(path, ec)) {
    return {};
  }

  int descriptor = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (descriptor < 0) {
    log::error(COMPONENT, "cannot create {}: {}", path.string(), std::strerror(errno));
    return std::unexpected(DiskError::CreateFailed);
  }

  // sparse zero fill so writes at any offset land inside the file
  int result = ::ftruncate(descriptor, static_cast<off_t>(length));
  int saved_errno = errno;
  ::close(descriptor);

  if (result != 0) {
    log::error(COMPONENT, "cannot size {}: {}", path.string(), std::strerror(saved_errno));
    return std::unexpected(DiskError::CreateFailed);
  }

  log::debug(COMPONENT, "created {} ({} bytes)", path.string(), length);
  return {};
}

std::expected<size_t, DiskError> write_all(int descriptor,
                                           uint64_t offset,
                                           std::span<const uint8_t> data)
{
  size_t written = 0;

  while (written < data.size()) {
    auto result = ::pwrite(descriptor,
                           data.data() + written,
                           data.size() - written,
                           static_cast<off_t>(offset + written));
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(DiskError::WriteFailed);
    }

    written += static_cast<size_t>(result);
  }

  return written;
}

std::expected<std::vector<uint8_t>, DiskError> read_all(int descriptor,
                                                        uint64_t offset,
                                                        uint32_t length)
{
  std::vector<uint8_t> buffer(length);
  size_t received = 0;

  while (received < length) {
    auto result = ::pread(descriptor,
                          buffer.data() + received,
                          length - received,
                          static_cast<off_t>(offset + received));
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(DiskError::ReadFailed);
    }

    if (result == 0) {
      return std::unexpected(DiskError::ShortRead);
    }

    received += static_cast<size_t>(result);
  }

  return buffer;
}
}  // namespace

std::string_view to_string(IoPath path)
{
  switch (path) {
    case IoPath::Kernel:
      return "kernel";
    case IoPath::WorkerPool:
      return "worker-pool";
  }

  return "unknown";
}

std::string_view to_string(DiskError error)
{
  switch (error) {
    case DiskError::CreateFailed:
      return "cannot create destination file";
    case DiskError::OpenFailed:
      return "cannot open file";
    case DiskError::ReadFailed:
      return "read failed";
    case DiskError::WriteFailed:
      return "write failed";
    case DiskError::ShortRead:
      return "read past end of file";
    case DiskError::SyncFailed:
      return "sync failed";
  }

  return "unknown";
}

struct DiskIOEngine::OpenFile
{
  explicit OpenFile(std::filesystem::path p_path)
      : path {std::move(p_path)}
  {
  }

  ~OpenFile() { close(); }

  // Opens lazily from whichever worker needs it first. -1 when the file
  // cannot be opened.
  int descriptor()
  {
    std::lock_guard guard {descriptor_lock};

    if (fd < 0) {
      fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    }

    return fd;
  }

  void close()
  {
    std::lock_guard guard {descriptor_lock};

    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }

#if defined(BOOST_ASIO_HAS_FILE)
    if (kernel_file) {
      boost::system::error_code ignored;
      kernel_file->close(ignored);
      kernel_file.reset();
    }
#endif
  }

  std::filesystem::path path;
  FileGate gate;
  bool prepared = false;

  std::mutex descriptor_lock;
  int fd = -1;

#if defined(BOOST_ASIO_HAS_FILE)
  std::unique_ptr<boost::asio::random_access_file> kernel_file;
#endif
};

DiskIOEngine::DiskIOEngine(boost::asio::any_io_executor scheduler,
                           DiskPolicy policy,
                           IoCapabilities capabilities)
    : m_scheduler {std::move(scheduler)}
    , m_policy {policy}
    , m_capabilities {capabilities}
    , m_active_path {m_policy.enable_kernel_io && m_capabilities.kernel_io_usable()
                         ? IoPath::Kernel
                         : IoPath::WorkerPool}
    , m_workers {std::max<uint16_t>(m_policy.worker_threads, 1)}
{
  log::info(COMPONENT,
            "disk engine using {} path ({}), {} workers",
            to_string(m_active_path),
            m_capabilities.describe(),
            std::max<uint16_t>(m_policy.worker_threads, 1));
}

DiskIOEngine::~DiskIOEngine()
{
  m_workers.join();
  close_all();
}

void DiskIOEngine::register_file(const std::filesystem::path& path, uint64_t length)
{
  m_registered_lengths[path] = length;
}

std::shared_ptr<DiskIOEngine::OpenFile> DiskIOEngine::handle_for(
    const std::filesystem::path& path)
{
  auto& file = m_files[path];

  if (!file) {
    file = std::make_shared<OpenFile>(path);
  }

  return file;
}

boost::asio::awaitable<std::expected<void, DiskError>> DiskIOEngine::prepare(
    std::shared_ptr<OpenFile> file, uint64_t minimum_length)
{
  if (file->prepared) {
    co_return std::expected<void, DiskError> {};
  }

  uint64_t length = minimum_length;
  if (auto it = m_registered_lengths.find(file->path);
      it != m_registered_lengths.end())
  {
    length = std::max(length, it->second);
  }

  auto created = co_await offload(
      m_workers, [path = file->path, length] { return create_sized(path, length); });

  if (created) {
    file->prepared = true;
  }

  co_return created;
}

void DiskIOEngine::record_fast_path_error(std::string_view operation,
                                          const std::filesystem::path& path,
                                          std::string_view reason)
{
  m_fast_path_errors.fetch_add(1, std::memory_order_relaxed);
  log::debug(COMPONENT,
             "kernel {} on {} failed ({}), using worker pool",
             operation,
             path.string(),
             reason);
}

boost::asio::awaitable<bool> DiskIOEngine::try_kernel_write(
    std::shared_ptr<OpenFile> file, uint64_t offset, std::span<const uint8_t> data)
{
#if defined(BOOST_ASIO_HAS_FILE)
  if (!file->kernel_file) {
    auto kernel_file = std::make_unique<boost::asio::random_access_file>(m_scheduler);

    boost::system::error_code ec;
    kernel_file->open(file->path.string(), boost::asio::file_base::read_write, ec);

    if (ec) {
      record_fast_path_error("open", file->path, ec.message());
      co_return false;
    }

    file->kernel_file = std::move(kernel_file);
  }

  boost::system::error_code ec;
  auto written = co_await boost::asio::async_write_at(
      *file->kernel_file,
      offset,
      boost::asio::buffer(data.data(), data.size()),
      boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (ec || written != data.size()) {
    record_fast_path_error("write", file->path, ec ? ec.message() : "short write");
    co_return false;
  }

  co_return true;
#else
  (void)offset;
  (void)data;
  record_fast_path_error("write", file->path, "asio built without file support");
  co_return false;
#endif
}

boost::asio::awaitable<bool> DiskIOEngine::try_kernel_read(
    std::shared_ptr<OpenFile> file, uint64_t offset, std::vector<uint8_t>& buffer)
{
#if defined(BOOST_ASIO_HAS_FILE)
  if (!file->kernel_file) {
    auto kernel_file = std::make_unique<boost::asio::random_access_file>(m_scheduler);

    boost::system::error_code ec;
    kernel_file->open(file->path.string(), boost::asio::file_base::read_write, ec);

    if (ec) {
      record_fast_path_error("open", file->path, ec.message());
      co_return false;
    }

    file->kernel_file = std::move(kernel_file);
  }

  boost::system::error_code ec;
  auto received = co_await boost::asio::async_read_at(
      *file->kernel_file,
      offset,
      boost::asio::buffer(buffer),
      boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (ec || received != buffer.size()) {
    record_fast_path_error("read", file->path, ec ? ec.message() : "short read");
    co_return false;
  }

  co_return true;
#else
  (void)offset;
  (void)buffer;
  record_fast_path_error("read", file->path, "asio built without file support");
  co_return false;
#endif
}

boost::asio::awaitable<std::expected<std::vector<uint8_t>, DiskError>>
DiskIOEngine::read(std::filesystem::path path, uint64_t offset, uint32_t length)
{
  m_operations.fetch_add(1, std::memory_order_relaxed);

  auto file = handle_for(path);

  if (m_active_path == IoPath::Kernel) {
    std::vector<uint8_t> buffer(length);

    if (co_await try_kernel_read(file, offset, buffer)) {
      m_bytes_read.fetch_add(length, std::memory_order_relaxed);
      co_return buffer;
    }
  }

  m_fallback_operations.fetch_add(1, std::memory_order_relaxed);

  auto result = co_await offload(
      m_workers,
      [file, offset, length]() -> std::expected<std::vector<uint8_t>, DiskError>
      {
        int descriptor = file->descriptor();
        if (descriptor < 0) {
          return std::unexpected(DiskError::OpenFailed);
        }

        return read_all(descriptor, offset, length);
      });

  if (result) {
    m_bytes_read.fetch_add(length, std::memory_order_relaxed);
  } else {
    m_failed_operations.fetch_add(1, std::memory_order_relaxed);
    log::warn(COMPONENT,
              "read {}@{}+{} failed: {}",
              path.string(),
              offset,
              length,
              to_string(result.error()));
  }

  co_return result;
}

boost::asio::awaitable<std::expected<size_t, DiskError>> DiskIOEngine::write(
    std::filesystem::path path, uint64_t offset, std::span<const uint8_t> data)
{
  m_operations.fetch_add(1, std::memory_order_relaxed);

  auto file = handle_for(path);
  auto hold = co_await file->gate.acquire();

  if (auto prepared = co_await prepare(file, offset + data.size()); !prepared) {
    m_failed_operations.fetch_add(1, std::memory_order_relaxed);
    co_return std::unexpected(prepared.error());
  }

  if (m_active_path == IoPath::Kernel
      && co_await try_kernel_write(file, offset, data))
  {
    m_bytes_written.fetch_add(data.size(), std::memory_order_relaxed);
    co_return data.size();
  }

  m_fallback_operations.fetch_add(1, std::memory_order_relaxed);

  auto result = co_await offload(
      m_workers,
      [file, offset, data]() -> std::expected<size_t, DiskError>
      {
        int descriptor = file->descriptor();
        if (descriptor < 0) {
          return std::unexpected(DiskError::OpenFailed);
        }

        return write_all(descriptor, offset, data);
      });

  if (result) {
    m_bytes_written.fetch_add(*result, std::memory_order_relaxed);
  } else {
    m_failed_operations.fetch_add(1, std::memory_order_relaxed);
    log::warn(COMPONENT,
              "write {}@{}+{} failed: {}",
              path.string(),
              offset,
              data.size(),
              to_string(result.error()));
  }

  co_return result;
}

boost::asio::awaitable<std::expected<void, DiskError>> DiskIOEngine::preallocate(
    std::filesystem::path path)
{
  auto file = handle_for(path);
  auto hold = co_await file->gate.acquire();

  co_return co_await prepare(file, 0);
}

boost::asio::awaitable<std::expected<void, DiskError>> DiskIOEngine::flush()
{
  std::vector<std::shared_ptr<OpenFile>> files;
  for (auto& [path, file] : m_files) {
    files.push_back(file);
  }

  co_return co_await offload(
      m_workers,
      [files = std::move(files)]() -> std::expected<void, DiskError>
      {
        for (auto& file : files) {
          std::lock_guard guard {file->descriptor_lock};

          if (file->fd >= 0 && ::fdatasync(file->fd) != 0) {
            log::warn(COMPONENT, "sync of {} failed: {}", file->path.string(), std::strerror(errno));
            return std::unexpected(DiskError::SyncFailed);
          }

#if defined(BOOST_ASIO_HAS_FILE)
          // writes through the kernel path land on this handle, not on fd
          if (file->kernel_file) {
            boost::system::error_code ec;
            file->kernel_file->sync_data(ec);

            if (ec) {
              log::warn(COMPONENT, "sync of {} failed: {}", file->path.string(), ec.message());
              return std::unexpected(DiskError::SyncFailed);
            }
          }
#endif
        }

        return {};
      });
}

void DiskIOEngine::close_all()
{
  for (auto& [path, file] : m_files) {
    file->close();
  }

  m_files.clear();
}

DiskStats DiskIOEngine::stats() const
{
  return DiskStats {
      .operations = m_operations.load(std::memory_order_relaxed),
      .bytes_read = m_bytes_read.load(std::memory_order_relaxed),
      .bytes_written = m_bytes_written.load(std::memory_order_relaxed),
      .fast_path_errors = m_fast_path_errors.load(std::memory_order_relaxed),
      .fallback_operations = m_fallback_operations.load(std::memory_order_relaxed),
      .failed_operations = m_failed_operations.load(std::memory_order_relaxed),
      .active_path = m_active_path,
  };
}
}  // namespace swr
