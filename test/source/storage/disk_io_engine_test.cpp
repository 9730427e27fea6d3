#include <catch2/catch_test_macros.hpp>

#include <fstream>

#include "storage/disk_io_engine.hpp"
#include "storage/io_capabilities.hpp"
#include "torrent/layout/file_layout.hpp"
#include "test_support.hpp"

using boost::asio::awaitable;

namespace
{
swr::IoCapabilities worker_pool_only()
{
  return swr::IoCapabilities {};
}

swr::IoCapabilities claims_kernel_io()
{
  return swr::IoCapabilities {.is_linux = true,
                              .kernel_major = 6,
                              .kernel_minor = 1,
                              .asio_file_support = true};
}
}  // namespace

TEST_CASE("Kernel release strings are parsed", "[disk]")
{
  int major = 0;
  int minor = 0;

  REQUIRE(swr::parse_kernel_release("6.1.0-13-amd64", major, minor));
  REQUIRE(major == 6);
  REQUIRE(minor == 1);

  REQUIRE(swr::parse_kernel_release("5.15", major, minor));
  REQUIRE(minor == 15);

  REQUIRE_FALSE(swr::parse_kernel_release("linux", major, minor));
  REQUIRE_FALSE(swr::parse_kernel_release("x.1", major, minor));
}

TEST_CASE("Kernel path needs linux 5.1 and asio file support", "[disk]")
{
  auto capabilities = claims_kernel_io();
  REQUIRE(capabilities.kernel_io_usable());

  capabilities.kernel_major = 5;
  capabilities.kernel_minor = 0;
  REQUIRE_FALSE(capabilities.kernel_io_usable());

  capabilities.kernel_minor = 1;
  capabilities.asio_file_support = false;
  REQUIRE_FALSE(capabilities.kernel_io_usable());
}

TEST_CASE("First write creates the file at its registered length", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, worker_pool_only()};

  auto path = directory / "nested/dir/data.bin";
  disk.register_file(path, 4096);

  std::vector<uint8_t> block(100, 0xab);

  auto written = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<size_t, swr::DiskError>>
      { co_return co_await disk.write(path, 1000, block); });

  REQUIRE(written);
  REQUIRE(*written == 100);
  REQUIRE(std::filesystem::file_size(path) == 4096);

  auto read = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<std::vector<uint8_t>, swr::DiskError>>
      { co_return co_await disk.read(path, 1000, 100); });

  REQUIRE(read);
  REQUIRE(*read == block);

  auto untouched = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<std::vector<uint8_t>, swr::DiskError>>
      { co_return co_await disk.read(path, 0, 16); });

  REQUIRE(untouched);
  REQUIRE(*untouched == std::vector<uint8_t>(16, 0));
}

TEST_CASE("Worker pool path counts every operation as a fallback", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, worker_pool_only()};

  REQUIRE(disk.active_path() == swr::IoPath::WorkerPool);

  auto path = directory / "file";
  std::vector<uint8_t> data(64, 7);

  swr::test::run(io,
                 [&]() -> awaitable<void>
                 {
                   auto written = co_await disk.write(path, 0, data);
                   REQUIRE(written);
                   auto read = co_await disk.read(path, 0, 64);
                   REQUIRE(read);
                 });

  auto stats = disk.stats();
  REQUIRE(stats.operations == 2);
  REQUIRE(stats.fallback_operations == 2);
  REQUIRE(stats.fast_path_errors == 0);
  REQUIRE(stats.bytes_written == 64);
  REQUIRE(stats.bytes_read == 64);
}

TEST_CASE("Kernel path failures are replayed on the worker pool", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, claims_kernel_io()};

  REQUIRE(disk.active_path() == swr::IoPath::Kernel);

  auto path = directory / "file";
  std::vector<uint8_t> data(256, 3);

  auto read = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<std::vector<uint8_t>, swr::DiskError>>
      {
        auto written = co_await disk.write(path, 512, data);
        REQUIRE(written);
        co_return co_await disk.read(path, 512, 256);
      });

  REQUIRE(read);
  REQUIRE(*read == data);

  // whatever the kernel path did, each failure there was retried once
  auto stats = disk.stats();
  REQUIRE(stats.fast_path_errors == stats.fallback_operations);
  REQUIRE(stats.failed_operations == 0);
}

TEST_CASE("Reading past the end of a file is a short read", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, worker_pool_only()};

  auto path = directory / "short";
  std::ofstream {path} << "abc";

  auto read = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<std::vector<uint8_t>, swr::DiskError>>
      { co_return co_await disk.read(path, 0, 10); });

  REQUIRE_FALSE(read);
  REQUIRE(read.error() == swr::DiskError::ShortRead);
  REQUIRE(disk.stats().failed_operations == 1);
}

TEST_CASE("Missing files cannot be read", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, worker_pool_only()};

  auto read = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<std::vector<uint8_t>, swr::DiskError>>
      { co_return co_await disk.read(directory / "absent", 0, 1); });

  REQUIRE_FALSE(read);
  REQUIRE(read.error() == swr::DiskError::OpenFailed);
}

TEST_CASE("Files under an unwritable parent cannot be created", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, worker_pool_only()};

  // a regular file where a directory is needed
  auto blocker = directory / "blocker";
  std::ofstream {blocker} << "x";

  std::vector<uint8_t> data(4, 1);

  auto written = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<size_t, swr::DiskError>>
      { co_return co_await disk.write(blocker / "child", 0, data); });

  REQUIRE_FALSE(written);
  REQUIRE(written.error() == swr::DiskError::CreateFailed);
}

TEST_CASE("Preallocation sizes a registered file without writing", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, worker_pool_only()};

  auto path = directory / "sub/empty";
  disk.register_file(path, 0);

  auto prepared = swr::test::run(
      io,
      [&]() -> awaitable<std::expected<void, swr::DiskError>>
      { co_return co_await disk.preallocate(path); });

  REQUIRE(prepared);
  REQUIRE(std::filesystem::exists(path));
  REQUIRE(std::filesystem::file_size(path) == 0);
}

TEST_CASE("Flush syncs files written on either path", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;

  for (auto capabilities : {worker_pool_only(), claims_kernel_io()}) {
    swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, capabilities};

    auto nothing_open = swr::test::run(
        io,
        [&]() -> awaitable<std::expected<void, swr::DiskError>> { co_return co_await disk.flush(); });
    REQUIRE(nothing_open);

    auto path = directory / std::string(swr::to_string(disk.active_path())) / "file";
    std::vector<uint8_t> data(300, 9);

    auto flushed = swr::test::run(
        io,
        [&]() -> awaitable<std::expected<void, swr::DiskError>>
        {
          auto written = co_await disk.write(path, 0, data);
          REQUIRE(written);
          co_return co_await disk.flush();
        });

    REQUIRE(flushed);
    REQUIRE(std::filesystem::file_size(path) == 300);
  }
}

TEST_CASE("Reads across a piece boundary match whole-piece reads", "[disk]")
{
  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk {io.get_executor(), swr::DiskPolicy {}, worker_pool_only()};

  swr::FileLayout layout {{swr::FileEntry {"a", 300}, swr::FileEntry {"b", 800}}, 512};

  std::vector<uint8_t> content(layout.total_length());
  for (size_t i = 0; i < content.size(); i++) {
    content[i] = static_cast<uint8_t>(i * 13 + 1);
  }

  auto read_range = [&](uint32_t piece, uint32_t offset, uint32_t length)
  {
    return swr::test::run(io,
                          [&]() -> awaitable<std::vector<uint8_t>>
                          {
                            std::vector<uint8_t> bytes;
                            auto segments = layout.map(piece, offset, length);
                            REQUIRE(segments);

                            for (const auto& segment : *segments) {
                              auto chunk = co_await disk.read(
                                  directory / segment.path, segment.file_offset, segment.length);
                              REQUIRE(chunk);
                              bytes.insert(bytes.end(), chunk->begin(), chunk->end());
                            }

                            co_return bytes;
                          });
  };

  swr::test::run(io,
                 [&]() -> awaitable<void>
                 {
                   auto first = co_await disk.write(
                       directory / "a", 0, std::span<const uint8_t>(content).first(300));
                   REQUIRE(first);
                   auto second = co_await disk.write(
                       directory / "b", 0, std::span<const uint8_t>(content).subspan(300));
                   REQUIRE(second);
                 });

  auto whole = read_range(0, 0, 512);
  auto next = read_range(1, 0, 512);
  whole.insert(whole.end(), next.begin(), next.end());

  auto straddling = read_range(0, 400, 112);
  auto continued = read_range(1, 0, 100);
  straddling.insert(straddling.end(), continued.begin(), continued.end());

  REQUIRE(straddling == std::vector<uint8_t>(whole.begin() + 400, whole.begin() + 612));
  REQUIRE(straddling == std::vector<uint8_t>(content.begin() + 400, content.begin() + 612));
}
