#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>

#include "client/transfer.hpp"
#include "client/transfer_registry.hpp"
#include "test_support.hpp"

using boost::asio::awaitable;

namespace
{
constexpr uint32_t PIECE = 16 * 1024;
constexpr uint64_t FIRST_FILE = 20000;
constexpr uint64_t SECOND_FILE = 30000;
constexpr uint64_t TOTAL = FIRST_FILE + SECOND_FILE;

std::vector<uint8_t> content()
{
  std::vector<uint8_t> bytes(TOTAL);
  for (size_t i = 0; i < bytes.size(); i++) {
    bytes[i] = static_cast<uint8_t>(i * 31 + 5);
  }
  return bytes;
}

std::vector<uint8_t> piece_bytes(uint32_t piece)
{
  auto all = content();
  auto begin = static_cast<uint64_t>(piece) * PIECE;
  auto end = std::min<uint64_t>(begin + PIECE, TOTAL);
  return {all.begin() + static_cast<std::ptrdiff_t>(begin),
          all.begin() + static_cast<std::ptrdiff_t>(end)};
}

// 50000 bytes over two files: four pieces, the last one 848 bytes.
swr::TorrentFile make_torrent(uint8_t id = 1)
{
  swr::TorrentFile torrent;
  torrent.metadata.name = "album";
  torrent.info_hash.fill(id);
  torrent.files = {{"album/a.bin", FIRST_FILE}, {"album/b.bin", SECOND_FILE}};
  torrent.trackers = {"udp://127.0.0.1:6969"};
  torrent.piece_length = PIECE;
  torrent.total_length = TOTAL;

  for (uint32_t piece = 0; piece * uint64_t {PIECE} < TOTAL; piece++) {
    torrent.piece_hashes.push_back(swr::PieceManager::hash_bytes(piece_bytes(piece)));
  }

  return torrent;
}

std::vector<uint8_t> read_file(const std::filesystem::path& path)
{
  std::ifstream in {path, std::ios::binary};
  return {std::istreambuf_iterator<char> {in}, std::istreambuf_iterator<char> {}};
}

struct Fixture
{
  Fixture()
      : disk {io.get_executor(), swr::DiskPolicy {}, swr::IoCapabilities {}}
  {
    settings.checkpoint.directory = directory / "checkpoints";
    settings.admission.max_connections_per_transfer = 2;
    checkpoints = std::make_shared<swr::CheckpointStore>(settings.checkpoint);
  }

  std::shared_ptr<swr::Transfer> make_transfer(bool with_checkpoints = true)
  {
    return std::make_shared<swr::Transfer>(io.get_executor(),
                                           make_torrent(),
                                           directory / "downloads",
                                           disk,
                                           with_checkpoints ? checkpoints : nullptr,
                                           settings,
                                           swr::PeerId {},
                                           "album.torrent");
  }

  bool deliver(swr::Transfer& transfer, uint32_t piece)
  {
    return swr::test::run(io,
                          [&]() -> awaitable<bool>
                          { co_return co_await transfer.on_block(piece, 0, piece_bytes(piece), 1); });
  }

  swr::test::TempDirectory directory;
  boost::asio::io_context io;
  swr::DiskIOEngine disk;
  swr::Settings settings;
  std::shared_ptr<swr::CheckpointStore> checkpoints;
};
}  // namespace

TEST_CASE("A transfer completes once every piece is verified", "[transfer]")
{
  Fixture fixture;
  auto transfer = fixture.make_transfer();

  swr::test::run(fixture.io, transfer->start());
  REQUIRE(transfer->bytes_left() == TOTAL);

  for (uint32_t piece = 0; piece < 4; piece++) {
    REQUIRE(fixture.deliver(*transfer, piece));
  }

  REQUIRE(transfer->pieces().is_complete());
  REQUIRE(transfer->bytes_left() == 0);

  auto stats = transfer->stats();
  REQUIRE(stats.verified_pieces == 4);
  REQUIRE(stats.bytes_received == TOTAL);
  REQUIRE(stats.hash_failures == 0);

  auto all = content();
  auto downloads = fixture.directory / "downloads/album";
  REQUIRE(read_file(downloads / "a.bin")
          == std::vector<uint8_t>(all.begin(), all.begin() + FIRST_FILE));
  REQUIRE(read_file(downloads / "b.bin")
          == std::vector<uint8_t>(all.begin() + FIRST_FILE, all.end()));

  // a finished transfer keeps no checkpoint
  REQUIRE(fixture.checkpoints->list().empty());
}

TEST_CASE("Verified pieces can be read back for upload", "[transfer]")
{
  Fixture fixture;
  auto transfer = fixture.make_transfer();

  swr::test::run(fixture.io, transfer->start());
  REQUIRE(fixture.deliver(*transfer, 1));

  auto block = swr::test::run(
      fixture.io,
      [&]() -> awaitable<std::expected<std::vector<uint8_t>, swr::DiskError>>
      { co_return co_await transfer->read_block(1, 100, 200); });

  REQUIRE(block);
  auto expected = piece_bytes(1);
  REQUIRE(*block == std::vector<uint8_t>(expected.begin() + 100, expected.begin() + 300));

  auto missing = swr::test::run(
      fixture.io,
      [&]() -> awaitable<std::expected<std::vector<uint8_t>, swr::DiskError>>
      { co_return co_await transfer->read_block(2, 0, 100); });

  REQUIRE_FALSE(missing);
}

TEST_CASE("A corrupt piece is discarded and counted", "[transfer]")
{
  Fixture fixture;
  auto transfer = fixture.make_transfer();

  swr::test::run(fixture.io, transfer->start());

  auto corrupt = piece_bytes(0);
  corrupt[10] ^= 0xff;

  swr::test::run(fixture.io,
                 [&]() -> awaitable<bool>
                 { co_return co_await transfer->on_block(0, 0, corrupt, 1); });

  REQUIRE(transfer->pieces().state(0) == swr::PieceState::Missing);
  REQUIRE(transfer->stats().hash_failures == 1);

  REQUIRE(fixture.deliver(*transfer, 0));
  REQUIRE(transfer->pieces().state(0) == swr::PieceState::Verified);
}

TEST_CASE("A piece that cannot be read back is fetched again", "[transfer]")
{
  Fixture fixture;
  fixture.settings.piece.block_size = PIECE / 2;
  auto transfer = fixture.make_transfer();

  swr::test::run(fixture.io, transfer->start());

  // piece 1 starts in a.bin at 16384 and continues in b.bin
  auto bytes = piece_bytes(1);
  std::vector<uint8_t> head(bytes.begin(), bytes.begin() + PIECE / 2);
  std::vector<uint8_t> tail(bytes.begin() + PIECE / 2, bytes.end());

  auto deliver_half = [&](uint32_t offset, const std::vector<uint8_t>& data)
  {
    return swr::test::run(fixture.io,
                          [&]() -> awaitable<bool>
                          { co_return co_await transfer->on_block(1, offset, data, 1); });
  };

  REQUIRE(deliver_half(0, head));

  // the head of the piece vanishes before the read-back
  std::filesystem::resize_file(fixture.directory / "downloads/album/a.bin", 0);

  deliver_half(PIECE / 2, tail);

  REQUIRE(transfer->pieces().state(1) == swr::PieceState::Missing);
  REQUIRE(transfer->stats().hash_failures == 0);
  REQUIRE(transfer->stats().read_failures == 1);

  REQUIRE(deliver_half(0, head));
  REQUIRE(deliver_half(PIECE / 2, tail));
  REQUIRE(transfer->pieces().state(1) == swr::PieceState::Verified);
}

TEST_CASE("An interrupted transfer resumes from its checkpoint", "[transfer]")
{
  Fixture fixture;

  {
    auto transfer = fixture.make_transfer();
    swr::test::run(fixture.io, transfer->start());

    REQUIRE(fixture.deliver(*transfer, 0));
    REQUIRE(fixture.deliver(*transfer, 2));

    // the first verified piece is checkpointed right away
    REQUIRE(fixture.checkpoints->load(transfer->info_hash()));

    swr::test::run(fixture.io, transfer->save_checkpoint());
    transfer->stop();
  }

  auto checkpoint = fixture.checkpoints->load(make_torrent().info_hash);
  REQUIRE(checkpoint);
  REQUIRE(checkpoint->bitfield.count() == 2);
  REQUIRE(checkpoint->metadata.source == "album.torrent");
  REQUIRE(checkpoint->metadata.display_name == "album");

  auto resumed = fixture.make_transfer();
  swr::test::run(fixture.io, resumed->start());

  REQUIRE(resumed->pieces().verified_count() == 2);
  REQUIRE(resumed->pieces().state(0) == swr::PieceState::Verified);
  REQUIRE(resumed->pieces().state(2) == swr::PieceState::Verified);
  REQUIRE(resumed->bytes_left() == TOTAL - 2 * PIECE);
}

TEST_CASE("Data already on disk is rechecked without a checkpoint", "[transfer]")
{
  Fixture fixture;

  auto downloads = fixture.directory / "downloads/album";
  std::filesystem::create_directories(downloads);

  auto all = content();
  {
    std::ofstream first {downloads / "a.bin", std::ios::binary};
    first.write(reinterpret_cast<const char*>(all.data()), FIRST_FILE);

    std::vector<char> zeros(SECOND_FILE, 0);
    std::ofstream second {downloads / "b.bin", std::ios::binary};
    second.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
  }

  auto transfer = fixture.make_transfer(false);
  swr::test::run(fixture.io, transfer->start());

  // only piece 0 lies entirely in the intact first file
  REQUIRE(transfer->pieces().verified_count() == 1);
  REQUIRE(transfer->pieces().state(0) == swr::PieceState::Verified);
}

TEST_CASE("A destination that cannot be created halts the transfer", "[transfer]")
{
  Fixture fixture;

  {
    std::ofstream blocker {fixture.directory / "downloads"};
    blocker << "not a directory";
  }

  auto transfer = fixture.make_transfer();
  swr::test::run(fixture.io, transfer->start());

  REQUIRE(transfer->halted());
  REQUIRE(transfer->stats().halted);
  REQUIRE_FALSE(fixture.deliver(*transfer, 0));
}

TEST_CASE("Connection slots are bounded per transfer", "[transfer]")
{
  Fixture fixture;
  auto transfer = fixture.make_transfer();

  REQUIRE(transfer->try_reserve_connection());
  REQUIRE(transfer->try_reserve_connection());
  REQUIRE_FALSE(transfer->try_reserve_connection());
  REQUIRE(transfer->connection_count() == 2);

  transfer->release_connection();
  REQUIRE(transfer->try_reserve_connection());

  transfer->release_connection();
  transfer->release_connection();
  transfer->release_connection();
  REQUIRE(transfer->connection_count() == 0);
}

TEST_CASE("The registry holds one transfer per info hash", "[transfer]")
{
  Fixture fixture;
  swr::TransferRegistry registry;

  auto transfer = fixture.make_transfer();
  REQUIRE(registry.add(transfer));
  REQUIRE_FALSE(registry.add(fixture.make_transfer()));
  REQUIRE(registry.size() == 1);

  REQUIRE(registry.find(transfer->info_hash()) == transfer);
  REQUIRE(registry.find_target(transfer->info_hash()) != nullptr);

  swr::InfoHash unknown {};
  REQUIRE(registry.find_target(unknown) == nullptr);

  REQUIRE(registry.remove(transfer->info_hash()) == transfer);
  REQUIRE(registry.snapshot().empty());
}
