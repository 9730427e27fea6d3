#include <catch2/catch_test_macros.hpp>

#include <map>
#include <mutex>

#include "client/admission/incoming_admission.hpp"
#include "test_support.hpp"

using boost::asio::ip::tcp;

namespace
{
struct FakeTransfer : swr::AdmissionTarget
{
  explicit FakeTransfer(size_t p_limit)
      : limit {p_limit}
  {
  }

  bool try_reserve_connection() override
  {
    std::lock_guard guard {lock};
    if (connections >= limit) {
      return false;
    }
    connections++;
    return true;
  }

  void release_connection() override
  {
    std::lock_guard guard {lock};
    connections--;
  }

  void accept_incoming(tcp::socket socket,
                       const swr::Handshake&,
                       tcp::endpoint) override
  {
    accepted.push_back(std::move(socket));
  }

  std::mutex lock;
  size_t limit;
  size_t connections = 0;
  std::vector<tcp::socket> accepted;
};

struct FakeDirectory : swr::TransferDirectory
{
  std::shared_ptr<swr::AdmissionTarget> find_target(const swr::InfoHash& info_hash) override
  {
    auto it = transfers.find(info_hash);
    return it == transfers.end() ? nullptr : it->second;
  }

  std::map<swr::InfoHash, std::shared_ptr<FakeTransfer>> transfers;
};

// Accepted side of a loopback connection; the client side is kept open in
// clients so the accepted socket stays connected.
struct Loopback
{
  explicit Loopback(boost::asio::io_context& p_io)
      : io {p_io}
      , acceptor {io, tcp::endpoint {boost::asio::ip::address_v4::loopback(), 0}}
  {
  }

  tcp::socket accept_one()
  {
    clients.emplace_back(io);
    clients.back().connect(acceptor.local_endpoint());
    return acceptor.accept();
  }

  boost::asio::io_context& io;
  tcp::acceptor acceptor;
  std::vector<tcp::socket> clients;
};

swr::InfoHash hash_of(uint8_t seed)
{
  swr::InfoHash hash {};
  hash.fill(seed);
  return hash;
}

swr::Handshake handshake_for(const swr::InfoHash& info_hash)
{
  return swr::Handshake {info_hash, swr::PeerId {}};
}

tcp::endpoint somewhere()
{
  return tcp::endpoint {boost::asio::ip::make_address_v4("10.0.0.1"), 6881};
}
}  // namespace

TEST_CASE("Connections are handed over while the transfer has room", "[admission]")
{
  boost::asio::io_context io;
  Loopback loopback {io};

  auto directory = std::make_shared<FakeDirectory>();
  auto transfer = std::make_shared<FakeTransfer>(2);
  directory->transfers[hash_of(1)] = transfer;

  swr::IncomingPeerAdmission admission {
      io.get_executor(), swr::AdmissionPolicy {}, [directory] { return directory; }};

  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(1)), somewhere())
          == swr::SlotState::Active);
  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(1)), somewhere())
          == swr::SlotState::Active);

  REQUIRE(transfer->accepted.size() == 2);
  REQUIRE(transfer->connections == 2);
  REQUIRE(transfer->accepted.front().is_open());
  REQUIRE(admission.stats().admitted == 2);
}

TEST_CASE("A transfer at its limit rejects without handoff", "[admission]")
{
  boost::asio::io_context io;
  Loopback loopback {io};

  auto directory = std::make_shared<FakeDirectory>();
  auto transfer = std::make_shared<FakeTransfer>(1);
  directory->transfers[hash_of(1)] = transfer;

  swr::IncomingPeerAdmission admission {
      io.get_executor(), swr::AdmissionPolicy {}, [directory] { return directory; }};

  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(1)), somewhere())
          == swr::SlotState::Active);
  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(1)), somewhere())
          == swr::SlotState::Rejected);

  REQUIRE(transfer->accepted.size() == 1);
  REQUIRE(transfer->connections == 1);
  REQUIRE(admission.stats().rejected == 1);
}

TEST_CASE("Unknown transfers and bad handshakes are rejected", "[admission]")
{
  boost::asio::io_context io;
  Loopback loopback {io};

  auto directory = std::make_shared<FakeDirectory>();
  swr::IncomingPeerAdmission admission {
      io.get_executor(), swr::AdmissionPolicy {}, [directory] { return directory; }};

  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(9)), somewhere())
          == swr::SlotState::Rejected);

  swr::Handshake broken = handshake_for(hash_of(9));
  broken.plen = 4;
  REQUIRE(admission.on_incoming(loopback.accept_one(), broken, somewhere())
          == swr::SlotState::Rejected);

  REQUIRE(admission.stats().rejected == 2);
  REQUIRE(admission.waiting() == 0);
}

TEST_CASE("Connections wait for the registry and are admitted once it exists", "[admission]")
{
  boost::asio::io_context io;
  Loopback loopback {io};

  std::shared_ptr<FakeDirectory> published;
  auto transfer = std::make_shared<FakeTransfer>(5);

  swr::IncomingPeerAdmission admission {
      io.get_executor(),
      swr::AdmissionPolicy {.grace_period = std::chrono::seconds {5},
                            .poll_interval = std::chrono::milliseconds {10}},
      [&published]() -> std::shared_ptr<swr::TransferDirectory> { return published; }};

  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(2)), somewhere())
          == swr::SlotState::Queued);
  REQUIRE(admission.waiting() == 1);

  swr::test::run(io,
                 [&]() -> boost::asio::awaitable<void>
                 {
                   boost::asio::co_spawn(io, admission.run(), boost::asio::detached);

                   boost::asio::steady_timer timer {io, std::chrono::milliseconds {30}};
                   co_await timer.async_wait(boost::asio::use_awaitable);

                   REQUIRE(admission.waiting() == 1);

                   auto directory = std::make_shared<FakeDirectory>();
                   directory->transfers[hash_of(2)] = transfer;
                   published = directory;

                   timer.expires_after(std::chrono::milliseconds {50});
                   co_await timer.async_wait(boost::asio::use_awaitable);

                   admission.shutdown();
                 });

  REQUIRE(admission.waiting() == 0);
  REQUIRE(transfer->accepted.size() == 1);
  REQUIRE(admission.stats().admitted == 1);
  REQUIRE(admission.stats().queued == 1);
}

TEST_CASE("Queued connections time out after the grace period", "[admission]")
{
  boost::asio::io_context io;
  Loopback loopback {io};

  swr::IncomingPeerAdmission admission {
      io.get_executor(),
      swr::AdmissionPolicy {.grace_period = std::chrono::milliseconds {20},
                            .poll_interval = std::chrono::milliseconds {5}},
      [] { return std::shared_ptr<swr::TransferDirectory> {}; }};

  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(3)), somewhere())
          == swr::SlotState::Queued);

  swr::test::run(io,
                 [&]() -> boost::asio::awaitable<void>
                 {
                   boost::asio::co_spawn(io, admission.run(), boost::asio::detached);

                   boost::asio::steady_timer timer {io, std::chrono::milliseconds {100}};
                   co_await timer.async_wait(boost::asio::use_awaitable);

                   admission.shutdown();
                 });

  REQUIRE(admission.stats().timed_out == 1);
  REQUIRE(admission.waiting() == 0);
}

TEST_CASE("A full queue closes new connections", "[admission]")
{
  boost::asio::io_context io;
  Loopback loopback {io};

  swr::IncomingPeerAdmission admission {
      io.get_executor(),
      swr::AdmissionPolicy {.queue_capacity = 2},
      [] { return std::shared_ptr<swr::TransferDirectory> {}; }};

  for (int i = 0; i < 2; i++) {
    REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(4)), somewhere())
            == swr::SlotState::Queued);
  }

  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(4)), somewhere())
          == swr::SlotState::Rejected);

  REQUIRE(admission.stats().overflowed == 1);
  REQUIRE(admission.waiting() == 2);

  admission.shutdown();
  REQUIRE(admission.waiting() == 0);
}

TEST_CASE("Connections after shutdown are rejected", "[admission]")
{
  boost::asio::io_context io;
  Loopback loopback {io};

  auto directory = std::make_shared<FakeDirectory>();
  directory->transfers[hash_of(5)] = std::make_shared<FakeTransfer>(10);

  swr::IncomingPeerAdmission admission {
      io.get_executor(), swr::AdmissionPolicy {}, [directory] { return directory; }};

  admission.shutdown();

  REQUIRE(admission.on_incoming(loopback.accept_one(), handshake_for(hash_of(5)), somewhere())
          == swr::SlotState::Rejected);
}
