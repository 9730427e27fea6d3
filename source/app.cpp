#include <csignal>
#include <fstream>
#include <optional>
#include <sstream>

#include "app.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <boost/version.hpp>
#include <fmt/color.h>
#include <openssl/opensslv.h>

#include "auxiliary/deadline.hpp"
#include "auxiliary/format_aux.hpp"
#include "auxiliary/log.hpp"
#include "checkpoint/checkpoint_store.hpp"
#include "client/admission/incoming_admission.hpp"
#include "client/supervisor/maintenance.hpp"
#include "client/supervisor/task_supervisor.hpp"
#include "client/tracker/tracker_server.hpp"
#include "client/transfer.hpp"
#include "client/transfer_registry.hpp"
#include "client/transmit/transmit.hpp"
#include "discovery/seen_messages.hpp"
#include "discovery/tracker_discovery.hpp"
#include "storage/disk_io_engine.hpp"
#include "torrent/metadata/torrentfile.hpp"

using boost::asio::awaitable;
using boost::asio::ip::tcp;
using boost::asio::ip::udp;

namespace
{
constexpr std::string_view COMPONENT = "app";

// Failures of top-level coroutines end io_context::run with the exception.
void rethrow(std::exception_ptr error)
{
  if (error) {
    std::rethrow_exception(error);
  }
}

std::optional<std::string> read_file(const std::filesystem::path& path)
{
  auto file = std::ifstream {path, std::ios::binary};

  if (!file) {
    return std::nullopt;
  }

  std::stringstream file_contents {};
  file_contents << file.rdbuf();
  return file_contents.str();
}

awaitable<void> admit(tcp::socket socket,
                      swr::IncomingPeerAdmission& admission,
                      std::chrono::seconds handshake_timeout)
{
  boost::system::error_code ec;
  auto address = socket.remote_endpoint(ec);

  if (ec) {
    co_return;
  }

  std::optional<swr::Handshake> handshake;

  try {
    swr::Deadline deadline {socket, handshake_timeout};
    handshake = co_await swr::read_handshake(socket);
  } catch (const boost::system::system_error& e) {
    swr::log::debug(COMPONENT, "{} sent no handshake: {}", address, e.code().message());
    co_return;
  }

  auto state = admission.on_incoming(std::move(socket), *handshake, address);
  swr::log::debug(COMPONENT, "incoming {} {}", address, swr::to_string(state));
}

awaitable<void> accept_loop(tcp::acceptor& acceptor,
                            swr::IncomingPeerAdmission& admission,
                            std::chrono::seconds handshake_timeout)
{
  while (acceptor.is_open()) {
    boost::system::error_code ec;
    auto socket = co_await acceptor.async_accept(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (ec) {
      if (ec == boost::asio::error::operation_aborted || !acceptor.is_open()) {
        break;
      }

      swr::log::debug(COMPONENT, "accept failed: {}", ec.message());
      continue;
    }

    boost::asio::co_spawn(acceptor.get_executor(),
                          admit(std::move(socket), admission, handshake_timeout),
                          boost::asio::detached);
  }
}

bool open_listener(tcp::acceptor& acceptor, uint16_t port)
{
  try {
    tcp::endpoint endpoint {tcp::v4(), port};
    acceptor.open(endpoint.protocol());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen();
  } catch (const boost::system::system_error& e) {
    swr::log::warn(COMPONENT, "cannot listen on port {}: {}", port, e.code().message());
    boost::system::error_code ignored;
    acceptor.close(ignored);
    return false;
  }

  swr::log::info(COMPONENT, "accepting peers on {}", acceptor.local_endpoint());
  return true;
}
}  // namespace

App::App(swr::Settings settings)
    : m_settings {std::move(settings)}
{
  fmt::print(fg(fmt::color::aqua) | fmt::emphasis::bold | fmt::emphasis::italic,
             "Welcome to swarmer!\n");

  fmt::print(fg(fmt::color::antique_white) | fmt::emphasis::bold
                 | fmt::emphasis::italic,
             "Built with:\n");
  fmt::print(fg(fmt::color::orange) | fmt::emphasis::italic,
             " *Boost Version: {}\n",
             BOOST_LIB_VERSION);

  fmt::print(fg(fmt::color::rebecca_purple) | fmt::emphasis::italic,
             " *FMT Version: {}\n",
             FMT_VERSION);

  fmt::print(fg(fmt::color::medium_violet_red) | fmt::emphasis::italic,
             " *OPENSSL Version: {}\n",
             OPENSSL_VERSION_STR);
}

int App::run(const std::filesystem::path& torrent_file_path,
             const std::filesystem::path& download_path)
{
  auto encoded = read_file(torrent_file_path);

  if (!encoded) {
    swr::log::error(COMPONENT, "cannot read {}", torrent_file_path.string());
    return 1;
  }

  auto torrent = swr::load_torrent_file(std::string_view{*encoded});

  if (!torrent) {
    swr::log::error(COMPONENT,
                    "cannot load {}: {}",
                    torrent_file_path.string(),
                    swr::to_string(torrent.error()));
    return 1;
  }

  boost::asio::io_context io;
  auto executor = io.get_executor();

  swr::DiskIOEngine disk {executor, m_settings.disk};

  std::shared_ptr<swr::CheckpointStore> checkpoints;
  if (m_settings.checkpoint.enabled) {
    checkpoints = std::make_shared<swr::CheckpointStore>(m_settings.checkpoint);
  }

  swr::PeerId local_id;
  swr::SeenMessageArena seen {m_settings.supervisor.dedup_expiry};

  // published to admission once the transfer has started
  auto registry = std::make_shared<swr::TransferRegistry>();
  std::shared_ptr<swr::TransferDirectory> published;

  swr::IncomingPeerAdmission admission {
      executor, m_settings.admission, [&published] { return published; }};

  auto transfer = std::make_shared<swr::Transfer>(executor,
                                                  *torrent,
                                                  download_path,
                                                  disk,
                                                  checkpoints,
                                                  m_settings,
                                                  local_id,
                                                  torrent_file_path.string());

  auto discovery = std::make_shared<swr::TrackerDiscovery>(
      executor,
      local_id,
      m_settings.tracker,
      seen,
      [registry](const swr::InfoHash& id) -> uint64_t
      {
        auto found = registry->find(id);
        return found ? found->bytes_left() : 0;
      });

  discovery->add_trackers(transfer->info_hash(), torrent->trackers);
  discovery->on_peer(
      [registry](const swr::InfoHash& id, const boost::asio::ip::address& ip, uint16_t port)
      {
        if (auto found = registry->find(id)) {
          found->connect_to(tcp::endpoint {ip, port});
        }
      });

  tcp::acceptor acceptor {executor};
  if (open_listener(acceptor, m_settings.tracker.listen_port)) {
    boost::asio::co_spawn(executor,
                          accept_loop(acceptor, admission, m_settings.peer.handshake_timeout),
                          rethrow);
  }

  swr::TrackerServer tracker_server;
  udp::socket tracker_socket {executor};

  if (m_settings.tracker.serve_port != 0) {
    try {
      udp::endpoint endpoint {udp::v4(), m_settings.tracker.serve_port};
      tracker_socket.open(endpoint.protocol());
      tracker_socket.bind(endpoint);
      boost::asio::co_spawn(executor, tracker_server.serve(tracker_socket), rethrow);
    } catch (const boost::system::system_error& e) {
      swr::log::warn(COMPONENT, "built-in tracker disabled: {}", e.code().message());
    }
  }

  swr::BackgroundTaskSupervisor supervisor {executor};
  swr::install_maintenance(supervisor,
                           m_settings,
                           swr::MaintenanceTargets {
                               .registry = registry,
                               .disk = &disk,
                               .admission = &admission,
                               .checkpoints = checkpoints,
                               .seen = &seen,
                               .discovery = discovery,
                           });

  boost::asio::co_spawn(executor, admission.run(), rethrow);

  bool stopping = false;

  auto shutdown = [&]() -> awaitable<void>
  {
    if (stopping) {
      co_return;
    }
    stopping = true;

    swr::log::info(COMPONENT, "shutting down");

    admission.shutdown();

    boost::system::error_code ignored;
    acceptor.close(ignored);
    tracker_socket.close(ignored);

    for (auto& running : registry->snapshot()) {
      co_await running->save_checkpoint(true);
      running->stop();
    }
    transfer->stop();

    co_await supervisor.shutdown(m_settings.supervisor.shutdown_timeout);

    if (auto flushed = co_await disk.flush(); !flushed) {
      swr::log::warn(COMPONENT, "final flush failed: {}", swr::to_string(flushed.error()));
    }

    io.stop();
  };

  boost::asio::co_spawn(
      executor,
      [&]() -> awaitable<void>
      {
        co_await transfer->start();

        if (transfer->halted()) {
          co_await shutdown();
          co_return;
        }

        registry->add(transfer);
        published = registry;

        discovery->announce(transfer->info_hash());
      },
      rethrow);

  boost::asio::signal_set signals {io, SIGINT, SIGTERM};
  signals.async_wait(
      [&](const boost::system::error_code& ec, int)
      {
        if (!ec) {
          boost::asio::co_spawn(executor, shutdown(), rethrow);
        }
      });

  try {
    io.run();
  } catch (const std::exception& e) {
    swr::log::error(COMPONENT, "fatal: {}", e.what());
    return 1;
  }

  return transfer->halted() ? 1 : 0;
}
