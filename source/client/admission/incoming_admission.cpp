#include <utility>

#include "client/admission/incoming_admission.hpp"

#include "auxiliary/format_aux.hpp"
#include "auxiliary/log.hpp"

using boost::asio::ip::tcp;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "admission";
}

std::string_view to_string(SlotState state)
{
  switch (state) {
    case SlotState::Queued:
      return "queued";
    case SlotState::Rejected:
      return "rejected";
    case SlotState::Active:
      return "active";
  }

  return "unknown";
}

IncomingPeerAdmission::IncomingPeerAdmission(boost::asio::any_io_executor executor,
                                             AdmissionPolicy policy,
                                             DirectoryAccessor directory)
    : m_executor {std::move(executor)}
    , m_policy {policy}
    , m_directory {std::move(directory)}
    , m_wakeup {m_executor}
{
}

void IncomingPeerAdmission::close_quietly(tcp::socket& socket)
{
  // the peer may have reset already; that is a normal closure
  boost::system::error_code ignored;
  socket.shutdown(tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
}

IncomingPeerAdmission::Resolution IncomingPeerAdmission::resolve(
    tcp::socket& socket, const Handshake& handshake, const tcp::endpoint& address)
{
  auto directory = m_directory ? m_directory() : nullptr;

  if (!directory) {
    return Resolution::Unavailable;
  }

  auto target = directory->find_target(handshake.info_hash());

  if (!target) {
    log::debug(COMPONENT,
               "{} asked for unknown transfer {}",
               address,
               to_hex(handshake.info_hash()));
    close_quietly(socket);
    m_stats.rejected++;
    return Resolution::Rejected;
  }

  if (!target->try_reserve_connection()) {
    log::debug(COMPONENT, "{} rejected, transfer at its connection limit", address);
    close_quietly(socket);
    m_stats.rejected++;
    return Resolution::Rejected;
  }

  target->accept_incoming(std::move(socket), handshake, address);
  m_stats.admitted++;

  return Resolution::Admitted;
}

SlotState IncomingPeerAdmission::on_incoming(tcp::socket socket,
                                             const Handshake& handshake,
                                             tcp::endpoint address)
{
  if (m_stopping || !handshake.is_valid()) {
    close_quietly(socket);
    m_stats.rejected++;
    return SlotState::Rejected;
  }

  switch (resolve(socket, handshake, address)) {
    case Resolution::Admitted:
      return SlotState::Active;
    case Resolution::Rejected:
      return SlotState::Rejected;
    case Resolution::Unavailable:
      break;
  }

  if (m_queue.size() >= m_policy.queue_capacity) {
    log::warn(COMPONENT, "incoming queue full, closing {}", address);
    close_quietly(socket);
    m_stats.overflowed++;
    return SlotState::Rejected;
  }

  m_queue.push_back(PendingConnection {
      .socket = std::move(socket),
      .handshake = handshake,
      .address = std::move(address),
      .deadline = std::chrono::steady_clock::now() + m_policy.grace_period});
  m_stats.queued++;

  log::debug(COMPONENT, "{} queued until transfers are registered", m_queue.back().address);

  m_wakeup.cancel();
  return SlotState::Queued;
}

void IncomingPeerAdmission::drain_queue()
{
  auto now = std::chrono::steady_clock::now();

  for (auto it = m_queue.begin(); it != m_queue.end();) {
    if (resolve(it->socket, it->handshake, it->address) != Resolution::Unavailable) {
      it = m_queue.erase(it);
      continue;
    }

    if (now >= it->deadline) {
      log::warn(COMPONENT,
                "no transfer registry after {} ms, closing {}",
                m_policy.grace_period.count(),
                it->address);
      close_quietly(it->socket);
      m_stats.timed_out++;
      it = m_queue.erase(it);
      continue;
    }

    ++it;
  }
}

boost::asio::awaitable<void> IncomingPeerAdmission::run()
{
  while (!m_stopping) {
    drain_queue();

    if (m_queue.empty()) {
      m_wakeup.expires_at(boost::asio::steady_timer::time_point::max());
    } else {
      m_wakeup.expires_after(m_policy.poll_interval);
    }

    boost::system::error_code ec;
    co_await m_wakeup.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  }
}

void IncomingPeerAdmission::shutdown()
{
  m_stopping = true;

  for (auto& pending : m_queue) {
    close_quietly(pending.socket);
  }

  if (!m_queue.empty()) {
    log::info(COMPONENT, "closed {} queued connections", m_queue.size());
  }

  m_queue.clear();
  m_wakeup.cancel();
}

AdmissionStats IncomingPeerAdmission::stats() const
{
  auto stats = m_stats;
  stats.waiting = m_queue.size();
  return stats;
}
}  // namespace swr
