#pragma once

#include <deque>
#include <memory>
#include <utility>

#include <boost/asio.hpp>

namespace swr
{
/// Coroutine-level mutual exclusion for one file. Must only be used from the
/// scheduler strand; waiters are resumed in FIFO order.
class FileGate
{
  bool m_busy = false;
  std::deque<std::shared_ptr<boost::asio::steady_timer>> m_waiters;

public:
  class Hold
  {
    FileGate* m_gate;

  public:
    explicit Hold(FileGate& gate)
        : m_gate {&gate}
    {
    }

    Hold(Hold&& other) noexcept
        : m_gate {std::exchange(other.m_gate, nullptr)}
    {
    }

    Hold(const Hold&) = delete;
    Hold& operator=(const Hold&) = delete;
    Hold& operator=(Hold&&) = delete;

    ~Hold()
    {
      if (m_gate != nullptr) {
        m_gate->release();
      }
    }
  };

  boost::asio::awaitable<Hold> acquire()
  {
    if (!m_busy) {
      m_busy = true;
      co_return Hold {*this};
    }

    auto waiter = std::make_shared<boost::asio::steady_timer>(
        co_await boost::asio::this_coro::executor,
        boost::asio::steady_timer::time_point::max());
    m_waiters.push_back(waiter);

    // release() hands the gate over by cancelling the timer
    boost::system::error_code ec;
    co_await waiter->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    co_return Hold {*this};
  }

  bool busy() const { return m_busy; }

  size_t waiting() const { return m_waiters.size(); }

private:
  void release()
  {
    if (m_waiters.empty()) {
      m_busy = false;
      return;
    }

    auto next = std::move(m_waiters.front());
    m_waiters.pop_front();
    next->cancel();
  }
};
}  // namespace swr
