#pragma once

#include <memory>

#include <utility>
#include <boost/asio.hpp>

namespace swr
{
/// Closes an I/O object that is still busy when the deadline passes, which
/// makes its pending operation complete with operation_aborted. Disarmed on
/// destruction.
template<typename Closable>
class Deadline
{
  std::shared_ptr<boost::asio::steady_timer> m_timer;
  std::shared_ptr<bool> m_armed;
  std::shared_ptr<bool> m_expired;

public:
  Deadline(Closable& object, boost::asio::steady_timer::duration after)
      : m_timer {std::make_shared<boost::asio::steady_timer>(object.get_executor(), after)}
      , m_armed {std::make_shared<bool>(true)}
      , m_expired {std::make_shared<bool>(false)}
  {
    m_timer->async_wait(
        [&object, armed = m_armed, expired = m_expired](
            const boost::system::error_code& ec)
        {
          if (!ec && *armed) {
            *expired = true;
            boost::system::error_code ignored;
            object.close(ignored);
          }
        });
  }

  Deadline(const Deadline&) = delete;
  Deadline& operator=(const Deadline&) = delete;

  ~Deadline()
  {
    *m_armed = false;
    m_timer->cancel();
  }

  bool expired() const { return *m_expired; }
};
}  // namespace swr
