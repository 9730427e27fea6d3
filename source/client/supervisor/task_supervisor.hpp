#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio.hpp>

namespace swr
{
/// Handed to every supervised routine. Routines poll stopping() or sleep
/// through the context so shutdown can interrupt them.
class TaskContext
{
public:
  TaskContext(boost::asio::any_io_executor executor, std::string name);

  /// Waits for the given time. False when the wait was cut short by
  /// shutdown, in which case the routine should return.
  boost::asio::awaitable<bool> sleep(std::chrono::steady_clock::duration duration);

  bool stopping() const { return m_stopping; }

  const std::string& name() const { return m_name; }

  void request_stop();

  void count_failure() { m_failures++; }

  uint64_t failures() const { return m_failures; }

private:
  std::string m_name;
  boost::asio::steady_timer m_timer;
  bool m_stopping = false;
  uint64_t m_failures = 0;
};

struct ShutdownReport
{
  size_t finished = 0;
  std::vector<std::string> abandoned;
};

/// Owns long-running maintenance routines on the scheduler.
///
/// A routine that throws is logged and ends without taking other routines
/// down. run_periodic() wraps a body in a loop that survives exceptions of
/// single iterations. shutdown() asks every routine to stop, waits up to a
/// timeout and abandons the rest.
class BackgroundTaskSupervisor
{
public:
  using Routine = std::function<boost::asio::awaitable<void>(TaskContext&)>;
  using PeriodicBody = std::function<boost::asio::awaitable<void>()>;

  explicit BackgroundTaskSupervisor(boost::asio::any_io_executor executor);

  void spawn(std::string name, Routine routine);

  /// Runs body every interval, the first time after one interval.
  void run_periodic(std::string name,
                    std::chrono::steady_clock::duration interval,
                    PeriodicBody body);

  boost::asio::awaitable<ShutdownReport> shutdown(
      std::chrono::steady_clock::duration timeout);

  size_t running() const;

  std::vector<std::string> running_names() const;

  /// Iteration failures plus routines that ended with an exception.
  uint64_t failures() const;

private:
  struct Task
  {
    std::shared_ptr<TaskContext> context;
    bool done = false;
    bool failed = false;
  };

  struct State
  {
    explicit State(boost::asio::any_io_executor executor)
        : done_signal {std::move(executor)}
    {
    }

    std::vector<std::shared_ptr<Task>> tasks;
    boost::asio::steady_timer done_signal;
    bool stopping = false;
  };

  boost::asio::any_io_executor m_executor;
  std::shared_ptr<State> m_state;
};
}  // namespace swr
