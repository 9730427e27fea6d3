#include <algorithm>
#include <exception>
#include <utility>

#include "client/supervisor/task_supervisor.hpp"

#include "auxiliary/log.hpp"

using boost::asio::awaitable;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "supervisor";
}

TaskContext::TaskContext(boost::asio::any_io_executor executor, std::string name)
    : m_name {std::move(name)}
    , m_timer {std::move(executor)}
{
}

awaitable<bool> TaskContext::sleep(std::chrono::steady_clock::duration duration)
{
  if (m_stopping) {
    co_return false;
  }

  m_timer.expires_after(duration);

  boost::system::error_code ec;
  co_await m_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  co_return !m_stopping;
}

void TaskContext::request_stop()
{
  m_stopping = true;
  m_timer.cancel();
}

BackgroundTaskSupervisor::BackgroundTaskSupervisor(boost::asio::any_io_executor executor)
    : m_executor {executor}
    , m_state {std::make_shared<State>(std::move(executor))}
{
}

void BackgroundTaskSupervisor::spawn(std::string name, Routine routine)
{
  if (m_state->stopping) {
    log::warn(COMPONENT, "not starting {} during shutdown", name);
    return;
  }

  auto task = std::make_shared<Task>();
  task->context = std::make_shared<TaskContext>(m_executor, std::move(name));
  m_state->tasks.push_back(task);

  log::debug(COMPONENT, "started {}", task->context->name());

  boost::asio::co_spawn(
      m_executor,
      [context = task->context, routine = std::move(routine)]() -> awaitable<void>
      { co_await routine(*context); },
      [state = m_state, task](std::exception_ptr error)
      {
        task->done = true;

        if (error) {
          task->failed = true;

          try {
            std::rethrow_exception(error);
          } catch (const std::exception& e) {
            log::error(COMPONENT, "{} ended with an error: {}", task->context->name(), e.what());
          } catch (...) {
            log::error(COMPONENT, "{} ended with an unknown exception", task->context->name());
          }
        } else {
          log::debug(COMPONENT, "{} finished", task->context->name());
        }

        state->done_signal.cancel();
      });
}

void BackgroundTaskSupervisor::run_periodic(std::string name,
                                            std::chrono::steady_clock::duration interval,
                                            PeriodicBody body)
{
  spawn(std::move(name),
        [interval, body = std::move(body)](TaskContext& context) -> awaitable<void>
        {
          while (co_await context.sleep(interval)) {
            try {
              co_await body();
            } catch (const std::exception& e) {
              context.count_failure();
              log::error(COMPONENT, "{} iteration failed: {}", context.name(), e.what());
            } catch (...) {
              context.count_failure();
              log::error(COMPONENT, "{} iteration failed: unknown exception", context.name());
            }
          }
        });
}

awaitable<ShutdownReport> BackgroundTaskSupervisor::shutdown(
    std::chrono::steady_clock::duration timeout)
{
  auto state = m_state;
  state->stopping = true;

  for (auto& task : state->tasks) {
    task->context->request_stop();
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;

  auto all_done = [&state]
  { return std::ranges::all_of(state->tasks, [](const auto& task) { return task->done; }); };

  while (!all_done() && std::chrono::steady_clock::now() < deadline) {
    state->done_signal.expires_at(deadline);

    boost::system::error_code ec;
    co_await state->done_signal.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  }

  ShutdownReport report;

  for (auto& task : state->tasks) {
    if (task->done) {
      report.finished++;
    } else {
      log::warn(COMPONENT, "{} did not stop in time, abandoning it", task->context->name());
      report.abandoned.push_back(task->context->name());
    }
  }

  state->tasks.clear();

  log::info(COMPONENT,
            "shutdown: {} routines stopped, {} abandoned",
            report.finished,
            report.abandoned.size());

  co_return report;
}

size_t BackgroundTaskSupervisor::running() const
{
  return std::ranges::count_if(m_state->tasks, [](const auto& task) { return !task->done; });
}

std::vector<std::string> BackgroundTaskSupervisor::running_names() const
{
  std::vector<std::string> names;

  for (const auto& task : m_state->tasks) {
    if (!task->done) {
      names.push_back(task->context->name());
    }
  }

  return names;
}

uint64_t BackgroundTaskSupervisor::failures() const
{
  uint64_t total = 0;

  for (const auto& task : m_state->tasks) {
    total += task->context->failures() + (task->failed ? 1 : 0);
  }

  return total;
}
}  // namespace swr
