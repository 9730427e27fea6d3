#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

#include "client/supervisor/task_supervisor.hpp"
#include "test_support.hpp"

using boost::asio::awaitable;
using namespace std::chrono_literals;

namespace
{
awaitable<void> pause(boost::asio::io_context& io, std::chrono::milliseconds duration)
{
  boost::asio::steady_timer timer {io, duration};
  co_await timer.async_wait(boost::asio::use_awaitable);
}
}  // namespace

TEST_CASE("A failing iteration does not end a periodic routine", "[supervisor]")
{
  boost::asio::io_context io;
  swr::BackgroundTaskSupervisor supervisor {io.get_executor()};

  int calls = 0;
  supervisor.run_periodic("flaky",
                          5ms,
                          [&calls]() -> awaitable<void>
                          {
                            calls++;
                            if (calls == 1) {
                              throw std::runtime_error("first call fails");
                            }
                            co_return;
                          });

  auto report = swr::test::run(io,
                               [&]() -> awaitable<swr::ShutdownReport>
                               {
                                 co_await pause(io, 60ms);
                                 REQUIRE(supervisor.running() == 1);
                                 REQUIRE(supervisor.failures() == 1);
                                 co_return co_await supervisor.shutdown(1s);
                               });

  REQUIRE(calls >= 2);
  REQUIRE(report.finished == 1);
  REQUIRE(report.abandoned.empty());
}

TEST_CASE("A routine that throws ends alone", "[supervisor]")
{
  boost::asio::io_context io;
  swr::BackgroundTaskSupervisor supervisor {io.get_executor()};

  supervisor.spawn("broken",
                   [](swr::TaskContext&) -> awaitable<void>
                   {
                     throw std::runtime_error("broken routine");
                     co_return;
                   });

  supervisor.spawn("healthy",
                   [](swr::TaskContext& context) -> awaitable<void>
                   {
                     while (co_await context.sleep(1h)) {
                     }
                   });

  auto report = swr::test::run(io,
                               [&]() -> awaitable<swr::ShutdownReport>
                               {
                                 co_await pause(io, 20ms);
                                 REQUIRE(supervisor.running_names()
                                         == std::vector<std::string> {"healthy"});
                                 REQUIRE(supervisor.failures() == 1);
                                 co_return co_await supervisor.shutdown(1s);
                               });

  REQUIRE(report.finished == 2);
  REQUIRE(report.abandoned.empty());
}

TEST_CASE("Exceptions of any type are contained", "[supervisor]")
{
  boost::asio::io_context io;
  swr::BackgroundTaskSupervisor supervisor {io.get_executor()};

  supervisor.spawn("throws an int",
                   [](swr::TaskContext&) -> awaitable<void>
                   {
                     throw 42;
                     co_return;
                   });

  int calls = 0;
  supervisor.run_periodic("throws a string",
                          5ms,
                          [&calls]() -> awaitable<void>
                          {
                            calls++;
                            if (calls == 1) {
                              throw std::string("not an exception class");
                            }
                            co_return;
                          });

  auto report = swr::test::run(io,
                               [&]() -> awaitable<swr::ShutdownReport>
                               {
                                 co_await pause(io, 60ms);
                                 REQUIRE(supervisor.running_names()
                                         == std::vector<std::string> {"throws a string"});
                                 REQUIRE(supervisor.failures() == 2);
                                 co_return co_await supervisor.shutdown(1s);
                               });

  REQUIRE(calls >= 2);
  REQUIRE(report.finished == 2);
  REQUIRE(report.abandoned.empty());
}

TEST_CASE("Shutdown abandons routines that ignore the stop request", "[supervisor]")
{
  boost::asio::io_context io;
  swr::BackgroundTaskSupervisor supervisor {io.get_executor()};

  auto stubborn = std::make_shared<boost::asio::steady_timer>(io, 10min);

  supervisor.spawn("stubborn",
                   [stubborn](swr::TaskContext&) -> awaitable<void>
                   {
                     boost::system::error_code ec;
                     co_await stubborn->async_wait(
                         boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                   });

  supervisor.spawn("polite",
                   [](swr::TaskContext& context) -> awaitable<void>
                   { co_await context.sleep(1h); });

  auto report = swr::test::run(io,
                               [&]() -> awaitable<swr::ShutdownReport>
                               {
                                 co_await pause(io, 5ms);
                                 auto result = co_await supervisor.shutdown(30ms);

                                 // let the abandoned routine finish so io.run returns
                                 stubborn->cancel();
                                 co_return result;
                               });

  REQUIRE(report.finished == 1);
  REQUIRE(report.abandoned == std::vector<std::string> {"stubborn"});
}

TEST_CASE("Sleep reports shutdown", "[supervisor]")
{
  boost::asio::io_context io;
  swr::TaskContext context {io.get_executor(), "sleeper"};

  auto completed = swr::test::run(io,
                                  [&]() -> awaitable<bool>
                                  {
                                    bool woke = co_await context.sleep(1ms);
                                    REQUIRE(woke);

                                    boost::asio::co_spawn(
                                        io,
                                        [&]() -> awaitable<void>
                                        {
                                          co_await pause(io, 5ms);
                                          context.request_stop();
                                        },
                                        boost::asio::detached);

                                    co_return co_await context.sleep(1h);
                                  });

  REQUIRE_FALSE(completed);
  REQUIRE(context.stopping());
}

TEST_CASE("Nothing is started during shutdown", "[supervisor]")
{
  boost::asio::io_context io;
  swr::BackgroundTaskSupervisor supervisor {io.get_executor()};

  swr::test::run(io, supervisor.shutdown(10ms));

  supervisor.spawn("late", [](swr::TaskContext&) -> awaitable<void> { co_return; });
  REQUIRE(supervisor.running() == 0);
}
