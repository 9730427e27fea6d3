#pragma once

#include <type_traits>
#include <utility>

#include <boost/asio.hpp>

namespace swr
{
/// Runs a blocking callable on the worker pool and resumes the awaiting
/// coroutine on its own executor with the result. Exceptions thrown by the
/// callable are rethrown at the co_await.
template<typename Function>
auto offload(boost::asio::thread_pool& pool, Function function)
    -> boost::asio::awaitable<std::invoke_result_t<Function&>>
{
  using Result = std::invoke_result_t<Function&>;

  co_return co_await boost::asio::co_spawn(
      pool,
      [function = std::move(function)]() mutable
          -> boost::asio::awaitable<Result> { co_return function(); },
      boost::asio::use_awaitable);
}
}  // namespace swr
