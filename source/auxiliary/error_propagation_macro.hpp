#pragma once

#include <expected>

/// Unwraps a std::expected or returns its error from the enclosing function.
/// The enclosing function must return a std::expected with the same error
/// type.
#define SWR_TRY(m) \
  ({ \
    auto swr_try_result = (m); \
    if (!swr_try_result.has_value()) \
      return std::unexpected(swr_try_result.error()); \
    std::move(swr_try_result).value(); \
  })
