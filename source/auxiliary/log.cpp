#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>

#include "auxiliary/log.hpp"

#include <fmt/chrono.h>
#include <fmt/color.h>

namespace swr::log
{
namespace
{
std::atomic<Level> g_level {Level::Info};
std::mutex g_output_lock;

fmt::text_style style_of(Level level)
{
  switch (level) {
    case Level::Trace:
      return fg(fmt::color::dim_gray);
    case Level::Debug:
      return fg(fmt::color::steel_blue);
    case Level::Info:
      return fg(fmt::color::antique_white);
    case Level::Warn:
      return fg(fmt::color::orange) | fmt::emphasis::bold;
    case Level::Error:
      return fg(fmt::color::crimson) | fmt::emphasis::bold;
    default:
      return {};
  }
}

std::string_view name_of(Level level)
{
  switch (level) {
    case Level::Trace:
      return "trace";
    case Level::Debug:
      return "debug";
    case Level::Info:
      return "info";
    case Level::Warn:
      return "warn";
    case Level::Error:
      return "error";
    default:
      return "off";
  }
}
}  // namespace

void set_level(Level level)
{
  g_level.store(level, std::memory_order_relaxed);
}

Level level()
{
  return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl)
{
  return lvl >= level() && lvl != Level::Off;
}

bool parse_level(std::string_view name, Level& out)
{
  for (auto candidate :
       {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Off})
  {
    if (name == name_of(candidate)) {
      out = candidate;
      return true;
    }
  }

  return false;
}

void write(Level level, std::string_view component, std::string_view message)
{
  auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());

  std::lock_guard guard {g_output_lock};

  fmt::print(stderr, "{:%H:%M:%S} ", now);
  fmt::print(stderr, style_of(level), "{:<5}", name_of(level));
  fmt::print(stderr, " [{}] {}\n", component, message);
}
}  // namespace swr::log
