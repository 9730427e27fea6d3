#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace swr::log
{
enum class Level : uint8_t
{
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

void set_level(Level level);

Level level();

bool enabled(Level level);

bool parse_level(std::string_view name, Level& out);

void write(Level level, std::string_view component, std::string_view message);

template<typename... Args>
void emit(Level lvl,
          std::string_view component,
          fmt::format_string<Args...> format,
          Args&&... args)
{
  if (enabled(lvl)) {
    write(lvl, component, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void trace(std::string_view component,
           fmt::format_string<Args...> format,
           Args&&... args)
{
  emit(Level::Trace, component, format, std::forward<Args>(args)...);
}

template<typename... Args>
void debug(std::string_view component,
           fmt::format_string<Args...> format,
           Args&&... args)
{
  emit(Level::Debug, component, format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(std::string_view component,
          fmt::format_string<Args...> format,
          Args&&... args)
{
  emit(Level::Info, component, format, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(std::string_view component,
          fmt::format_string<Args...> format,
          Args&&... args)
{
  emit(Level::Warn, component, format, std::forward<Args>(args)...);
}

template<typename... Args>
void error(std::string_view component,
           fmt::format_string<Args...> format,
           Args&&... args)
{
  emit(Level::Error, component, format, std::forward<Args>(args)...);
}
}  // namespace swr::log
