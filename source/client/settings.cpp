#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

#include "client/settings.hpp"

#include "auxiliary/log.hpp"

namespace swr
{
namespace
{
template<typename T>
bool parse_number(std::string_view text, T& out)
{
  T value {};
  auto result = std::from_chars(text.data(), text.data() + text.size(), value);

  if (result.ec != std::errc {} || result.ptr != text.data() + text.size()) {
    return false;
  }

  out = value;
  return true;
}

bool parse_flag(std::string_view text, bool& out)
{
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    out = true;
    return true;
  }

  if (text == "0" || text == "false" || text == "no" || text == "off") {
    out = false;
    return true;
  }

  return false;
}

class Overrides
{
  const EnvironmentLookup& m_lookup;

public:
  explicit Overrides(const EnvironmentLookup& lookup)
      : m_lookup {lookup}
  {
  }

  template<typename Parser>
  void apply(const char* name, Parser&& parser)
  {
    const char* raw = m_lookup(name);

    if (raw == nullptr) {
      return;
    }

    if (!parser(std::string_view {raw})) {
      log::warn("settings", "ignoring malformed {}={}", name, raw);
      return;
    }

    log::debug("settings", "{} overridden to {}", name, raw);
  }
};
}  // namespace

void apply_overrides(Settings& settings, const EnvironmentLookup& lookup)
{
  Overrides overrides {lookup};

  overrides.apply("SWARMER_LOG_LEVEL",
                  [](std::string_view text)
                  {
                    log::Level level {};
                    if (!log::parse_level(text, level)) {
                      return false;
                    }
                    log::set_level(level);
                    return true;
                  });

  overrides.apply("SWARMER_MAX_PEERS_PER_TORRENT",
                  [&](std::string_view text)
                  {
                    uint16_t value = 0;
                    if (!parse_number(text, value) || value == 0) {
                      return false;
                    }
                    settings.admission.max_connections_per_transfer = value;
                    return true;
                  });

  overrides.apply("SWARMER_BLOCK_SIZE_KIB",
                  [&](std::string_view text)
                  {
                    uint32_t kib = 0;
                    if (!parse_number(text, kib) || kib == 0 || kib > 64) {
                      return false;
                    }
                    settings.piece.block_size = kib * 1024;
                    return true;
                  });

  overrides.apply("SWARMER_ENDGAME_THRESHOLD",
                  [&](std::string_view text)
                  {
                    char* end = nullptr;
                    std::string copy {text};
                    double value = std::strtod(copy.c_str(), &end);
                    if (end != copy.c_str() + copy.size() || value < 0.1
                        || value > 1.0)
                    {
                      return false;
                    }
                    settings.piece.endgame_threshold = value;
                    return true;
                  });

  overrides.apply("SWARMER_ENDGAME_DUPLICATES",
                  [&](std::string_view text)
                  {
                    uint16_t value = 0;
                    if (!parse_number(text, value) || value == 0 || value > 10) {
                      return false;
                    }
                    settings.piece.endgame_duplicates = value;
                    return true;
                  });

  overrides.apply("SWARMER_ADMISSION_GRACE_SECONDS",
                  [&](std::string_view text)
                  {
                    uint32_t seconds = 0;
                    if (!parse_number(text, seconds)) {
                      return false;
                    }
                    settings.admission.grace_period = std::chrono::seconds(seconds);
                    return true;
                  });

  overrides.apply("SWARMER_CHECKPOINT_DIR",
                  [&](std::string_view text)
                  {
                    if (text.empty()) {
                      return false;
                    }
                    settings.checkpoint.directory = std::filesystem::path {text};
                    return true;
                  });

  overrides.apply("SWARMER_CHECKPOINT_FORMAT",
                  [&](std::string_view text)
                  {
                    if (text == "binary") {
                      settings.checkpoint.format = CheckpointFormat::Binary;
                    } else if (text == "bencode") {
                      settings.checkpoint.format = CheckpointFormat::Bencode;
                    } else {
                      return false;
                    }
                    return true;
                  });

  overrides.apply("SWARMER_CHECKPOINT_COMPRESS",
                  [&](std::string_view text)
                  { return parse_flag(text, settings.checkpoint.compress); });

  overrides.apply("SWARMER_DISK_WORKERS",
                  [&](std::string_view text)
                  {
                    uint16_t value = 0;
                    if (!parse_number(text, value) || value == 0) {
                      return false;
                    }
                    settings.disk.worker_threads = value;
                    return true;
                  });

  overrides.apply("SWARMER_ENABLE_KERNEL_IO",
                  [&](std::string_view text)
                  { return parse_flag(text, settings.disk.enable_kernel_io); });

  overrides.apply("SWARMER_LISTEN_PORT",
                  [&](std::string_view text)
                  { return parse_number(text, settings.tracker.listen_port); });

  overrides.apply("SWARMER_TRACKER_PORT",
                  [&](std::string_view text)
                  { return parse_number(text, settings.tracker.serve_port); });
}

void apply_environment(Settings& settings)
{
  apply_overrides(settings, [](const char* name) { return std::getenv(name); });
}
}  // namespace swr
