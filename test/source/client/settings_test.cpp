#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>

#include "auxiliary/log.hpp"
#include "client/settings.hpp"

namespace
{
swr::EnvironmentLookup lookup_in(const std::map<std::string, std::string>& variables)
{
  return [&variables](const char* name) -> const char*
  {
    auto it = variables.find(name);
    return it == variables.end() ? nullptr : it->second.c_str();
  };
}
}  // namespace

TEST_CASE("Defaults match the documented values", "[settings]")
{
  swr::Settings settings;

  REQUIRE(settings.piece.block_size == 16384);
  REQUIRE(settings.piece.endgame_threshold == 0.95);
  REQUIRE(settings.piece.endgame_duplicates == 2);
  REQUIRE(settings.admission.max_connections_per_transfer == 50);
  REQUIRE(settings.admission.grace_period == std::chrono::seconds {30});
  REQUIRE(settings.checkpoint.format == swr::CheckpointFormat::Binary);
  REQUIRE_FALSE(settings.checkpoint.compress);
  REQUIRE(settings.disk.enable_kernel_io);
}

TEST_CASE("Environment overrides are applied", "[settings]")
{
  std::map<std::string, std::string> variables {
      {"SWARMER_MAX_PEERS_PER_TORRENT", "12"},
      {"SWARMER_BLOCK_SIZE_KIB", "32"},
      {"SWARMER_ENDGAME_THRESHOLD", "0.8"},
      {"SWARMER_ENDGAME_DUPLICATES", "3"},
      {"SWARMER_ADMISSION_GRACE_SECONDS", "7"},
      {"SWARMER_CHECKPOINT_DIR", "/var/lib/swarmer"},
      {"SWARMER_CHECKPOINT_FORMAT", "bencode"},
      {"SWARMER_CHECKPOINT_COMPRESS", "yes"},
      {"SWARMER_DISK_WORKERS", "6"},
      {"SWARMER_ENABLE_KERNEL_IO", "off"},
      {"SWARMER_LISTEN_PORT", "51413"},
      {"SWARMER_TRACKER_PORT", "6969"},
  };

  swr::Settings settings;
  swr::apply_overrides(settings, lookup_in(variables));

  REQUIRE(settings.admission.max_connections_per_transfer == 12);
  REQUIRE(settings.piece.block_size == 32 * 1024);
  REQUIRE(settings.piece.endgame_threshold == 0.8);
  REQUIRE(settings.piece.endgame_duplicates == 3);
  REQUIRE(settings.admission.grace_period == std::chrono::seconds {7});
  REQUIRE(settings.checkpoint.directory == std::filesystem::path {"/var/lib/swarmer"});
  REQUIRE(settings.checkpoint.format == swr::CheckpointFormat::Bencode);
  REQUIRE(settings.checkpoint.compress);
  REQUIRE(settings.disk.worker_threads == 6);
  REQUIRE_FALSE(settings.disk.enable_kernel_io);
  REQUIRE(settings.tracker.listen_port == 51413);
  REQUIRE(settings.tracker.serve_port == 6969);
}

TEST_CASE("Malformed overrides keep the previous value", "[settings]")
{
  std::map<std::string, std::string> variables {
      {"SWARMER_MAX_PEERS_PER_TORRENT", "0"},
      {"SWARMER_BLOCK_SIZE_KIB", "128"},
      {"SWARMER_ENDGAME_THRESHOLD", "often"},
      {"SWARMER_ENDGAME_DUPLICATES", "-1"},
      {"SWARMER_CHECKPOINT_FORMAT", "json"},
      {"SWARMER_ENABLE_KERNEL_IO", "maybe"},
      {"SWARMER_LISTEN_PORT", "70000"},
  };

  swr::Settings settings;
  swr::apply_overrides(settings, lookup_in(variables));

  swr::Settings defaults;
  REQUIRE(settings.admission.max_connections_per_transfer
          == defaults.admission.max_connections_per_transfer);
  REQUIRE(settings.piece.block_size == defaults.piece.block_size);
  REQUIRE(settings.piece.endgame_threshold == defaults.piece.endgame_threshold);
  REQUIRE(settings.piece.endgame_duplicates == defaults.piece.endgame_duplicates);
  REQUIRE(settings.checkpoint.format == defaults.checkpoint.format);
  REQUIRE(settings.disk.enable_kernel_io == defaults.disk.enable_kernel_io);
  REQUIRE(settings.tracker.listen_port == defaults.tracker.listen_port);
}

TEST_CASE("Log levels parse by name", "[settings]")
{
  swr::log::Level level {};

  REQUIRE(swr::log::parse_level("debug", level));
  REQUIRE(level == swr::log::Level::Debug);

  REQUIRE(swr::log::parse_level("off", level));
  REQUIRE(level == swr::log::Level::Off);

  REQUIRE_FALSE(swr::log::parse_level("loud", level));
}
