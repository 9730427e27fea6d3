#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace swr
{
using namespace std::chrono_literals;

struct PiecePolicy
{
  uint32_t block_size = 16 * 1024;
  double endgame_threshold = 0.95;
  uint16_t endgame_duplicates = 2;
};

struct DiskPolicy
{
  uint16_t worker_threads = 2;
  bool enable_kernel_io = true;
  bool preallocate = true;
};

struct AdmissionPolicy
{
  uint16_t max_connections_per_transfer = 50;
  size_t queue_capacity = 128;
  std::chrono::milliseconds grace_period = 30s;
  std::chrono::milliseconds poll_interval = 500ms;
};

enum class CheckpointFormat : uint8_t
{
  Binary,
  Bencode,
};

struct CheckpointPolicy
{
  bool enabled = true;
  std::filesystem::path directory = ".swarmer/checkpoints";
  CheckpointFormat format = CheckpointFormat::Binary;
  bool compress = false;  // zlib
  std::chrono::seconds save_interval = 10s;
  std::chrono::hours max_age = std::chrono::hours {24 * 30};
};

struct SupervisorPolicy
{
  std::chrono::seconds stale_connection_timeout = 120s;
  std::chrono::seconds reap_interval = 30s;
  std::chrono::seconds metrics_interval = 5s;
  std::chrono::seconds shutdown_timeout = 5s;
  std::chrono::seconds dedup_expiry = 300s;
  std::chrono::seconds dedup_sweep_interval = 60s;
  std::chrono::seconds checkpoint_cleanup_interval = 3600s;
};

struct PeerPolicy
{
  uint16_t pipeline_depth = 7;
  uint32_t max_message_length = 128 * 1024 + 13;
  std::chrono::seconds connect_timeout = 10s;
  std::chrono::seconds handshake_timeout = 10s;
  std::chrono::seconds keepalive_interval = 60s;
};

struct TrackerPolicy
{
  uint16_t listen_port = 6881;
  uint16_t serve_port = 0;  // built-in UDP tracker, 0 disables it
  std::chrono::seconds announce_timeout = 15s;
  std::chrono::seconds announce_interval = 1800s;
};

struct Settings
{
  PiecePolicy piece;
  DiskPolicy disk;
  AdmissionPolicy admission;
  CheckpointPolicy checkpoint;
  SupervisorPolicy supervisor;
  PeerPolicy peer;
  TrackerPolicy tracker;
};

/// Applies SWARMER_* environment overrides; malformed values are logged and
/// left at their previous value.
void apply_environment(Settings& settings);

using EnvironmentLookup = std::function<const char*(const char*)>;

/// Same as apply_environment, reading variables through the given lookup.
void apply_overrides(Settings& settings, const EnvironmentLookup& lookup);

}  // namespace swr
