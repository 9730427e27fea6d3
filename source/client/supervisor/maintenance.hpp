#pragma once

#include <memory>

#include "checkpoint/checkpoint_store.hpp"
#include "client/admission/incoming_admission.hpp"
#include "client/settings.hpp"
#include "client/supervisor/task_supervisor.hpp"
#include "client/transfer_registry.hpp"
#include "discovery/seen_messages.hpp"
#include "discovery/tracker_discovery.hpp"
#include "storage/disk_io_engine.hpp"

namespace swr
{
/// What the maintenance routines work on. Null members disable the
/// routines that need them.
struct MaintenanceTargets
{
  std::shared_ptr<TransferRegistry> registry;
  DiskIOEngine* disk = nullptr;
  IncomingPeerAdmission* admission = nullptr;
  std::shared_ptr<CheckpointStore> checkpoints;
  SeenMessageArena* seen = nullptr;
  std::shared_ptr<TrackerDiscovery> discovery;
};

/// Closes sessions idle beyond the limit; returns how many were closed.
size_t reap_stale_connections(TransferRegistry& registry,
                              std::chrono::steady_clock::duration limit);

/// One line per transfer plus disk and admission counters.
void log_metrics(const TransferRegistry& registry,
                 const DiskIOEngine* disk,
                 const IncomingPeerAdmission* admission);

/// Starts the periodic routines: stale-connection reaping, metrics,
/// checkpoint flush and cleanup, dedup sweep and tracker re-announce.
void install_maintenance(BackgroundTaskSupervisor& supervisor,
                         const Settings& settings,
                         MaintenanceTargets targets);
}  // namespace swr
