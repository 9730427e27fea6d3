#include "client/supervisor/maintenance.hpp"

#include "auxiliary/log.hpp"
#include "auxiliary/offload.hpp"

using boost::asio::awaitable;

namespace swr
{
namespace
{
constexpr std::string_view COMPONENT = "maintenance";
}

size_t reap_stale_connections(TransferRegistry& registry,
                              std::chrono::steady_clock::duration limit)
{
  size_t reaped = 0;

  for (auto& transfer : registry.snapshot()) {
    reaped += transfer->reap_stale(limit);
  }

  if (reaped > 0) {
    log::info(COMPONENT, "closed {} idle connections", reaped);
  }

  return reaped;
}

void log_metrics(const TransferRegistry& registry,
                 const DiskIOEngine* disk,
                 const IncomingPeerAdmission* admission)
{
  for (const auto& transfer : registry.snapshot()) {
    auto stats = transfer->stats();
    double percent = stats.piece_count == 0
        ? 100.0
        : 100.0 * stats.verified_pieces / stats.piece_count;

    log::info(COMPONENT,
              "{}: {:.1f}% ({}/{}), {} peers, {} B down, {} B up, {} hash failures{}",
              transfer->name(),
              percent,
              stats.verified_pieces,
              stats.piece_count,
              stats.sessions,
              stats.bytes_received,
              stats.bytes_uploaded,
              stats.hash_failures,
              stats.halted ? ", halted" : "");
  }

  if (disk != nullptr) {
    auto stats = disk->stats();
    log::debug(COMPONENT,
               "disk: {} ops via {}, {} B read, {} B written, {} fast path errors, {} "
               "fallbacks",
               stats.operations,
               to_string(stats.active_path),
               stats.bytes_read,
               stats.bytes_written,
               stats.fast_path_errors,
               stats.fallback_operations);
  }

  if (admission != nullptr) {
    auto stats = admission->stats();
    log::debug(COMPONENT,
               "admission: {} admitted, {} rejected, {} queued ({} waiting), {} timed out, "
               "{} overflowed",
               stats.admitted,
               stats.rejected,
               stats.queued,
               stats.waiting,
               stats.timed_out,
               stats.overflowed);
  }
}

void install_maintenance(BackgroundTaskSupervisor& supervisor,
                         const Settings& settings,
                         MaintenanceTargets targets)
{
  const auto& policy = settings.supervisor;

  if (auto registry = targets.registry) {
    supervisor.run_periodic(
        "reaper",
        policy.reap_interval,
        [registry, limit = policy.stale_connection_timeout]() -> awaitable<void>
        {
          reap_stale_connections(*registry, limit);
          co_return;
        });

    supervisor.run_periodic(
        "metrics",
        policy.metrics_interval,
        [registry, disk = targets.disk, admission = targets.admission]() -> awaitable<void>
        {
          log_metrics(*registry, disk, admission);
          co_return;
        });

    if (settings.checkpoint.enabled) {
      supervisor.run_periodic("checkpoint-flush",
                              settings.checkpoint.save_interval,
                              [registry]() -> awaitable<void>
                              {
                                for (auto& transfer : registry->snapshot()) {
                                  co_await transfer->save_checkpoint();
                                }
                              });
    }

    if (auto discovery = targets.discovery) {
      supervisor.run_periodic("announce",
                              settings.tracker.announce_interval,
                              [registry, discovery]() -> awaitable<void>
                              {
                                for (auto& transfer : registry->snapshot()) {
                                  discovery->announce(transfer->info_hash());
                                }
                                co_return;
                              });
    }
  }

  if (auto checkpoints = targets.checkpoints; checkpoints && targets.disk != nullptr) {
    supervisor.run_periodic(
        "checkpoint-cleanup",
        policy.checkpoint_cleanup_interval,
        [checkpoints, disk = targets.disk, age = settings.checkpoint.max_age]()
            -> awaitable<void>
        {
          auto removed = co_await offload(
              disk->workers(),
              [checkpoints, age]
              {
                return checkpoints->cleanup_older_than(
                    std::chrono::duration_cast<std::chrono::seconds>(age));
              });

          if (removed > 0) {
            log::info(COMPONENT, "removed {} old checkpoints", removed);
          }
        });
  }

  if (auto* seen = targets.seen) {
    supervisor.run_periodic("dedup-sweep",
                            policy.dedup_sweep_interval,
                            [seen]() -> awaitable<void>
                            {
                              auto dropped = seen->sweep();
                              log::trace(COMPONENT, "dropped {} seen messages", dropped);
                              co_return;
                            });
  }
}
}  // namespace swr
