#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "client/admission/incoming_admission.hpp"
#include "client/transfer.hpp"

namespace swr
{
/// Live transfers keyed by info hash. Structural changes and lookups take
/// one mutex.
class TransferRegistry : public TransferDirectory
{
  mutable std::mutex m_lock;
  std::map<InfoHash, std::shared_ptr<Transfer>> m_transfers;

public:
  /// False when a transfer with the same info hash is registered already.
  bool add(std::shared_ptr<Transfer> transfer);

  std::shared_ptr<Transfer> remove(const InfoHash& info_hash);

  std::shared_ptr<Transfer> find(const InfoHash& info_hash) const;

  std::shared_ptr<AdmissionTarget> find_target(const InfoHash& info_hash) override;

  std::vector<std::shared_ptr<Transfer>> snapshot() const;

  size_t size() const;
};
}  // namespace swr
