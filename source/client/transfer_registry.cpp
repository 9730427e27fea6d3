#include "client/transfer_registry.hpp"

namespace swr
{
bool TransferRegistry::add(std::shared_ptr<Transfer> transfer)
{
  std::lock_guard guard {m_lock};

  auto [it, inserted] = m_transfers.try_emplace(transfer->info_hash(), transfer);
  return inserted;
}

std::shared_ptr<Transfer> TransferRegistry::remove(const InfoHash& info_hash)
{
  std::lock_guard guard {m_lock};

  auto node = m_transfers.extract(info_hash);
  return node.empty() ? nullptr : std::move(node.mapped());
}

std::shared_ptr<Transfer> TransferRegistry::find(const InfoHash& info_hash) const
{
  std::lock_guard guard {m_lock};

  auto it = m_transfers.find(info_hash);
  return it == m_transfers.end() ? nullptr : it->second;
}

std::shared_ptr<AdmissionTarget> TransferRegistry::find_target(const InfoHash& info_hash)
{
  auto transfer = find(info_hash);

  if (!transfer || transfer->stopped()) {
    return nullptr;
  }

  return transfer;
}

std::vector<std::shared_ptr<Transfer>> TransferRegistry::snapshot() const
{
  std::lock_guard guard {m_lock};

  std::vector<std::shared_ptr<Transfer>> transfers;
  transfers.reserve(m_transfers.size());

  for (const auto& [id, transfer] : m_transfers) {
    transfers.push_back(transfer);
  }

  return transfers;
}

size_t TransferRegistry::size() const
{
  std::lock_guard guard {m_lock};
  return m_transfers.size();
}
}  // namespace swr
