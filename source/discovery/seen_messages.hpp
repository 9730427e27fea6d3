#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <span>

namespace swr
{
using Fingerprint = std::array<uint8_t, 20>;

/// Remembers message fingerprints for a fixed time so a flooded message is
/// acted on at most once. Expired entries are dropped by sweep(); when the
/// arena is full the oldest entry makes room.
class SeenMessageArena
{
public:
  using Clock = std::chrono::steady_clock;

  explicit SeenMessageArena(Clock::duration expiry, size_t capacity = 65536);

  static Fingerprint fingerprint(std::span<const uint8_t> message);

  /// True the first time a fingerprint is seen within its expiry window.
  bool first_sighting(const Fingerprint& fingerprint, Clock::time_point now = Clock::now());

  bool first_sighting(std::span<const uint8_t> message, Clock::time_point now = Clock::now())
  {
    return first_sighting(fingerprint(message), now);
  }

  bool contains(const Fingerprint& fingerprint, Clock::time_point now = Clock::now()) const;

  /// Drops expired entries; returns how many were dropped.
  size_t sweep(Clock::time_point now = Clock::now());

  size_t size() const { return m_expiry.size(); }

  Clock::duration expiry() const { return m_ttl; }

private:
  Clock::duration m_ttl;
  size_t m_capacity;

  std::map<Fingerprint, Clock::time_point> m_expiry;

  // insertion order, which is also expiry order
  std::deque<std::pair<Clock::time_point, Fingerprint>> m_order;
};
}  // namespace swr
