#include "discovery/seen_messages.hpp"

#include <openssl/sha.h>

namespace swr
{
SeenMessageArena::SeenMessageArena(Clock::duration expiry, size_t capacity)
    : m_ttl {expiry}
    , m_capacity {capacity == 0 ? 1 : capacity}
{
}

Fingerprint SeenMessageArena::fingerprint(std::span<const uint8_t> message)
{
  Fingerprint digest {};
  SHA1(message.data(), message.size(), digest.data());
  return digest;
}

bool SeenMessageArena::first_sighting(const Fingerprint& fingerprint, Clock::time_point now)
{
  if (auto it = m_expiry.find(fingerprint); it != m_expiry.end() && it->second > now) {
    return false;
  }

  if (!m_expiry.contains(fingerprint) && m_expiry.size() >= m_capacity) {
    sweep(now);

    while (m_expiry.size() >= m_capacity && !m_order.empty()) {
      auto [expires, oldest] = m_order.front();
      m_order.pop_front();

      if (auto it = m_expiry.find(oldest); it != m_expiry.end() && it->second == expires) {
        m_expiry.erase(it);
      }
    }
  }

  auto expires = now + m_ttl;
  m_expiry[fingerprint] = expires;
  m_order.emplace_back(expires, fingerprint);

  return true;
}

bool SeenMessageArena::contains(const Fingerprint& fingerprint, Clock::time_point now) const
{
  auto it = m_expiry.find(fingerprint);
  return it != m_expiry.end() && it->second > now;
}

size_t SeenMessageArena::sweep(Clock::time_point now)
{
  size_t dropped = 0;

  while (!m_order.empty() && m_order.front().first <= now) {
    auto [expires, fingerprint] = m_order.front();
    m_order.pop_front();

    // a later sighting refreshed the entry; its newer record stays queued
    if (auto it = m_expiry.find(fingerprint); it != m_expiry.end() && it->second == expires) {
      m_expiry.erase(it);
      dropped++;
    }
  }

  return dropped;
}
}  // namespace swr
