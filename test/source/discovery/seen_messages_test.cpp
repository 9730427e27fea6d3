#include <catch2/catch_test_macros.hpp>

#include <string_view>

#include "discovery/seen_messages.hpp"

using namespace std::chrono_literals;
using swr::SeenMessageArena;

namespace
{
std::span<const uint8_t> bytes_of(std::string_view text)
{
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}
}  // namespace

TEST_CASE("A message is acted on once per expiry window", "[discovery]")
{
  SeenMessageArena arena {10s};
  auto now = SeenMessageArena::Clock::now();

  REQUIRE(arena.first_sighting(bytes_of("peer 10.0.0.1:6881"), now));
  REQUIRE_FALSE(arena.first_sighting(bytes_of("peer 10.0.0.1:6881"), now + 5s));
  REQUIRE(arena.first_sighting(bytes_of("peer 10.0.0.2:6881"), now + 5s));

  REQUIRE(arena.size() == 2);
}

TEST_CASE("Expired messages count as new again", "[discovery]")
{
  SeenMessageArena arena {10s};
  auto now = SeenMessageArena::Clock::now();
  auto fingerprint = SeenMessageArena::fingerprint(bytes_of("hello"));

  REQUIRE(arena.first_sighting(fingerprint, now));
  REQUIRE(arena.contains(fingerprint, now + 9s));
  REQUIRE_FALSE(arena.contains(fingerprint, now + 10s));

  REQUIRE(arena.first_sighting(fingerprint, now + 11s));
}

TEST_CASE("Sweeping drops expired entries only", "[discovery]")
{
  SeenMessageArena arena {10s};
  auto now = SeenMessageArena::Clock::now();

  arena.first_sighting(bytes_of("old"), now);
  arena.first_sighting(bytes_of("new"), now + 8s);

  REQUIRE(arena.sweep(now + 12s) == 1);
  REQUIRE(arena.size() == 1);
  REQUIRE(arena.contains(SeenMessageArena::fingerprint(bytes_of("new")), now + 12s));

  REQUIRE(arena.sweep(now + 30s) == 1);
  REQUIRE(arena.size() == 0);
}

TEST_CASE("A refreshed entry survives the sweep of its old record", "[discovery]")
{
  SeenMessageArena arena {10s};
  auto now = SeenMessageArena::Clock::now();
  auto fingerprint = SeenMessageArena::fingerprint(bytes_of("again"));

  arena.first_sighting(fingerprint, now);
  arena.first_sighting(fingerprint, now + 15s);

  REQUIRE(arena.sweep(now + 16s) == 0);
  REQUIRE(arena.contains(fingerprint, now + 16s));
}

TEST_CASE("A full arena evicts the oldest entry", "[discovery]")
{
  SeenMessageArena arena {1h, 2};
  auto now = SeenMessageArena::Clock::now();

  arena.first_sighting(bytes_of("a"), now);
  arena.first_sighting(bytes_of("b"), now + 1s);
  arena.first_sighting(bytes_of("c"), now + 2s);

  REQUIRE(arena.size() == 2);
  REQUIRE_FALSE(arena.contains(SeenMessageArena::fingerprint(bytes_of("a")), now + 3s));
  REQUIRE(arena.contains(SeenMessageArena::fingerprint(bytes_of("c")), now + 3s));
}
