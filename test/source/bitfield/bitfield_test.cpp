#include <catch2/catch_test_macros.hpp>

#include "torrent/bitfield/bitfield.hpp"

using swr::aux::BitField;

TEST_CASE("Pieces map to wire bits", "[bitfield]")
{
  BitField bitfield {10};

  REQUIRE(bitfield.size() == 10);
  REQUIRE(bitfield.as_raw().size() == 2);
  REQUIRE(bitfield.is_empty());

  bitfield.mark(0, true);
  bitfield.mark(9, true);

  REQUIRE(bitfield.as_raw()[0] == 0x80);
  REQUIRE(bitfield.as_raw()[1] == 0x40);
  REQUIRE(bitfield.get(0));
  REQUIRE_FALSE(bitfield.get(1));
  REQUIRE(bitfield.count() == 2);

  bitfield.mark(0, false);
  REQUIRE_FALSE(bitfield.get(0));
  REQUIRE(bitfield.count() == 1);
}

TEST_CASE("Spare bits of wire bytes are ignored", "[bitfield]")
{
  BitField bitfield {{0xff, 0xff}, 10};

  REQUIRE(bitfield.count() == 10);
  REQUIRE(bitfield.all());
  REQUIRE(bitfield.as_raw()[1] == 0xc0);
  REQUIRE(bitfield == BitField({0xff, 0xc0}, 10));
}

TEST_CASE("Subsets compare piece by piece", "[bitfield]")
{
  BitField ours {12};
  BitField theirs {12};

  REQUIRE(ours.is_subset_of(theirs));

  ours.mark(3, true);
  REQUIRE_FALSE(ours.is_subset_of(theirs));

  theirs.mark(3, true);
  theirs.mark(11, true);
  REQUIRE(ours.is_subset_of(theirs));
  REQUIRE_FALSE(theirs.is_subset_of(ours));
}

TEST_CASE("Byte length rounds up", "[bitfield]")
{
  REQUIRE(BitField::byte_length(0) == 0);
  REQUIRE(BitField::byte_length(1) == 1);
  REQUIRE(BitField::byte_length(8) == 1);
  REQUIRE(BitField::byte_length(9) == 2);
}
