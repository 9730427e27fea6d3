#include <catch2/catch_test_macros.hpp>

#include "torrent/layout/file_layout.hpp"

using swr::FileEntry;
using swr::FileLayout;
using swr::FileSegment;

TEST_CASE("Piece spanning two files is split at the boundary", "[layout]")
{
  FileLayout layout {{FileEntry {"a", 300}, FileEntry {"b", 800}}, 512};

  REQUIRE(layout.piece_count() == 3);
  REQUIRE(layout.total_length() == 1100);
  REQUIRE(layout.piece_size(2) == 76);

  auto first = layout.map(0, 0, 512);
  REQUIRE(first);
  REQUIRE(*first
          == std::vector<FileSegment> {FileSegment {0, "a", 0, 300},
                                       FileSegment {1, "b", 0, 212}});

  auto middle = layout.map(1, 0, 512);
  REQUIRE(middle);
  REQUIRE(*middle == std::vector<FileSegment> {FileSegment {1, "b", 212, 512}});

  auto last = layout.map(2, 0, 76);
  REQUIRE(last);
  REQUIRE(*last == std::vector<FileSegment> {FileSegment {1, "b", 724, 76}});
}

TEST_CASE("Partial ranges map inside the piece", "[layout]")
{
  FileLayout layout {{FileEntry {"a", 300}, FileEntry {"b", 800}}, 512};

  auto tail_of_a = layout.map(0, 100, 150);
  REQUIRE(tail_of_a);
  REQUIRE(*tail_of_a == std::vector<FileSegment> {FileSegment {0, "a", 100, 150}});

  auto across = layout.map(0, 250, 100);
  REQUIRE(across);
  REQUIRE(*across
          == std::vector<FileSegment> {FileSegment {0, "a", 250, 50},
                                       FileSegment {1, "b", 0, 50}});
}

TEST_CASE("Segment lengths add up to the requested range", "[layout]")
{
  FileLayout layout {
      {FileEntry {"x", 10}, FileEntry {"y", 5}, FileEntry {"z", 1000}, FileEntry {"w", 3}}, 64};

  for (uint32_t piece = 0; piece < layout.piece_count(); piece++) {
    uint64_t covered = 0;
    for (const auto& segment : layout.piece_segments(piece)) {
      covered += segment.length;
    }
    REQUIRE(covered == layout.piece_size(piece));
  }
}

TEST_CASE("Zero-length files produce no segments", "[layout]")
{
  FileLayout layout {{FileEntry {"empty-head", 0},
                      FileEntry {"a", 100},
                      FileEntry {"empty-middle", 0},
                      FileEntry {"b", 100},
                      FileEntry {"empty-tail", 0}},
                     128};

  REQUIRE(layout.piece_count() == 2);

  auto first = layout.map(0, 0, 128);
  REQUIRE(first);
  REQUIRE(*first
          == std::vector<FileSegment> {FileSegment {1, "a", 0, 100},
                                       FileSegment {3, "b", 0, 28}});

  auto second = layout.map(1, 0, 72);
  REQUIRE(second);
  REQUIRE(*second == std::vector<FileSegment> {FileSegment {3, "b", 28, 72}});
}

TEST_CASE("Out of range requests are errors", "[layout]")
{
  FileLayout layout {{FileEntry {"a", 1000}}, 512};

  auto missing = layout.map(2, 0, 1);
  REQUIRE_FALSE(missing);
  REQUIRE(missing.error() == swr::LayoutError::PieceOutOfRange);

  auto too_long = layout.map(1, 400, 100);
  REQUIRE_FALSE(too_long);
  REQUIRE(too_long.error() == swr::LayoutError::RangeOutOfPiece);

  REQUIRE(layout.map(1, 0, 488));
}

TEST_CASE("Layout needs a positive piece length", "[layout]")
{
  REQUIRE_THROWS_AS((FileLayout {{FileEntry {"a", 1}}, 0}), std::invalid_argument);
  REQUIRE_THROWS_AS((FileLayout {{}, 16}), std::invalid_argument);
}
