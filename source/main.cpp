#include <exception>
#include <filesystem>

#include <fmt/core.h>

#include "app.hpp"
#include "client/settings.hpp"

auto main(int argc, char** argv) -> int
{
  if (argc != 3) {
    fmt::print(stderr, "usage: {} <torrent-file> <download-directory>\n", argv[0]);
    return 2;
  }

  std::filesystem::path torrent_file_path {argv[1]};

  if (!std::filesystem::exists(torrent_file_path)) {
    fmt::print(stderr, "Torrent file not found, exiting program.\n");
    return 1;
  }

  try {
    swr::Settings settings;
    swr::apply_environment(settings);

    auto app = App {settings};

    return app.run(torrent_file_path, std::filesystem::path {argv[2]});
  } catch (const std::exception& ex) {
    fmt::print(stderr, "Error: {}\n", ex.what());
    return 1;
  }
}
