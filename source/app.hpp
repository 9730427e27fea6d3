#pragma once

#include <filesystem>

#include "client/settings.hpp"

class App
{
  swr::Settings m_settings;

public:
  explicit App(swr::Settings settings);

  /// Downloads, then seeds, until SIGINT or SIGTERM. Returns the process
  /// exit code.
  int run(const std::filesystem::path& torrent_file_path,
          const std::filesystem::path& download_path);
};
