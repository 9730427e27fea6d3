#pragma once

#include <string>
#include <string_view>

namespace swr
{
/// What the host offers for the kernel-assisted I/O path. Probed once at
/// startup.
struct IoCapabilities
{
  bool is_linux = false;
  int kernel_major = 0;
  int kernel_minor = 0;
  bool asio_file_support = false;

  static constexpr int MIN_KERNEL_MAJOR = 5;
  static constexpr int MIN_KERNEL_MINOR = 1;

  bool kernel_io_usable() const;

  std::string describe() const;
};

IoCapabilities probe_io_capabilities();

/// Parses the leading "major.minor" of a uname release string such as
/// "6.1.0-13-amd64".
bool parse_kernel_release(std::string_view release, int& major, int& minor);

}  // namespace swr
