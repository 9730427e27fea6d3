#include <charconv>

#include "storage/io_capabilities.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <fmt/format.h>

#if defined(__linux__)
#  include <sys/utsname.h>
#endif

namespace swr
{
bool parse_kernel_release(std::string_view release, int& major, int& minor)
{
  auto dot = release.find('.');

  if (dot == std::string_view::npos) {
    return false;
  }

  auto major_result = std::from_chars(release.data(), release.data() + dot, major);
  if (major_result.ec != std::errc {} || major_result.ptr != release.data() + dot)
  {
    return false;
  }

  auto minor_begin = release.data() + dot + 1;
  auto minor_result =
      std::from_chars(minor_begin, release.data() + release.size(), minor);

  return minor_result.ec == std::errc {} && minor_result.ptr != minor_begin;
}

bool IoCapabilities::kernel_io_usable() const
{
  if (!is_linux || !asio_file_support) {
    return false;
  }

  return kernel_major > MIN_KERNEL_MAJOR
      || (kernel_major == MIN_KERNEL_MAJOR && kernel_minor >= MIN_KERNEL_MINOR);
}

std::string IoCapabilities::describe() const
{
  return fmt::format("linux={} kernel={}.{} asio-file={}",
                     is_linux,
                     kernel_major,
                     kernel_minor,
                     asio_file_support);
}

IoCapabilities probe_io_capabilities()
{
  IoCapabilities capabilities {};

#if defined(__linux__)
  capabilities.is_linux = true;

  utsname name {};
  if (uname(&name) == 0) {
    parse_kernel_release(
        name.release, capabilities.kernel_major, capabilities.kernel_minor);
  }
#endif

#if defined(BOOST_ASIO_HAS_FILE)
  capabilities.asio_file_support = true;
#endif

  return capabilities;
}
}  // namespace swr
