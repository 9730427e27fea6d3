#pragma once

#include <utility>
#include <boost/asio/ip/basic_endpoint.hpp>
#include <fmt/ostream.h>

// Lets endpoints go straight into log lines.
template<typename Protocol>
struct fmt::formatter<boost::asio::ip::basic_endpoint<Protocol>> : fmt::ostream_formatter
{
};
