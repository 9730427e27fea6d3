#pragma once

namespace swr
{
template<class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};
}  // namespace swr
