#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <boost/variant.hpp>

namespace swr::bencode
{
using BeValue = boost::make_recursive_variant<
    std::int64_t,
    std::string,
    std::map<std::string, boost::recursive_variant_>,
    std::vector<boost::recursive_variant_>>::type;

enum BeValueTypeIndex : uint8_t
{
  IInt64 = 0,
  IString = 1,
  IDict = 2,
  IList = 3,
};

using List = std::vector<BeValue>;

using Dict = std::map<std::string, BeValue>;

enum class DecodeError : uint8_t
{
  Truncated,
  InvalidToken,
  InvalidInteger,
  InvalidStringLength,
  UnsortedKeys,
  TooDeep,
  TrailingData,
};

std::string_view to_string(DecodeError error);

class BEncoder : public boost::static_visitor<std::string>
{
public:
  std::string operator()(const BeValue& value) const;
  std::string operator()(std::int64_t value) const;
  std::string operator()(const std::string& value) const;
  std::string operator()(const List& values) const;
  std::string operator()(const Dict& values) const;
};

struct DecodeResult
{
  BeValue result;
  size_t used_chars;
};

class BDecoder
{
public:
  static constexpr int DEFAULT_MAX_DEPTH = 16;

  /// Decodes exactly one value; trailing bytes are an error.
  std::expected<BeValue, DecodeError> operator()(
      std::string_view value, int max_depth = DEFAULT_MAX_DEPTH) const;

private:
  std::expected<DecodeResult, DecodeError> decode_int(std::string_view value) const;
  std::expected<DecodeResult, DecodeError> decode_string(std::string_view value) const;
  std::expected<DecodeResult, DecodeError> decode_dict(std::string_view value,
                                                       int max_depth) const;
  std::expected<DecodeResult, DecodeError> decode_list(std::string_view value,
                                                       int max_depth) const;
  std::expected<DecodeResult, DecodeError> decode(std::string_view value,
                                                  int max_depth) const;
};

std::string encode(const BeValue& value);

// Typed field access on decoded dictionaries; nullptr when absent or of
// another type.
const std::string* find_string(const Dict& dict, const std::string& key);
const std::int64_t* find_int(const Dict& dict, const std::string& key);
const List* find_list(const Dict& dict, const std::string& key);
const Dict* find_dict(const Dict& dict, const std::string& key);

}  // namespace swr::bencode
