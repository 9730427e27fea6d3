#include <charconv>
#include <system_error>

#include "torrent/metadata/bencode.hpp"

#include "auxiliary/error_propagation_macro.hpp"

namespace swr::bencode
{
constexpr char INT_PREFIX = 'i';
constexpr char LIST_PREFIX = 'l';
constexpr char DICT_PREFIX = 'd';
constexpr char SUFFIX = 'e';
constexpr char STRING_LENGTH_DELIMITER = ':';

std::string_view to_string(DecodeError error)
{
  switch (error) {
    case DecodeError::Truncated:
      return "truncated input";
    case DecodeError::InvalidToken:
      return "invalid token";
    case DecodeError::InvalidInteger:
      return "invalid integer";
    case DecodeError::InvalidStringLength:
      return "invalid string length";
    case DecodeError::UnsortedKeys:
      return "dictionary keys out of order";
    case DecodeError::TooDeep:
      return "maximum nesting depth reached";
    case DecodeError::TrailingData:
      return "trailing data after value";
  }

  return "unknown";
}

std::string BEncoder::operator()(const BeValue& value) const
{
  return boost::apply_visitor(*this, value);
}

std::string BEncoder::operator()(std::int64_t value) const
{
  return INT_PREFIX + std::to_string(value) + SUFFIX;
}

std::string BEncoder::operator()(const std::string& value) const
{
  return std::to_string(value.length()) + STRING_LENGTH_DELIMITER + value;
}

std::string BEncoder::operator()(const List& values) const
{
  std::string out(1, LIST_PREFIX);

  for (const auto& value : values) {
    out += boost::apply_visitor(*this, value);
  }

  out += SUFFIX;
  return out;
}

std::string BEncoder::operator()(const Dict& values) const
{
  std::string out(1, DICT_PREFIX);

  for (const auto& [key, value] : values) {
    out += (*this)(key);
    out += boost::apply_visitor(*this, value);
  }

  out += SUFFIX;
  return out;
}

std::expected<DecodeResult, DecodeError> BDecoder::decode_int(
    std::string_view value) const
{
  auto end_index = value.find(SUFFIX);
  if (end_index == std::string_view::npos) {
    return std::unexpected(DecodeError::Truncated);
  }

  auto digits = value.substr(1, end_index - 1);

  // "i-0e" and leading zeros are not canonical
  if (digits.empty() || digits == "-0"
      || (digits.size() > 1 && digits[0] == '0')
      || (digits.size() > 2 && digits[0] == '-' && digits[1] == '0'))
  {
    return std::unexpected(DecodeError::InvalidInteger);
  }

  std::int64_t int_value = 0;
  auto result =
      std::from_chars(digits.data(), digits.data() + digits.size(), int_value);

  if (result.ec != std::errc {} || result.ptr != digits.data() + digits.size()) {
    return std::unexpected(DecodeError::InvalidInteger);
  }

  return DecodeResult {.result = int_value, .used_chars = end_index + 1};
}

std::expected<DecodeResult, DecodeError> BDecoder::decode_string(
    std::string_view value) const
{
  auto index_of_delimiter = value.find(STRING_LENGTH_DELIMITER);

  if (index_of_delimiter == std::string_view::npos) {
    return std::unexpected(DecodeError::Truncated);
  }

  size_t length = 0;
  auto result =
      std::from_chars(value.data(), value.data() + index_of_delimiter, length);

  if (result.ec != std::errc {} || result.ptr != value.data() + index_of_delimiter)
  {
    return std::unexpected(DecodeError::InvalidStringLength);
  }

  auto data_start = index_of_delimiter + 1;

  if (length > value.length() - data_start) {
    return std::unexpected(DecodeError::Truncated);
  }

  return DecodeResult {
      .result = std::string(value.substr(data_start, length)),
      .used_chars = data_start + length};
}

std::expected<DecodeResult, DecodeError> BDecoder::decode_dict(
    std::string_view value, int max_depth) const
{
  Dict values {};
  size_t index = 1;
  const std::string* previous_key = nullptr;

  while (true) {
    if (index >= value.length()) {
      return std::unexpected(DecodeError::Truncated);
    }

    if (value[index] == SUFFIX) {
      break;
    }

    auto key = SWR_TRY(decode_string(value.substr(index)));
    index += key.used_chars;

    auto val = SWR_TRY(decode(value.substr(index), max_depth - 1));
    index += val.used_chars;

    auto& key_string = boost::get<std::string>(key.result);

    if (previous_key != nullptr && !(*previous_key < key_string)) {
      return std::unexpected(DecodeError::UnsortedKeys);
    }

    auto inserted = values.emplace(std::move(key_string), std::move(val.result));
    previous_key = &inserted.first->first;
  }

  return DecodeResult {.result = std::move(values), .used_chars = index + 1};
}

std::expected<DecodeResult, DecodeError> BDecoder::decode_list(
    std::string_view value, int max_depth) const
{
  List values {};
  size_t index = 1;

  while (true) {
    if (index >= value.length()) {
      return std::unexpected(DecodeError::Truncated);
    }

    if (value[index] == SUFFIX) {
      break;
    }

    auto item = SWR_TRY(decode(value.substr(index), max_depth - 1));
    values.push_back(std::move(item.result));
    index += item.used_chars;
  }

  return DecodeResult {.result = std::move(values), .used_chars = index + 1};
}

std::expected<DecodeResult, DecodeError> BDecoder::decode(
    std::string_view value, int max_depth) const
{
  if (max_depth < 1) {
    return std::unexpected(DecodeError::TooDeep);
  }

  if (value.empty()) {
    return std::unexpected(DecodeError::Truncated);
  }

  switch (value.front()) {
    case INT_PREFIX:
      return decode_int(value);
    case DICT_PREFIX:
      return decode_dict(value, max_depth);
    case LIST_PREFIX:
      return decode_list(value, max_depth);
    default:
      if ('0' <= value.front() && value.front() <= '9') {
        return decode_string(value);
      }

      return std::unexpected(DecodeError::InvalidToken);
  }
}

std::expected<BeValue, DecodeError> BDecoder::operator()(std::string_view value,
                                                         int max_depth) const
{
  auto decoded = SWR_TRY(decode(value, max_depth));

  if (decoded.used_chars != value.length()) {
    return std::unexpected(DecodeError::TrailingData);
  }

  return std::move(decoded.result);
}

std::string encode(const BeValue& value)
{
  return BEncoder()(value);
}

namespace
{
template<typename T, BeValueTypeIndex Index>
const T* find_field(const Dict& dict, const std::string& key)
{
  auto it = dict.find(key);

  if (it == dict.end() || it->second.which() != Index) {
    return nullptr;
  }

  return &boost::get<T>(it->second);
}
}  // namespace

const std::string* find_string(const Dict& dict, const std::string& key)
{
  return find_field<std::string, IString>(dict, key);
}

const std::int64_t* find_int(const Dict& dict, const std::string& key)
{
  return find_field<std::int64_t, IInt64>(dict, key);
}

const List* find_list(const Dict& dict, const std::string& key)
{
  return find_field<List, IList>(dict, key);
}

const Dict* find_dict(const Dict& dict, const std::string& key)
{
  return find_field<Dict, IDict>(dict, key);
}

}  // namespace swr::bencode
