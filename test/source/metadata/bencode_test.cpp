#include <catch2/catch_test_macros.hpp>

#include "torrent/metadata/bencode.hpp"

using swr::bencode::BDecoder;
using swr::bencode::DecodeError;
using swr::bencode::Dict;
using swr::bencode::List;

TEST_CASE("Decodes int correctly", "[bencode]")
{
  BDecoder decoder;

  REQUIRE(boost::get<std::int64_t>(*decoder("i244321313e")) == 244321313);
  REQUIRE(boost::get<std::int64_t>(*decoder("i-723394819e")) == -723394819);
  REQUIRE(boost::get<std::int64_t>(*decoder("i0e")) == 0);

  REQUIRE(decoder("i32984").error() == DecodeError::Truncated);
  REQUIRE(decoder("i03e").error() == DecodeError::InvalidInteger);
  REQUIRE(decoder("i-0e").error() == DecodeError::InvalidInteger);
  REQUIRE(decoder("ie").error() == DecodeError::InvalidInteger);
}

TEST_CASE("Decodes string correctly", "[bencode]")
{
  BDecoder decoder;

  REQUIRE(boost::get<std::string>(*decoder("5:hello")) == "hello");
  REQUIRE(boost::get<std::string>(*decoder("1:a")) == "a");
  REQUIRE(boost::get<std::string>(*decoder("0:")).empty());

  REQUIRE(decoder("10:").error() == DecodeError::Truncated);
  REQUIRE(decoder("x:abc").error() == DecodeError::InvalidToken);
}

TEST_CASE("Decodes nested containers", "[bencode]")
{
  BDecoder decoder;

  auto decoded = decoder("d4:listli1ei2ee4:name3:abce");
  REQUIRE(decoded);

  const auto& dict = boost::get<Dict>(*decoded);
  REQUIRE(*swr::bencode::find_string(dict, "name") == "abc");

  const auto* list = swr::bencode::find_list(dict, "list");
  REQUIRE(list != nullptr);
  REQUIRE(list->size() == 2);

  REQUIRE(swr::bencode::find_int(dict, "name") == nullptr);
  REQUIRE(swr::bencode::find_dict(dict, "missing") == nullptr);
}

TEST_CASE("Rejects non-canonical and hostile input", "[bencode]")
{
  BDecoder decoder;

  REQUIRE(decoder("d1:bi1e1:ai2ee").error() == DecodeError::UnsortedKeys);
  REQUIRE(decoder("i1ei2e").error() == DecodeError::TrailingData);
  REQUIRE(decoder("l").error() == DecodeError::Truncated);
  REQUIRE(decoder("").error() == DecodeError::Truncated);

  std::string deep(40, 'l');
  deep += std::string(40, 'e');
  REQUIRE(decoder(deep).error() == DecodeError::TooDeep);
}

TEST_CASE("Encoding is canonical", "[bencode]")
{
  Dict dict;
  dict["zeta"] = std::int64_t {-5};
  dict["alpha"] = std::string {"x"};
  dict["list"] = List {std::int64_t {1}, std::string {"two"}};

  auto encoded = swr::bencode::encode(dict);
  REQUIRE(encoded == "d5:alpha1:x4:listli1e3:twoe4:zetai-5ee");

  auto decoded = BDecoder {}(encoded);
  REQUIRE(decoded);
  REQUIRE(swr::bencode::encode(*decoded) == encoded);
}

TEST_CASE("Scalars encode on their own", "[bencode]")
{
  REQUIRE(swr::bencode::encode(std::int64_t {0}) == "i0e");
  REQUIRE(swr::bencode::encode(std::string {}) == "0:");
  REQUIRE(swr::bencode::encode(List {}) == "le");
  REQUIRE(swr::bencode::encode(Dict {}) == "de");
}
