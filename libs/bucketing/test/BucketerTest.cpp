#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <string>
#include "Bucketer.h"

using namespace abvalidator;

namespace
{
  std::string toHex(const Bucketer::Digest& digest)
  {
    static const char* hexDigits = "0123456789abcdef";
    std::string hex;
    for (uint8_t byte : digest)
      {
	hex.push_back(hexDigits[byte >> 4]);
	hex.push_back(hexDigits[byte & 0x0f]);
      }
    return hex;
  }
}

TEST_CASE("Bucketer SHA-256 digest", "[Bucketer]")
{
  REQUIRE(toHex(Bucketer::digest("abc")) ==
	  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  REQUIRE(toHex(Bucketer::digest("")) ==
	  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Bucketer known buckets", "[Bucketer]")
{
  SECTION("Default 100 buckets")
  {
    Bucketer bucketer;
    REQUIRE(bucketer.getBucketCount() == 100);
    REQUIRE(bucketer.bucket(SubjectId("u1")) == 17);
    REQUIRE(bucketer.bucket(SubjectId("u2")) == 88);
    REQUIRE(bucketer.bucket(SubjectId("user-42")) == 79);
    REQUIRE(bucketer.bucket(SubjectId("alice")) == 20);
    REQUIRE(bucketer.bucket(SubjectId("bob")) == 25);
    REQUIRE(bucketer.bucket(SubjectId("carol")) == 49);
    REQUIRE(bucketer.bucket(SubjectId("dave")) == 62);
  }

  SECTION("1000 buckets reduce the whole 256-bit digest")
  {
    Bucketer bucketer(1000);
    REQUIRE(bucketer.bucket(SubjectId("u1")) == 17);
    REQUIRE(bucketer.bucket(SubjectId("u2")) == 188);
    REQUIRE(bucketer.bucket(SubjectId("user-42")) == 479);
    REQUIRE(bucketer.bucket(SubjectId("alice")) == 720);
    REQUIRE(bucketer.bucket(SubjectId("bob")) == 625);
  }

  SECTION("Integer identifiers hash through their decimal form")
  {
    Bucketer bucketer;
    REQUIRE(bucketer.bucket(SubjectId(int64_t(42))) == 53);
    REQUIRE(bucketer.bucket(SubjectId(int64_t(42))) == bucketer.bucket(SubjectId("42")));
    REQUIRE(bucketer.bucket(SubjectId(int64_t(1))) == 15);
    REQUIRE(SubjectId(int64_t(-7)).asString() == "-7");
  }
}

TEST_CASE("Bucketer properties", "[Bucketer]")
{
  SECTION("Deterministic across instances")
  {
    Bucketer first(100), second(100);
    for (int i = 0; i < 500; ++i)
      {
	SubjectId id("subject-" + std::to_string(i));
	REQUIRE(first.bucket(id) == second.bucket(id));
      }
  }

  SECTION("Always in range")
  {
    for (uint32_t count : {1u, 2u, 7u, 100u, 256u, 1000u, 65537u})
      {
	Bucketer bucketer(count);
	for (int i = 0; i < 200; ++i)
	  REQUIRE(bucketer.bucket(SubjectId(int64_t(i))) < count);
      }
  }

  SECTION("Roughly uniform over 10 buckets")
  {
    Bucketer bucketer(10);
    int counts[10] = {0};
    for (int i = 0; i < 10000; ++i)
      ++counts[bucketer.bucket(SubjectId("id" + std::to_string(i)))];

    for (int count : counts)
      {
	REQUIRE(count > 850);
	REQUIRE(count < 1150);
      }
  }

  SECTION("Reduce matches big-endian modulo")
  {
    Bucketer::Digest digest{};
    digest[Bucketer::DigestLength - 1] = 0x01;
    digest[Bucketer::DigestLength - 2] = 0x02;   // value 0x0201 = 513
    REQUIRE(Bucketer::reduce(digest, 100) == 13);
    REQUIRE(Bucketer::reduce(digest, 1000) == 513);
  }

  SECTION("Zero buckets is a configuration error")
  {
    REQUIRE_THROWS_AS(Bucketer(0), ConfigurationException);
  }
}
