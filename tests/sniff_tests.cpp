#include <catch2/catch_all.hpp>
#include <ccr/sniff.hpp>
#include <ccr/util.hpp>
#include <string>

using namespace ccr;

static std::string bytes(std::initializer_list<unsigned char> b){
  return std::string(b.begin(), b.end());
}

TEST_CASE("PNG magic is recognised") {
  auto png = bytes({0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a, 0x00});
  REQUIRE(classify(png) == MimeType::Png);
  REQUIRE(classify(png.substr(0, 4)) == MimeType::Png);
}

TEST_CASE("JPEG JFIF and EXIF magic are recognised") {
  REQUIRE(classify(bytes({0xff, 0xd8, 0xff, 0xe0, 0x00, 0x10})) == MimeType::Jpeg);
  REQUIRE(classify(bytes({0xff, 0xd8, 0xff, 0xe1})) == MimeType::Jpeg);
}

TEST_CASE("other prefixes are not images") {
  REQUIRE_FALSE(classify(bytes({0xff, 0xd8, 0xff, 0xdb})).has_value());
  REQUIRE_FALSE(classify("GIF89a").has_value());
  REQUIRE_FALSE(classify("hello world\n").has_value());
  REQUIRE_FALSE(classify(bytes({0x89, 0x50, 0x4e, 0x48})).has_value());
}

TEST_CASE("short buffers are not images") {
  REQUIRE_FALSE(classify("").has_value());
  REQUIRE_FALSE(classify(bytes({0x89})).has_value());
  REQUIRE_FALSE(classify(bytes({0x89, 0x50, 0x4e})).has_value());
  REQUIRE_FALSE(classify(bytes({0xff, 0xd8, 0xff})).has_value());
}

TEST_CASE("sniffed payload carries mime name and base64") {
  auto p = sniff_payload(bytes({0x89, 0x50, 0x4e, 0x47}));
  REQUIRE(p.has_value());
  REQUIRE(p->mime_name() == "image/png");
  REQUIRE(p->base64() == "iVBORw==");

  auto j = sniff_payload(bytes({0xff, 0xd8, 0xff, 0xe0, 0x41}));
  REQUIRE(j.has_value());
  REQUIRE(j->mime_name() == "image/jpeg");

  REQUIRE_FALSE(sniff_payload("plain text").has_value());
}

TEST_CASE("base64 padding") {
  REQUIRE(util::base64_encode("") == "");
  REQUIRE(util::base64_encode("M") == "TQ==");
  REQUIRE(util::base64_encode("Ma") == "TWE=");
  REQUIRE(util::base64_encode("Man") == "TWFu");
  REQUIRE(util::base64_encode(bytes({0xff, 0xfe, 0xfd, 0x00})) == "//79AA==");
}
