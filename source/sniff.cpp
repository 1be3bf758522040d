#include <ccr/sniff.hpp>
#include <ccr/util.hpp>

#include <array>
#include <cstring>

namespace ccr {

static constexpr std::array<unsigned char, 4> kPng{0x89, 0x50, 0x4e, 0x47};
static constexpr std::array<unsigned char, 4> kJpegJfif{0xff, 0xd8, 0xff, 0xe0};
static constexpr std::array<unsigned char, 4> kJpegExif{0xff, 0xd8, 0xff, 0xe1};

static bool starts_with(std::string_view bytes, const std::array<unsigned char, 4>& magic){
  return std::memcmp(bytes.data(), magic.data(), magic.size()) == 0;
}

std::optional<MimeType> classify(std::string_view bytes){
  if (bytes.size() < 4) return std::nullopt;
  if (starts_with(bytes, kPng)) return MimeType::Png;
  if (starts_with(bytes, kJpegJfif) || starts_with(bytes, kJpegExif)) return MimeType::Jpeg;
  return std::nullopt;
}

const char* mime_type_name(MimeType m){
  switch (m) {
    case MimeType::Png:  return "image/png";
    case MimeType::Jpeg: return "image/jpeg";
  }
  return "application/octet-stream";
}

std::string SniffedPayload::base64() const {
  return util::base64_encode(bytes);
}

std::optional<SniffedPayload> sniff_payload(std::string bytes){
  auto mime = classify(bytes);
  if (!mime) return std::nullopt;
  return SniffedPayload{std::move(bytes), *mime};
}

} // namespace ccr
