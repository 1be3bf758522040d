#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ccr {

enum class MimeType { Png, Jpeg };

std::optional<MimeType> classify(std::string_view bytes);
const char *mime_type_name(MimeType m);

struct SniffedPayload {
  std::string bytes;
  MimeType mime;

  std::string mime_name() const { return mime_type_name(mime); }
  std::string base64() const;
};

std::optional<SniffedPayload> sniff_payload(std::string bytes);

} // namespace ccr
