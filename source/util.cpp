#include <ccr/util.hpp>

#include <cctype>

namespace ccr {
namespace util {

std::string base64_encode(std::string_view in) {
  static const char* tbl =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((in.size() + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    unsigned v = (static_cast<unsigned char>(in[i]) << 16) |
                 (static_cast<unsigned char>(in[i+1]) << 8) |
                 static_cast<unsigned char>(in[i+2]);
    out.push_back(tbl[(v >> 18) & 0x3F]);
    out.push_back(tbl[(v >> 12) & 0x3F]);
    out.push_back(tbl[(v >> 6) & 0x3F]);
    out.push_back(tbl[v & 0x3F]);
  }
  size_t rest = in.size() - i;
  if (rest == 1) {
    unsigned v = static_cast<unsigned char>(in[i]) << 16;
    out.push_back(tbl[(v >> 18) & 0x3F]);
    out.push_back(tbl[(v >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    unsigned v = (static_cast<unsigned char>(in[i]) << 16) |
                 (static_cast<unsigned char>(in[i+1]) << 8);
    out.push_back(tbl[(v >> 18) & 0x3F]);
    out.push_back(tbl[(v >> 12) & 0x3F]);
    out.push_back(tbl[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

std::string json_escape(std::string_view s) {
  std::string o; o.reserve(s.size()+8);
  for (char c: s) {
    switch(c) {
      case '\"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) { o += "\\u00"; const char* hexd="0123456789abcdef"; o.push_back(hexd[(c>>4)&0xF]); o.push_back(hexd[c&0xF]); }
        else o.push_back(c);
    }
  }
  return o;
}

static int hex(char c) {
  if (c>='0'&&c<='9') return c-'0';
  if (c>='a'&&c<='f') return 10+(c-'a');
  if (c>='A'&&c<='F') return 10+(c-'A');
  return -1;
}

static void append_utf8(std::string& o, unsigned cp) {
  if (cp < 0x80) { o.push_back(static_cast<char>(cp)); }
  else if (cp < 0x800) {
    o.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    o.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    o.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    o.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    o.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// reads a JSON string starting at the opening quote; pos ends past the closing one
static std::optional<std::string> read_string(std::string_view s, size_t& pos) {
  if (pos >= s.size() || s[pos] != '"') return std::nullopt;
  std::string o;
  for (++pos; pos < s.size(); ++pos) {
    char c = s[pos];
    if (c == '"') { ++pos; return o; }
    if (c != '\\') { o.push_back(c); continue; }
    if (++pos >= s.size()) return std::nullopt;
    switch (s[pos]) {
      case '"': o.push_back('"'); break;
      case '\\': o.push_back('\\'); break;
      case '/': o.push_back('/'); break;
      case 'b': o.push_back('\b'); break;
      case 'f': o.push_back('\f'); break;
      case 'n': o.push_back('\n'); break;
      case 'r': o.push_back('\r'); break;
      case 't': o.push_back('\t'); break;
      case 'u': {
        if (pos + 4 >= s.size()) return std::nullopt;
        unsigned cp = 0;
        for (int k = 1; k <= 4; ++k) {
          int h = hex(s[pos + k]);
          if (h < 0) return std::nullopt;
          cp = cp * 16 + static_cast<unsigned>(h);
        }
        append_utf8(o, cp);
        pos += 4;
        break;
      }
      default: return std::nullopt;
    }
  }
  return std::nullopt;
}

static void skip_ws(std::string_view s, size_t& pos) {
  while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
}

// skips one value of any type; nested containers are balanced by bracket depth
static bool skip_value(std::string_view s, size_t& pos) {
  skip_ws(s, pos);
  if (pos >= s.size()) return false;
  if (s[pos] == '"') return read_string(s, pos).has_value();
  if (s[pos] == '{' || s[pos] == '[') {
    int depth = 0;
    while (pos < s.size()) {
      char c = s[pos];
      if (c == '"') { if (!read_string(s, pos)) return false; continue; }
      if (c == '{' || c == '[') ++depth;
      else if (c == '}' || c == ']') { if (--depth == 0) { ++pos; return true; } }
      ++pos;
    }
    return false;
  }
  while (pos < s.size() && s[pos] != ',' && s[pos] != '}') ++pos;
  return true;
}

std::optional<std::string> json_string_field(std::string_view json,
                                             std::string_view key) {
  size_t pos = 0;
  skip_ws(json, pos);
  if (pos >= json.size() || json[pos] != '{') return std::nullopt;
  ++pos;
  for (;;) {
    skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') return std::nullopt;
    auto k = read_string(json, pos);
    if (!k) return std::nullopt;
    skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') return std::nullopt;
    ++pos;
    skip_ws(json, pos);
    if (*k == key) {
      if (pos < json.size() && json[pos] == '"') return read_string(json, pos);
      return std::nullopt;
    }
    if (!skip_value(json, pos)) return std::nullopt;
    skip_ws(json, pos);
    if (pos < json.size() && json[pos] == ',') ++pos;
  }
}

std::string to_lower(std::string s) {
  for (auto& ch: s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

std::string trim(std::string s) {
  while(!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r'||s.back()=='\n')) s.pop_back();
  size_t i=0; while(i<s.size() && (s[i]==' '||s[i]=='\t')) ++i; return s.substr(i);
}

} // namespace util
} // namespace ccr
