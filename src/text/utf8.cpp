#include <labelcheck/text/utf8.hpp>

namespace labelcheck::text {

namespace {

bool is_continuation(char c) noexcept {
  return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

}  // namespace

std::size_t code_point_count(std::string_view text) noexcept {
  std::size_t n = 0;
  for (const char c : text) {
    if (!is_continuation(c)) ++n;
  }
  return n;
}

std::string_view code_point_prefix(std::string_view text,
                                   std::size_t max_code_points) noexcept {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_continuation(text[i])) continue;
    if (seen == max_code_points) return text.substr(0, i);
    ++seen;
  }
  return text;
}

}  // namespace labelcheck::text
