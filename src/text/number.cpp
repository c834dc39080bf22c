#include <labelcheck/text/number.hpp>
#include <array>
#include <charconv>
#include <system_error>

namespace labelcheck::text {

std::optional<double> parse_number(std::string_view text) noexcept {
  // from_chars rejects a leading '+'.
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text.front() == '-') return std::nullopt;
  }
  if (text.empty()) return std::nullopt;

  double value = 0.0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  return value;
}

std::string format_number(double value) {
  std::array<char, 64> buf{};
  const auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
  if (ec != std::errc{}) return "nan";
  std::string out(buf.data(), ptr);
  if (out.find_first_of(".en") == std::string::npos) {
    out += ".0";
  }
  return out;
}

}  // namespace labelcheck::text
