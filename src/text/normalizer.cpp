#include <labelcheck/text/normalizer.hpp>
#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace labelcheck::text {

bool is_space(char32_t c) noexcept {
  return u_isspace(static_cast<UChar32>(c)) != 0;
}

std::string_view trim(std::string_view text) noexcept {
  const auto* s = reinterpret_cast<const std::uint8_t*>(text.data());
  const auto length = static_cast<std::int32_t>(text.size());

  std::int32_t start = 0;
  while (start < length) {
    std::int32_t next = start;
    UChar32 c = 0;
    U8_NEXT(s, next, length, c);
    if (c < 0 || !is_space(static_cast<char32_t>(c))) break;
    start = next;
  }

  std::int32_t end = length;
  while (end > start) {
    std::int32_t prev = end;
    UChar32 c = 0;
    U8_PREV(s, start, prev, c);
    if (c < 0 || !is_space(static_cast<char32_t>(c))) break;
    end = prev;
  }
  return text.substr(static_cast<std::size_t>(start), static_cast<std::size_t>(end - start));
}

std::string normalize(std::string_view text) {
  // Malformed UTF-8 decodes to U+FFFD.
  icu::UnicodeString lowered = icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())));
  lowered.toLower(icu::Locale::getRoot());

  icu::UnicodeString collapsed;
  bool seen_text = false;
  bool pending_space = false;
  for (std::int32_t i = 0; i < lowered.length(); i = lowered.moveIndex32(i, 1)) {
    const UChar32 c = lowered.char32At(i);
    if (is_space(static_cast<char32_t>(c))) {
      pending_space = seen_text;
      continue;
    }
    if (pending_space) {
      collapsed.append(static_cast<UChar32>(' '));
      pending_space = false;
    }
    collapsed.append(c);
    seen_text = true;
  }

  std::string out;
  out.reserve(text.size());
  collapsed.toUTF8String(out);
  return out;
}

bool contains(std::string_view haystack, std::string_view needle) noexcept {
  return haystack.find(needle) != std::string_view::npos;
}

}  // namespace labelcheck::text
