#include "docmind_core/utils/text_utils.hpp"

#include <utf8.h>

#include <iterator>

namespace docmind_core::text {

namespace {

bool is_ascii_space(char32_t cp) {
  return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v';
}

bool is_separator(char32_t cp) {
  if (cp < 0x80) {
    if (is_ascii_space(cp)) {
      return true;
    }
    // ASCII punctuation ranges, '_' included
    return (cp >= 0x21 && cp <= 0x2F) || (cp >= 0x3A && cp <= 0x40) || (cp >= 0x5B && cp <= 0x60) ||
           (cp >= 0x7B && cp <= 0x7E);
  }
  switch (cp) {
    case 0x00A0:  // no-break space
    case 0x00A1:  // ¡
    case 0x00AB:  // «
    case 0x00BB:  // »
    case 0x00BF:  // ¿
    case 0x2026:  // …
    case 0x3000:  // ideographic space
      return true;
    default:
      break;
  }
  return (cp >= 0x2010 && cp <= 0x201F) ||  // dashes and quotes
         (cp >= 0x3001 && cp <= 0x3003) ||  // 、。〃
         (cp >= 0x3008 && cp <= 0x3011) ||  // CJK brackets
         (cp >= 0xFF01 && cp <= 0xFF0F) ||  // full-width punctuation
         (cp >= 0xFF1A && cp <= 0xFF20);
}

char32_t lower_code_point(char32_t cp) {
  if (cp >= U'A' && cp <= U'Z') {
    return cp + 0x20;
  }
  // Latin-1 supplement, skipping the multiplication sign
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
    return cp + 0x20;
  }
  // Cyrillic
  if (cp >= 0x0410 && cp <= 0x042F) {
    return cp + 0x20;
  }
  if (cp >= 0x0400 && cp <= 0x040F) {
    return cp + 0x50;
  }
  return cp;
}

}  // namespace

std::string trim(std::string_view text) {
  const char* whitespace = " \t\n\r\f\v";
  const size_t first = text.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return "";
  }
  const size_t last = text.find_last_not_of(whitespace);
  return std::string(text.substr(first, last - first + 1));
}

std::u32string to_code_points(std::string_view text) {
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::u32string out;
  out.reserve(valid.size());
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(out));
  return out;
}

std::string from_code_points(std::u32string_view code_points) {
  std::string out;
  out.reserve(code_points.size());
  utf8::utf32to8(code_points.begin(), code_points.end(), std::back_inserter(out));
  return out;
}

size_t code_point_length(std::string_view text) {
  return to_code_points(text).size();
}

std::string truncate(std::string_view text, size_t max_code_points) {
  const std::u32string code_points = to_code_points(text);
  if (code_points.size() <= max_code_points) {
    return from_code_points(code_points);
  }
  return from_code_points(std::u32string_view(code_points).substr(0, max_code_points));
}

std::string to_lower(std::string_view text) {
  std::u32string code_points = to_code_points(text);
  for (char32_t& cp : code_points) {
    cp = lower_code_point(cp);
  }
  return from_code_points(code_points);
}

std::vector<std::string> tokenize_words(std::string_view text) {
  std::vector<std::string> words;
  std::u32string current;
  for (char32_t cp : to_code_points(text)) {
    if (is_separator(cp)) {
      if (!current.empty()) {
        words.push_back(from_code_points(current));
        current.clear();
      }
      continue;
    }
    current.push_back(lower_code_point(cp));
  }
  if (!current.empty()) {
    words.push_back(from_code_points(current));
  }
  return words;
}

}  // namespace docmind_core::text
