/**
 * @file text_utils.cpp
 * @brief Реализация очистки ввода
 */

#include "bdphone/text_utils.hpp"
#include "bdphone/types.hpp"

#include <glib.h>

#include <cctype>

namespace bdphone {

namespace {

/// Длина корректной UTF-8 последовательности в позиции i, 0 если битая
std::size_t valid_char_len(std::string_view raw, std::size_t i) noexcept {
  const std::size_t len = utf8_char_len(static_cast<unsigned char>(raw[i]));
  if (len == 0 || i + len > raw.size()) {
    return 0;
  }
  for (std::size_t k = 1; k < len; ++k) {
    if (!is_utf8_continuation(static_cast<unsigned char>(raw[i + k]))) {
      return 0;
    }
  }
  return len;
}

} // namespace

std::string filter_phone_chars(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());

  std::size_t i = 0;
  while (i < raw.size()) {
    const std::size_t len = valid_char_len(raw, i);
    if (len == 0) {
      ++i;
      continue;
    }

    if (len == 1) {
      const char c = raw[i];
      if (is_ascii_digit(c)) {
        out.push_back(c);
      } else if (c == '+' && out.empty()) {
        // Плюс допустим только как первый значимый символ
        out.push_back(c);
      }
    } else if (auto digit = bengali_digit_to_ascii(raw.substr(i, len))) {
      out.push_back(*digit);
    }

    i += len;
  }

  return out;
}

std::optional<std::string> clean_phone_input(std::string_view raw) {
  if (raw.size() > kMaxRawInputLen) {
    return std::nullopt;
  }

  // Отвергает overlong-формы, суррогаты, > U+10FFFF и NUL внутри строки
  if (!g_utf8_validate(raw.data(), static_cast<gssize>(raw.size()),
                       nullptr)) {
    return std::nullopt;
  }

  return filter_phone_chars(raw);
}

bool iequals_ascii(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace bdphone
