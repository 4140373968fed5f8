/**
 * @file text_utils.hpp
 * @brief UTF-8 утилиты для очистки пользовательского ввода
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace bdphone {

/**
 * @brief Определяет длину UTF-8 символа по первому байту
 * @param first_byte Первый байт UTF-8 последовательности
 * @return Длина в байтах (1-4), или 0 для невалидного байта
 */
[[nodiscard]] constexpr std::size_t
utf8_char_len(unsigned char first_byte) noexcept {
  if ((first_byte & 0x80) == 0)
    return 1; // ASCII
  if ((first_byte & 0xE0) == 0xC0)
    return 2; // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0)
    return 3; // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0)
    return 4; // 11110xxx
  return 0;   // Invalid
}

/// Байт продолжения UTF-8 (10xxxxxx)
[[nodiscard]] constexpr bool
is_utf8_continuation(unsigned char byte) noexcept {
  return (byte & 0xC0) == 0x80;
}

/**
 * @brief Бенгальская цифра (U+09E6 - U+09EF) -> ASCII
 * @param utf8_char UTF-8 последовательность одного символа
 * @return '0'..'9' или std::nullopt
 */
[[nodiscard]] constexpr std::optional<char>
bengali_digit_to_ascii(std::string_view utf8_char) noexcept {
  // U+09E6 = E0 A7 A6, U+09EF = E0 A7 AF
  if (utf8_char.size() != 3) {
    return std::nullopt;
  }
  const auto b0 = static_cast<unsigned char>(utf8_char[0]);
  const auto b1 = static_cast<unsigned char>(utf8_char[1]);
  const auto b2 = static_cast<unsigned char>(utf8_char[2]);
  if (b0 != 0xE0 || b1 != 0xA7 || b2 < 0xA6 || b2 > 0xAF) {
    return std::nullopt;
  }
  return static_cast<char>('0' + (b2 - 0xA6));
}

/**
 * @brief Оставляет только цифры и один ведущий '+'
 *
 * Бенгальские цифры переводятся в ASCII. Всё остальное (пробелы, дефисы,
 * скобки, буквы) отбрасывается.
 *
 * @param raw Сырой ввод (UTF-8)
 * @return Очищенная строка (возможно пустая) или std::nullopt, если ввод
 *         не является корректной UTF-8 строкой, содержит NUL или длиннее
 *         kMaxRawInputLen
 */
[[nodiscard]] std::optional<std::string> clean_phone_input(std::string_view raw);

/**
 * @brief Нестрогая очистка: те же правила, но без проверки длины и UTF-8
 *
 * Некорректные байты просто пропускаются. Используется там, где ввод
 * частичный (набор с клавиатуры) и отказ недопустим.
 */
[[nodiscard]] std::string filter_phone_chars(std::string_view raw);

/// Сравнение ASCII-строк без учёта регистра
[[nodiscard]] bool iequals_ascii(std::string_view a, std::string_view b) noexcept;

} // namespace bdphone
