/**
 * @file formatter.cpp
 * @brief Реализация форматирования
 */

#include "bdphone/formatter.hpp"
#include "bdphone/classifier.hpp"
#include "bdphone/text_utils.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace bdphone {

namespace {

/// Безопасный срез [begin, end), выход за границы обрезается
std::string_view slice(std::string_view sv, std::size_t begin,
                       std::size_t end) noexcept {
  if (begin >= sv.size()) {
    return {};
  }
  end = std::min(end, sv.size());
  return sv.substr(begin, end - begin);
}

/**
 * @brief Разбивает строку на группы указанной длины через пробел
 *
 * Пустые группы (строка короче суммы длин) не выводятся. Последняя
 * группа ограничена своей длиной, лишние символы отбрасываются.
 */
template <std::size_t N>
std::string group_digits(std::string_view digits,
                         const std::array<std::size_t, N> &sizes) {
  std::string out;
  std::size_t pos = 0;
  for (std::size_t size : sizes) {
    std::string_view part = slice(digits, pos, pos + size);
    if (part.empty()) {
      break;
    }
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(part);
    pos += size;
  }
  return out;
}

constexpr std::array<std::size_t, 3> kMobileGroups = {3, 3, 4};
constexpr std::array<std::size_t, 3> kLandlineGroups = {2, 4, 4};
constexpr std::array<std::size_t, 3> kLocalMobileGroups = {4, 3, 4};

std::string display_form(const ValidPhone &phone) {
  if (phone.type == PhoneType::Special) {
    return phone.normalized_phone;
  }

  // После "+880" идёт национальный номер
  std::string_view national =
      std::string_view{phone.normalized_phone}.substr(kCountryCode.size());

  std::string out{kCountryCode};
  out.push_back(' ');
  out += phone.type == PhoneType::Mobile
             ? group_digits(national, kMobileGroups)
             : group_digits(national, kLandlineGroups);
  return out;
}

} // namespace

std::string format(std::string_view phone, FormatMode mode,
                   const ValidationOptions &options) {
  const ValidationResult result = validate(phone, options);
  if (!result.is_valid()) {
    return std::string{phone};
  }

  const ValidPhone &valid = result.valid();
  switch (mode) {
  case FormatMode::International:
    return valid.normalized_phone;
  case FormatMode::Local:
    return valid.metadata.number_without_country;
  case FormatMode::Display:
    return display_form(valid);
  }
  return valid.normalized_phone;
}

std::string format_live_input(std::string_view partial) {
  std::string cleaned = filter_phone_chars(partial);
  if (cleaned.size() > kMaxLiveInputLen) {
    cleaned.resize(kMaxLiveInputLen);
  }

  if (cleaned.starts_with(kCountryCode)) {
    if (cleaned.size() == kCountryCode.size()) {
      // Только "+880": ждём следующих цифр
      return cleaned;
    }
    std::string_view rest = std::string_view{cleaned}.substr(kCountryCode.size());
    std::string out{kCountryCode};
    out.push_back(' ');
    out += group_digits(rest, kMobileGroups);
    return out;
  }

  if (cleaned.starts_with("01") && cleaned.size() <= 11) {
    return group_digits(cleaned, kLocalMobileGroups);
  }

  return cleaned;
}

} // namespace bdphone
