/**
 * @file types.hpp
 * @brief Базовые типы и константы bdphone
 *
 * Перечисления категорий, форматов и кодов ошибок, общие для всех модулей
 * движка валидации телефонных номеров Бангладеш.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bdphone {

// ===========================================================================
// Константы
// ===========================================================================

/// Код страны в каноническом виде
inline constexpr std::string_view kCountryCode = "+880";

/// Код страны без плюса (формат country_code)
inline constexpr std::string_view kCountryDigits = "880";

/// Длина национального номера мобильного телефона (без транк-нуля)
inline constexpr std::size_t kMobileNationalLen = 10;

/// Длина национального номера стационарного телефона (без транк-нуля)
inline constexpr std::size_t kLandlineNationalLen = 9;

/// Максимальная длина сырого ввода в байтах
inline constexpr std::size_t kMaxRawInputLen = 64;

/// Максимальная длина ввода для live-форматирования (символов после очистки)
inline constexpr std::size_t kMaxLiveInputLen = 15;

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/bdphone/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/bdphone/config.yaml";

// ===========================================================================
// Классификация
// ===========================================================================

/// Категория номера
enum class PhoneType : std::uint8_t { Mobile, Landline, Special };

/// Формат, в котором номер был введён
enum class PhoneFormat : std::uint8_t {
  International, // +880...
  CountryCode,   // 880...
  Local,         // 0...
  Unknown        // без префикса (спецномера)
};

/// Режим отображения номера
enum class FormatMode : std::uint8_t { International, Local, Display };

/// Сценарий использования номера
enum class UseCase : std::uint8_t { Registration, Otp, Sms, Verification };

/// Язык сообщений
enum class Language : std::uint8_t { English, Bengali };

/// Закрытый перечень кодов ошибок валидации
enum class ErrorCode : std::uint8_t {
  InvalidInput,
  EmptyPhone,
  InvalidMobileFormat,
  UnsupportedOperator,
  InvalidLandlineFormat,
  InvalidSpecialFormat,
  InvalidFormat,
  MobileOnly
};

/// Разрешённые категории номеров
struct ValidationOptions {
  bool allow_landline = true;
  bool allow_mobile = true;
  bool allow_special = false;

  constexpr bool operator==(const ValidationOptions &) const noexcept =
      default;

  [[nodiscard]] constexpr bool any_allowed() const noexcept {
    return allow_landline || allow_mobile || allow_special;
  }
};

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

// ===========================================================================
// Строковые представления
// ===========================================================================

[[nodiscard]] constexpr std::string_view
phone_type_to_string(PhoneType type) noexcept {
  switch (type) {
  case PhoneType::Mobile:
    return "mobile";
  case PhoneType::Landline:
    return "landline";
  case PhoneType::Special:
    return "special";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view
phone_format_to_string(PhoneFormat format) noexcept {
  switch (format) {
  case PhoneFormat::International:
    return "international";
  case PhoneFormat::CountryCode:
    return "country_code";
  case PhoneFormat::Local:
    return "local";
  case PhoneFormat::Unknown:
    return "unknown";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view
format_mode_to_string(FormatMode mode) noexcept {
  switch (mode) {
  case FormatMode::International:
    return "international";
  case FormatMode::Local:
    return "local";
  case FormatMode::Display:
    return "display";
  }
  return "display";
}

[[nodiscard]] constexpr std::string_view
use_case_to_string(UseCase use_case) noexcept {
  switch (use_case) {
  case UseCase::Registration:
    return "registration";
  case UseCase::Otp:
    return "otp";
  case UseCase::Sms:
    return "sms";
  case UseCase::Verification:
    return "verification";
  }
  return "registration";
}

/// Стабильный строковый код ошибки (на него могут опираться потребители)
[[nodiscard]] constexpr std::string_view
error_code_to_string(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::InvalidInput:
    return "INVALID_INPUT";
  case ErrorCode::EmptyPhone:
    return "EMPTY_PHONE";
  case ErrorCode::InvalidMobileFormat:
    return "INVALID_MOBILE_FORMAT";
  case ErrorCode::UnsupportedOperator:
    return "UNSUPPORTED_OPERATOR";
  case ErrorCode::InvalidLandlineFormat:
    return "INVALID_LANDLINE_FORMAT";
  case ErrorCode::InvalidSpecialFormat:
    return "INVALID_SPECIAL_FORMAT";
  case ErrorCode::InvalidFormat:
    return "INVALID_FORMAT";
  case ErrorCode::MobileOnly:
    return "MOBILE_ONLY";
  }
  return "INVALID_FORMAT";
}

[[nodiscard]] constexpr std::optional<FormatMode>
parse_format_mode(std::string_view name) noexcept {
  if (name == "international") {
    return FormatMode::International;
  }
  if (name == "local") {
    return FormatMode::Local;
  }
  if (name == "display") {
    return FormatMode::Display;
  }
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<UseCase>
parse_use_case(std::string_view name) noexcept {
  if (name == "registration") {
    return UseCase::Registration;
  }
  if (name == "otp") {
    return UseCase::Otp;
  }
  if (name == "sms") {
    return UseCase::Sms;
  }
  if (name == "verification") {
    return UseCase::Verification;
  }
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<Language>
parse_language(std::string_view name) noexcept {
  if (name == "en" || name == "english") {
    return Language::English;
  }
  if (name == "bn" || name == "bengali" || name == "bangla") {
    return Language::Bengali;
  }
  return std::nullopt;
}

/// Проверка ASCII-цифры
[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

} // namespace bdphone
