/**
 * @file classifier.cpp
 * @brief Реализация классификатора номеров
 *
 * Вместо перебора шести регулярных выражений номер раскладывается на
 * формат (префикс страны/транк) и национальную часть, после чего каждая
 * категория проверяет национальную часть одним параметризованным правилом:
 *   мобильный:     1XNNNNNNNN       (10 цифр, оператор = 01X)
 *   стационарный:  <код города><абонент>, всего 9 цифр, абонент не с нуля
 */

#include "bdphone/classifier.hpp"
#include "bdphone/text_utils.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace bdphone {

namespace {

bool all_digits(std::string_view sv) noexcept {
  return !sv.empty() && std::all_of(sv.begin(), sv.end(), is_ascii_digit);
}

/// Валидный номер с каноническим видом +880<national>
ValidPhone make_national_phone(PhoneType type, PhoneFormat format,
                               std::string_view national) {
  ValidPhone phone;
  phone.type = type;
  phone.format = format;
  phone.normalized_phone.reserve(kCountryCode.size() + national.size());
  phone.normalized_phone.append(kCountryCode);
  phone.normalized_phone.append(national);

  phone.metadata.length = phone.normalized_phone.size();
  phone.metadata.country_code = kCountryCode;
  // "+8801712345678" -> "01712345678"
  phone.metadata.number_without_country = phone.normalized_phone.substr(3);
  return phone;
}

} // namespace

// ===========================================================================
// Формат
// ===========================================================================

PhoneFormat detect_format(std::string_view cleaned) noexcept {
  if (cleaned.starts_with(kCountryCode)) {
    return PhoneFormat::International;
  }
  if (cleaned.starts_with(kCountryDigits)) {
    return PhoneFormat::CountryCode;
  }
  if (cleaned.starts_with('0')) {
    return PhoneFormat::Local;
  }
  return PhoneFormat::Unknown;
}

std::string_view national_number(std::string_view cleaned,
                                 PhoneFormat format) noexcept {
  switch (format) {
  case PhoneFormat::International:
    return cleaned.substr(kCountryCode.size());
  case PhoneFormat::CountryCode:
    return cleaned.substr(kCountryDigits.size());
  case PhoneFormat::Local:
    return cleaned.substr(1);
  case PhoneFormat::Unknown:
    break;
  }
  return {};
}

// ===========================================================================
// Classifier
// ===========================================================================

ValidationResult Classifier::classify(std::string_view cleaned,
                                      const ValidationOptions &options) const {
  if (cleaned.empty() || cleaned == "+") {
    return make_error(ErrorCode::EmptyPhone);
  }

  if (options.allow_special) {
    if (auto special = match_special(cleaned)) {
      return std::move(*special);
    }
  }

  const PhoneFormat format = detect_format(cleaned);
  const std::string_view national = national_number(cleaned, format);

  if (options.allow_mobile) {
    // Совпадение или терминальная ошибка (UNSUPPORTED_OPERATOR)
    if (auto mobile = match_mobile(format, national)) {
      return std::move(*mobile);
    }
  }

  if (options.allow_landline) {
    if (auto landline = match_landline(format, national)) {
      return std::move(*landline);
    }
  }

  const ErrorCode code = closest_error(format, national, options);
  if (code != ErrorCode::InvalidSpecialFormat) {
    return make_error(code, true);
  }

  // Для спецномеров примеры берутся из их категорий
  InvalidPhone err = make_error(code);
  for (const auto &category : registry_->special_categories()) {
    err.examples.insert(err.examples.end(), category.examples.begin(),
                        category.examples.end());
  }
  return err;
}

ValidationResult Classifier::validate(std::string_view raw,
                                      const ValidationOptions &options) const {
  if (raw.empty()) {
    return make_error(ErrorCode::InvalidInput);
  }

  auto cleaned = clean_phone_input(raw);
  if (!cleaned) {
    return make_error(ErrorCode::InvalidInput);
  }

  ValidationResult result = classify(*cleaned, options);
  if (result.is_valid()) {
    result.valid().original_phone = std::string{raw};
  }
  return result;
}

std::optional<ValidationResult>
Classifier::match_special(std::string_view cleaned) const {
  const SpecialCategory *category = registry_->match_special(cleaned);
  if (!category) {
    return std::nullopt;
  }

  ValidPhone phone;
  phone.type = PhoneType::Special;
  phone.format = PhoneFormat::Unknown;
  phone.normalized_phone = std::string{cleaned};
  phone.special = category;
  phone.metadata.length = cleaned.size();
  phone.metadata.number_without_country = std::string{cleaned};
  return ValidationResult{std::move(phone)};
}

std::optional<ValidationResult>
Classifier::match_mobile(PhoneFormat format, std::string_view national) const {
  if (format == PhoneFormat::Unknown || national.size() != kMobileNationalLen ||
      national.front() != '1' || !all_digits(national)) {
    return std::nullopt;
  }

  // Префикс оператора хранится в локальном виде: "0" + "17"
  std::string prefix{"0"};
  prefix.append(national.substr(0, 2));

  const OperatorInfo *op = registry_->find_operator(prefix);
  if (!op) {
    InvalidPhone err = make_error(ErrorCode::UnsupportedOperator);
    err.supported_operators = registry_->operator_names();
    return ValidationResult{std::move(err)};
  }

  ValidPhone phone = make_national_phone(PhoneType::Mobile, format, national);
  phone.operator_info = op;
  return ValidationResult{std::move(phone)};
}

std::optional<ValidationResult>
Classifier::match_landline(PhoneFormat format,
                           std::string_view national) const {
  if (format == PhoneFormat::Unknown ||
      national.size() != kLandlineNationalLen || !all_digits(national)) {
    return std::nullopt;
  }

  const AreaInfo *area = registry_->match_area(national);
  if (!area) {
    return std::nullopt;
  }

  // Номер абонента не может начинаться с нуля
  const std::string_view subscriber = national.substr(area->code.size() - 1);
  if (subscriber.empty() || subscriber.front() == '0') {
    return std::nullopt;
  }

  ValidPhone phone = make_national_phone(PhoneType::Landline, format, national);
  phone.area = area;
  return ValidationResult{std::move(phone)};
}

ErrorCode
Classifier::closest_error(PhoneFormat format, std::string_view national,
                          const ValidationOptions &options) const noexcept {
  if (options.allow_special && !options.allow_mobile &&
      !options.allow_landline) {
    return ErrorCode::InvalidSpecialFormat;
  }

  if (format == PhoneFormat::Unknown || national.empty()) {
    return ErrorCode::InvalidFormat;
  }

  if (national.front() == '1') {
    return options.allow_mobile ? ErrorCode::InvalidMobileFormat
                                : ErrorCode::InvalidFormat;
  }

  return options.allow_landline ? ErrorCode::InvalidLandlineFormat
                                : ErrorCode::InvalidFormat;
}

// ===========================================================================
// Свободные функции
// ===========================================================================

ValidationResult validate(std::string_view phone,
                          const ValidationOptions &options) {
  static const Classifier classifier;
  return classifier.validate(phone, options);
}

std::span<const OperatorInfo> get_supported_operators() {
  return PatternRegistry::instance().operators();
}

std::span<const AreaInfo> get_supported_landline_areas() {
  return PatternRegistry::instance().areas();
}

const OperatorInfo *get_operator_info(std::string_view phone) {
  const ValidationResult result = validate(phone);
  if (!result.is_valid() || result.valid().type != PhoneType::Mobile) {
    return nullptr;
  }
  return result.valid().operator_info;
}

bool is_operator(std::string_view phone, std::string_view operator_name) {
  const OperatorInfo *op = get_operator_info(phone);
  return op != nullptr && iequals_ascii(op->name, operator_name);
}

} // namespace bdphone
