/**
 * @file statistics.cpp
 * @brief Подсчёт статистики валидации
 */

#include "bdphone/statistics.hpp"
#include "bdphone/classifier.hpp"

namespace bdphone {

namespace {

void count_format(FormatCounts &formats, PhoneFormat format) noexcept {
  switch (format) {
  case PhoneFormat::International:
    ++formats.international;
    break;
  case PhoneFormat::CountryCode:
    ++formats.country_code;
    break;
  case PhoneFormat::Local:
    ++formats.local;
    break;
  case PhoneFormat::Unknown:
    ++formats.unknown;
    break;
  }
}

void accumulate(ValidationStats &stats, std::string_view phone,
                const ValidationOptions &options) {
  const ValidationResult result = validate(phone, options);
  if (!result.is_valid()) {
    ++stats.invalid;
    return;
  }

  ++stats.valid;
  const ValidPhone &valid = result.valid();
  count_format(stats.formats, valid.format);

  switch (valid.type) {
  case PhoneType::Mobile:
    ++stats.mobile;
    if (valid.operator_info) {
      ++stats.operators[std::string{valid.operator_info->name}];
    }
    break;
  case PhoneType::Landline:
    ++stats.landline;
    if (valid.area) {
      ++stats.areas[std::string{valid.area->code}];
    }
    break;
  case PhoneType::Special:
    ++stats.special;
    break;
  }
}

template <class Range>
ValidationStats fold(const Range &phones, const ValidationOptions &options) {
  ValidationStats stats;
  stats.total = phones.size();
  for (const auto &phone : phones) {
    accumulate(stats, phone, options);
  }
  return stats;
}

} // namespace

ValidationStats generate_validation_stats(std::span<const std::string> phones,
                                          const ValidationOptions &options) {
  return fold(phones, options);
}

ValidationStats
generate_validation_stats(std::span<const std::string_view> phones,
                          const ValidationOptions &options) {
  return fold(phones, options);
}

} // namespace bdphone
