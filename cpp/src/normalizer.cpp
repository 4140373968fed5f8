/**
 * @file normalizer.cpp
 * @brief Реализация нормализации
 */

#include "bdphone/normalizer.hpp"
#include "bdphone/classifier.hpp"

#include <utility>

namespace bdphone {

std::optional<std::string> normalize(std::string_view phone,
                                     const ValidationOptions &options) {
  ValidationResult result = validate(phone, options);
  if (!result.is_valid()) {
    return std::nullopt;
  }
  return std::move(result.valid().normalized_phone);
}

bool is_canonical(std::string_view phone, const ValidationOptions &options) {
  auto normalized = normalize(phone, options);
  return normalized.has_value() && *normalized == phone;
}

} // namespace bdphone
