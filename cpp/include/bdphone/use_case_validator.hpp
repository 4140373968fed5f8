/**
 * @file use_case_validator.hpp
 * @brief Политики валидации для конкретных сценариев
 *
 * | сценарий     | стационарные | при успехе                                |
 * |--------------|--------------|-------------------------------------------|
 * | registration | да           | can_receive_sms/otp = (type == mobile)    |
 * | otp, sms     | нет          | стационарный номер -> MOBILE_ONLY          |
 * | verification | да           | is_verifiable = true                      |
 *
 * Классификация не дублируется: слой только сужает ValidationOptions и
 * дополняет результат.
 */

#pragma once

#include <string_view>

#include "bdphone/types.hpp"
#include "bdphone/validation_result.hpp"

namespace bdphone {

/// Опции классификатора для сценария
[[nodiscard]] constexpr ValidationOptions
options_for_use_case(UseCase use_case) noexcept {
  ValidationOptions options;
  options.allow_mobile = true;
  options.allow_special = false;
  options.allow_landline =
      use_case != UseCase::Otp && use_case != UseCase::Sms;
  return options;
}

/**
 * @brief Валидирует номер с учётом сценария
 * @param phone Сырой ввод
 * @param use_case Сценарий использования
 */
[[nodiscard]] ValidationResult validate_for_use_case(std::string_view phone,
                                                     UseCase use_case);

} // namespace bdphone
