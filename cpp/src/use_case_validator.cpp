/**
 * @file use_case_validator.cpp
 * @brief Реализация политик сценариев
 */

#include "bdphone/use_case_validator.hpp"
#include "bdphone/classifier.hpp"

namespace bdphone {

ValidationResult validate_for_use_case(std::string_view phone,
                                       UseCase use_case) {
  const ValidationOptions options = options_for_use_case(use_case);
  ValidationResult result = validate(phone, options);

  if (!result.is_valid()) {
    if (!options.allow_landline) {
      // Номер отвергнут только потому, что он стационарный?
      ValidationOptions landline_only;
      landline_only.allow_mobile = false;
      landline_only.allow_landline = true;
      if (validate(phone, landline_only).is_valid()) {
        return make_error(ErrorCode::MobileOnly);
      }
    }
    return result;
  }

  ValidPhone &valid = result.valid();
  const bool is_mobile = valid.type == PhoneType::Mobile;

  switch (use_case) {
  case UseCase::Registration: {
    UseCaseFlags flags;
    flags.can_receive_sms = is_mobile;
    flags.can_receive_otp = is_mobile;
    flags.requires_verification = true;
    valid.use_case = flags;
    break;
  }
  case UseCase::Otp:
  case UseCase::Sms:
    if (!is_mobile) {
      return make_error(ErrorCode::MobileOnly);
    }
    break;
  case UseCase::Verification: {
    UseCaseFlags flags;
    flags.is_verifiable = true;
    valid.use_case = flags;
    break;
  }
  }

  return result;
}

} // namespace bdphone
