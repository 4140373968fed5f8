/**
 * @file validation_result.cpp
 * @brief Сборка ошибок валидации
 */

#include "bdphone/validation_result.hpp"

namespace bdphone {

InvalidPhone make_error(ErrorCode code, bool with_hints) {
  const LocalizedText &text = localized(message_for(code));

  InvalidPhone err;
  err.code = code;
  err.message = text.en;
  err.message_bn = text.bn;

  if (with_hints) {
    const auto &registry = PatternRegistry::instance();
    for (MessageId hint : registry.format_hints()) {
      err.suggestions.push_back(localized(hint));
    }
    const auto mobile = registry.mobile_examples();
    const auto landline = registry.landline_examples();
    err.examples.assign(mobile.begin(), mobile.end());
    err.examples.insert(err.examples.end(), landline.begin(), landline.end());
  }

  return err;
}

} // namespace bdphone
