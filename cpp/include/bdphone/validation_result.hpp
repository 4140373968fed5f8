/**
 * @file validation_result.hpp
 * @brief Результат валидации: Valid | Invalid
 *
 * Ошибки валидации являются штатным результатом, а не исключением. Все тексты
 * ссылаются на статические таблицы и доступны на обоих языках.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "bdphone/localization.hpp"
#include "bdphone/pattern_registry.hpp"
#include "bdphone/types.hpp"

namespace bdphone {

struct PhoneMetadata {
  std::size_t length = 0;
  std::string_view country_code; // "+880", пусто для спецномеров
  std::string number_without_country;
};

/// Дополнительные гарантии, выставляемые валидатором сценариев
struct UseCaseFlags {
  bool can_receive_sms = false;
  bool can_receive_otp = false;
  bool requires_verification = false;
  bool is_verifiable = false;
};

struct ValidPhone {
  PhoneType type = PhoneType::Mobile;
  PhoneFormat format = PhoneFormat::Unknown;
  std::string normalized_phone;
  std::string original_phone;

  // Ровно одно из полей заполнено в зависимости от type
  const OperatorInfo *operator_info = nullptr;
  const AreaInfo *area = nullptr;
  const SpecialCategory *special = nullptr;

  PhoneMetadata metadata;
  std::optional<UseCaseFlags> use_case;
};

struct InvalidPhone {
  ErrorCode code = ErrorCode::InvalidFormat;
  std::string_view message;
  std::string_view message_bn;

  std::vector<LocalizedText> suggestions;
  std::vector<std::string_view> examples;
  std::vector<std::string_view> supported_operators;

  [[nodiscard]] std::string_view text(Language lang) const noexcept {
    return lang == Language::Bengali ? message_bn : message;
  }
};

class ValidationResult {
public:
  ValidationResult(ValidPhone phone) : value_{std::move(phone)} {}
  ValidationResult(InvalidPhone error) : value_{std::move(error)} {}

  [[nodiscard]] bool is_valid() const noexcept {
    return std::holds_alternative<ValidPhone>(value_);
  }

  /// Доступ к успешному результату (только если is_valid())
  [[nodiscard]] const ValidPhone &valid() const {
    return std::get<ValidPhone>(value_);
  }
  [[nodiscard]] ValidPhone &valid() { return std::get<ValidPhone>(value_); }

  /// Доступ к ошибке (только если !is_valid())
  [[nodiscard]] const InvalidPhone &invalid() const {
    return std::get<InvalidPhone>(value_);
  }

  [[nodiscard]] std::optional<ErrorCode> error_code() const noexcept {
    if (const auto *err = std::get_if<InvalidPhone>(&value_)) {
      return err->code;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::optional<PhoneType> type() const noexcept {
    if (const auto *ok = std::get_if<ValidPhone>(&value_)) {
      return ok->type;
    }
    return std::nullopt;
  }

  [[nodiscard]] const std::variant<ValidPhone, InvalidPhone> &
  value() const noexcept {
    return value_;
  }

private:
  std::variant<ValidPhone, InvalidPhone> value_;
};

/**
 * @brief Собирает ошибку с текстами из таблицы локализации
 * @param code Код ошибки
 * @param with_hints Добавить подсказки по формату и примеры из реестра
 */
[[nodiscard]] InvalidPhone make_error(ErrorCode code, bool with_hints = false);

} // namespace bdphone
