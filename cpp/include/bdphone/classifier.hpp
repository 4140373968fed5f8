/**
 * @file classifier.hpp
 * @brief Классификатор номеров: спецномер / мобильный / стационарный
 *
 * Порядок проверки фиксирован: спецномера (если разрешены), затем мобильные,
 * затем стационарные. Первое совпадение завершает классификацию.
 */

#pragma once

#include <optional>
#include <span>
#include <string_view>

#include "bdphone/pattern_registry.hpp"
#include "bdphone/types.hpp"
#include "bdphone/validation_result.hpp"

namespace bdphone {

/**
 * @brief Определяет формат очищенного номера по префиксу
 *
 * "+880..." -> International, "880..." -> CountryCode, "0..." -> Local,
 * остальное -> Unknown.
 */
[[nodiscard]] PhoneFormat detect_format(std::string_view cleaned) noexcept;

/**
 * @brief Национальная часть номера (без кода страны и транк-нуля)
 * @return Пустая строка для PhoneFormat::Unknown
 */
[[nodiscard]] std::string_view national_number(std::string_view cleaned,
                                               PhoneFormat format) noexcept;

class Classifier {
public:
  explicit Classifier(
      const PatternRegistry &registry = PatternRegistry::instance())
      : registry_{&registry} {}

  /**
   * @brief Классифицирует уже очищенный номер
   * @param cleaned Цифры и, возможно, ведущий '+'
   * @param options Разрешённые категории
   */
  [[nodiscard]] ValidationResult
  classify(std::string_view cleaned, const ValidationOptions &options) const;

  /**
   * @brief Очищает сырой ввод и классифицирует его
   *
   * Пустой ввод и некорректный UTF-8 -> INVALID_INPUT,
   * ввод без цифр -> EMPTY_PHONE.
   */
  [[nodiscard]] ValidationResult
  validate(std::string_view raw, const ValidationOptions &options = {}) const;

  [[nodiscard]] const PatternRegistry &registry() const noexcept {
    return *registry_;
  }

private:
  [[nodiscard]] std::optional<ValidationResult>
  match_special(std::string_view cleaned) const;

  [[nodiscard]] std::optional<ValidationResult>
  match_mobile(PhoneFormat format, std::string_view national) const;

  [[nodiscard]] std::optional<ValidationResult>
  match_landline(PhoneFormat format, std::string_view national) const;

  [[nodiscard]] ErrorCode
  closest_error(PhoneFormat format, std::string_view national,
                const ValidationOptions &options) const noexcept;

  const PatternRegistry *registry_ = nullptr;
};

/**
 * @brief Основная точка входа: валидация с реестром по умолчанию
 */
[[nodiscard]] ValidationResult
validate(std::string_view phone, const ValidationOptions &options = {});

/// Все поддерживаемые операторы (для справки и выпадающих списков)
[[nodiscard]] std::span<const OperatorInfo> get_supported_operators();

/// Все поддерживаемые коды городов
[[nodiscard]] std::span<const AreaInfo> get_supported_landline_areas();

/**
 * @brief Оператор валидного мобильного номера
 * @return nullptr для невалидных и не мобильных номеров
 */
[[nodiscard]] const OperatorInfo *get_operator_info(std::string_view phone);

/// Принадлежит ли номер оператору (имя сравнивается без учёта регистра)
[[nodiscard]] bool is_operator(std::string_view phone,
                               std::string_view operator_name);

} // namespace bdphone
