/**
 * @file pattern_registry.hpp
 * @brief Справочник нумерации Бангладеш: операторы, коды городов, спецномера
 *
 * Неизменяемые таблицы, построенные один раз при первом обращении.
 * Реестр гарантирует, что мобильные префиксы и коды городов не пересекаются
 * (ни один код не является префиксом другого).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bdphone/localization.hpp"
#include "bdphone/types.hpp"

namespace bdphone {

// ===========================================================================
// Записи таблиц
// ===========================================================================

/// Мобильный оператор (по 3-значному префиксу 01X)
struct OperatorInfo {
  std::string_view prefix;  // "017"
  std::string_view name;    // "Grameenphone"
  std::string_view name_bn; // "গ্রামীণফোন"
  std::string_view network; // "2G/3G/4G/5G"
  std::string_view brand_color;
  std::string_view logo;
};

/// Код города стационарной сети (2 или 3 цифры, с ведущим нулём)
struct AreaInfo {
  std::string_view code; // "02", "031"
  std::string_view area;
  std::string_view area_bn;
  std::string_view region;
  std::string_view region_bn;
};

/**
 * @brief Шаблон спецномера: фиксированный префикс + точная длина
 *
 * Заменяет набор регулярных выражений вида ^800\d{7}$ одним
 * параметризованным сопоставителем.
 */
struct DigitPattern {
  std::string_view prefix;
  std::size_t length = 0;

  [[nodiscard]] bool matches(std::string_view digits) const noexcept;

  /// Регулярное выражение, эквивалентное шаблону (для справки/подсказок)
  [[nodiscard]] std::string to_regex() const;

  /// Могут ли два шаблона совпасть на одной строке
  [[nodiscard]] bool overlaps(const DigitPattern &other) const noexcept;
};

/// Категория спецномера (порядок значений = порядок проверки)
enum class SpecialKind : std::uint8_t { Emergency, TollFree, Premium, Corporate };

[[nodiscard]] constexpr std::string_view
special_kind_to_string(SpecialKind kind) noexcept {
  switch (kind) {
  case SpecialKind::Emergency:
    return "emergency";
  case SpecialKind::TollFree:
    return "toll_free";
  case SpecialKind::Premium:
    return "premium";
  case SpecialKind::Corporate:
    return "corporate";
  }
  return "emergency";
}

struct SpecialCategory {
  SpecialKind kind = SpecialKind::Emergency;
  std::span<const DigitPattern> patterns;
  MessageId description = MessageId::DescEmergency;
  std::span<const std::string_view> examples;

  [[nodiscard]] std::string_view name() const noexcept {
    return special_kind_to_string(kind);
  }

  [[nodiscard]] std::string_view
  description_text(Language lang) const noexcept {
    return localize(description, lang);
  }

  [[nodiscard]] bool matches(std::string_view digits) const noexcept;
};

// ===========================================================================
// Реестр
// ===========================================================================

class PatternRegistry {
public:
  /// Единственный экземпляр (инициализируется потокобезопасно)
  [[nodiscard]] static const PatternRegistry &instance();

  PatternRegistry(const PatternRegistry &) = delete;
  PatternRegistry &operator=(const PatternRegistry &) = delete;

  [[nodiscard]] std::span<const OperatorInfo> operators() const noexcept;
  [[nodiscard]] std::span<const AreaInfo> areas() const noexcept;
  [[nodiscard]] std::span<const SpecialCategory>
  special_categories() const noexcept;

  /**
   * @brief Ищет оператора по 3-значному префиксу ("017")
   * @return Указатель на запись или nullptr
   */
  [[nodiscard]] const OperatorInfo *
  find_operator(std::string_view prefix) const noexcept;

  /// Ищет район по точному коду ("02", "031")
  [[nodiscard]] const AreaInfo *find_area(std::string_view code) const noexcept;

  /**
   * @brief Определяет код города по национальному номеру (без транк-нуля)
   *
   * "212345678" -> "02", "311234567" -> "031".
   */
  [[nodiscard]] const AreaInfo *
  match_area(std::string_view national) const noexcept;

  /// Первая категория спецномеров, чьи шаблоны совпали с цифрами
  [[nodiscard]] const SpecialCategory *
  match_special(std::string_view digits) const noexcept;

  /// Уникальные имена операторов в порядке первого появления
  [[nodiscard]] std::vector<std::string_view> operator_names() const;

  /// "013|014|...|019"
  [[nodiscard]] std::string mobile_prefix_alternation() const;

  /// "02|031|...|091"
  [[nodiscard]] std::string area_code_alternation() const;

  /// "999|100|101|102" для экстренных, "800\d{7}" для toll-free и т.д.
  [[nodiscard]] std::string special_pattern_alternation(SpecialKind kind) const;

  [[nodiscard]] std::span<const MessageId> format_hints() const noexcept;
  [[nodiscard]] std::span<const std::string_view>
  mobile_examples() const noexcept;
  [[nodiscard]] std::span<const std::string_view>
  landline_examples() const noexcept;

  /**
   * @brief Проверяет инварианты таблиц
   *
   * - префиксы операторов уникальны, имеют вид 01X;
   * - коды городов начинаются с 0, не начинаются с 01 и образуют
   *   префиксный код (ни один не является префиксом другого);
   * - ровно один 2-значный код города;
   * - шаблоны разных категорий спецномеров не пересекаются.
   */
  [[nodiscard]] bool is_consistent() const;

private:
  PatternRegistry();
};

} // namespace bdphone
