/**
 * @file statistics.hpp
 * @brief Сводная статистика по набору номеров
 */

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

#include "bdphone/types.hpp"

namespace bdphone {

struct FormatCounts {
  std::size_t international = 0;
  std::size_t country_code = 0;
  std::size_t local = 0;
  std::size_t unknown = 0;
};

struct ValidationStats {
  std::size_t total = 0;
  std::size_t valid = 0;
  std::size_t invalid = 0;

  std::size_t mobile = 0;
  std::size_t landline = 0;
  std::size_t special = 0;

  /// Имя оператора -> количество
  std::map<std::string, std::size_t, std::less<>> operators;

  /// Код города ("02", "031") -> количество
  std::map<std::string, std::size_t, std::less<>> areas;

  FormatCounts formats;
};

/**
 * @brief Валидирует каждый номер и подсчитывает результаты
 * @param phones Набор номеров (сырой ввод)
 * @param options Разрешённые категории
 */
[[nodiscard]] ValidationStats
generate_validation_stats(std::span<const std::string> phones,
                          const ValidationOptions &options = {});

[[nodiscard]] ValidationStats
generate_validation_stats(std::span<const std::string_view> phones,
                          const ValidationOptions &options = {});

} // namespace bdphone
