/**
 * @file normalizer.hpp
 * @brief Приведение номера к каноническому виду +880XXXXXXXXXX
 *
 * Любые допустимые записи одного и того же номера (01..., 8801..., +8801...)
 * дают байт-в-байт одинаковый результат; канонический вид является
 * неподвижной точкой: normalize(normalize(s)) == normalize(s).
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "bdphone/types.hpp"

namespace bdphone {

/**
 * @brief Нормализует номер
 * @param phone Сырой ввод
 * @param options Разрешённые категории
 * @return Канонический вид или std::nullopt, если номер невалиден
 */
[[nodiscard]] std::optional<std::string>
normalize(std::string_view phone, const ValidationOptions &options = {});

/// Является ли строка уже канонической записью валидного номера
[[nodiscard]] bool is_canonical(std::string_view phone,
                                const ValidationOptions &options = {});

} // namespace bdphone
