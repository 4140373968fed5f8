/**
 * @file formatter.hpp
 * @brief Отображение номеров и маска для поля ввода
 *
 * Функции форматирования никогда не бросают исключений: невалидный номер
 * возвращается как есть, чтобы UI не падал на плохом вводе.
 */

#pragma once

#include <string>
#include <string_view>

#include "bdphone/types.hpp"

namespace bdphone {

/**
 * @brief Форматирует номер
 * @param phone Сырой ввод
 * @param mode International (= normalize), Local (0XXXXXXXXXX),
 *             Display (+880 XXX XXX XXXX / +880 XX XXXX XXXX)
 * @return Отформатированный номер или исходная строка, если номер невалиден
 */
[[nodiscard]] std::string format(std::string_view phone,
                                 FormatMode mode = FormatMode::Display,
                                 const ValidationOptions &options = {});

/**
 * @brief Маска для поля ввода, вызывается на каждое нажатие клавиши
 *
 * Чистая функция текущего частичного ввода: разделители вставляются по
 * мере набора, полный валидный номер не требуется. Ввод обрезается до
 * kMaxLiveInputLen символов после очистки.
 *
 * "+8801712"     -> "+880 171 2"
 * "0171234"      -> "0171 234"
 * "01712345678"  -> "0171 234 5678"
 */
[[nodiscard]] std::string format_live_input(std::string_view partial);

} // namespace bdphone
