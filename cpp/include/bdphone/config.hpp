/**
 * @file config.hpp
 * @brief Конфигурация bdphone
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "bdphone/types.hpp"

namespace bdphone {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Настройки отложенной валидации (поле ввода)
struct DebounceConfig {
  std::chrono::milliseconds delay{300};
};

/// Настройки вывода CLI
struct OutputConfig {
  Language language = Language::English;
  FormatMode format = FormatMode::Display;
};

/// Полная конфигурация
struct Config {
  ValidationOptions validation;
  DebounceConfig debounce;
  OutputConfig output;
  std::filesystem::path config_path{"/etc/bdphone/config.yaml"};
};

/// Верхняя граница задержки debounce
inline constexpr std::chrono::milliseconds kMaxDebounceDelay{10000};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию из YAML файла (best-effort)
 *
 * @param path Путь к конфигурационному файлу
 * @return Config с загруженными или дефолтными значениями
 *
 * Best-effort поведение: при ошибках чтения/валидации возвращает дефолты.
 * Для пути по умолчанию сначала пробуется ~/.config/bdphone/config.yaml.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Разбирает конфигурацию из потока
 *
 * Неизвестные ключи игнорируются, некорректные значения дают ParseError.
 */
[[nodiscard]] ConfigLoadOutcome parse_config(std::istream &in);

/**
 * @brief Парсит значение задержки из строки
 *
 * @param value Строка с числом (миллисекунды)
 * @return Значение или std::nullopt
 */
[[nodiscard]] std::optional<std::chrono::milliseconds>
parse_delay_ms(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @return true если разрешена хотя бы одна категория и задержка в пределах
 *         1..kMaxDebounceDelay
 */
[[nodiscard]] bool validate_config(const Config &config);

} // namespace bdphone
