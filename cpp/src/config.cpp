/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "bdphone/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace bdphone {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Отрезает комментарий "# ..." в конце строки
std::string_view strip_comment(std::string_view sv) {
  auto pos = sv.find('#');
  if (pos != std::string_view::npos) {
    sv = sv.substr(0, pos);
  }
  return sv;
}

/// Снимает кавычки вокруг значения ("bn" / 'bn')
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    return sv.substr(1, sv.size() - 2);
  }
  return sv;
}

/// Парсит целое число из строки
std::optional<int> parse_int(std::string_view sv) {
  sv = trim(sv);
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Получает путь к user config (~/.config/bdphone/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

/// Применяет пару key: value к секции. false = значение не распознано.
bool apply_value(Config &config, std::string_view section,
                 std::string_view key, std::string_view value) {
  if (section == "validation") {
    auto flag = parse_bool(value);
    if (key == "allow_landline") {
      return flag && (config.validation.allow_landline = *flag, true);
    }
    if (key == "allow_mobile") {
      return flag && (config.validation.allow_mobile = *flag, true);
    }
    if (key == "allow_special") {
      return flag && (config.validation.allow_special = *flag, true);
    }
  } else if (section == "debounce") {
    if (key == "delay_ms") {
      auto delay = parse_delay_ms(value);
      if (!delay) {
        return false;
      }
      config.debounce.delay = *delay;
    }
  } else if (section == "output") {
    if (key == "language") {
      auto lang = parse_language(value);
      if (!lang) {
        return false;
      }
      config.output.language = *lang;
    } else if (key == "format") {
      auto mode = parse_format_mode(value);
      if (!mode) {
        return false;
      }
      config.output.format = *mode;
    }
  }

  // Неизвестные ключи и секции игнорируются
  return true;
}

} // namespace

std::optional<std::chrono::milliseconds>
parse_delay_ms(std::string_view value) {
  auto ms = parse_int(value);
  if (ms && *ms > 0) {
    return std::chrono::milliseconds{*ms};
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  if (!config.validation.any_allowed()) {
    return false;
  }

  if (config.debounce.delay.count() <= 0 ||
      config.debounce.delay > kMaxDebounceDelay) {
    return false;
  }

  return true;
}

ConfigLoadOutcome parse_config(std::istream &in) {
  ConfigLoadOutcome out;

  std::string line;
  std::string current_section;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string_view sv = trim(strip_comment(line));

    // Пропуск пустых строк и комментариев
    if (sv.empty()) {
      continue;
    }

    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      out.result = ConfigResult::ParseError;
      out.error = "line " + std::to_string(line_no) + ": expected 'key: value'";
      return out;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = unquote(trim(sv.substr(colon_pos + 1)));

    // Определение секции ("validation:" без значения, без отступа)
    const bool indented = std::isspace(static_cast<unsigned char>(line[0]));
    if (value.empty() && !indented) {
      current_section = std::string{key};
      continue;
    }

    if (!apply_value(out.config, current_section, key, value)) {
      out.result = ConfigResult::ParseError;
      out.error = "line " + std::to_string(line_no) + ": invalid value '" +
                  std::string{value} + "' for " + current_section + "." +
                  std::string{key};
      return out;
    }
  }

  out.result = ConfigResult::Ok;
  return out;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  if (path.empty()) {
    ConfigLoadOutcome out;
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{path};
  if (!file.is_open()) {
    ConfigLoadOutcome out;
    out.used_path = std::move(path);
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  ConfigLoadOutcome out = parse_config(file);
  out.used_path = std::move(path);
  if (out.result != ConfigResult::Ok) {
    out.error = out.used_path.string() + ": " + out.error;
    out.config = Config{};
    return out;
  }

  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[bdphone] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result == ConfigResult::FileNotFound && path == kConfigPath) {
    // Отсутствие системного конфига: штатная ситуация
    return Config{};
  }
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый, используем дефолты.
    if (!out.error.empty()) {
      std::cerr << "[bdphone] Warning: " << out.error << "\n";
    }
    return Config{};
  }

  return out.config;
}

} // namespace bdphone
