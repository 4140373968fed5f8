/**
 * @file main.cpp
 * @brief Точка входа bdphone
 *
 * Валидатор телефонных номеров Бангладеш (C++20 версия)
 *
 * Запуск: bdphone [опции] [номер...]
 * Без номеров в аргументах читает по одному номеру на строку из stdin.
 */

#include "bdphone/classifier.hpp"
#include "bdphone/config.hpp"
#include "bdphone/formatter.hpp"
#include "bdphone/statistics.hpp"
#include "bdphone/use_case_validator.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitUsage = 2;

/// Опции командной строки поверх конфигурации
struct CliOptions {
  std::string config_path{bdphone::kConfigPath};
  std::optional<bdphone::UseCase> use_case;
  std::optional<bdphone::FormatMode> format;
  std::optional<bdphone::Language> language;
  bool stats = false;
  bool live = false;
  bool list_operators = false;
  bool list_areas = false;
  bool allow_special = false;
  bool no_landline = false;
  std::vector<std::string> phones;
};

void print_version() {
  std::cout << "bdphone 1.0.0 (C++20)\n"
            << "Валидатор телефонных номеров Бангладеш\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции] [номер...]\n"
            << "\n"
            << "Опции:\n"
            << "  -h, --help           Показать эту справку\n"
            << "  -v, --version        Показать версию\n"
            << "  -c, --config PATH    Путь к конфигурации\n"
            << "  --use-case NAME      registration | otp | sms | verification\n"
            << "  --format MODE        international | local | display\n"
            << "  --lang LANG          en | bn\n"
            << "  --stats              Вывести сводную статистику\n"
            << "  --live               Форматировать ввод по мере набора\n"
            << "  --operators          Список операторов\n"
            << "  --areas              Список кодов городов\n"
            << "  --allow-special      Разрешить спецномера (999, 800...)\n"
            << "  --no-landline        Запретить стационарные номера\n"
            << "\n"
            << "--use-case задаёт категории сам: секция validation конфига\n"
            << "не применяется, а --allow-special, --no-landline и --stats\n"
            << "с ним несовместимы.\n"
            << "\n"
            << "Без номеров читает по одному номеру на строку из stdin.\n"
            << "Код возврата: 0 все номера валидны, 1 есть невалидные,\n"
            << "2 ошибка в аргументах.\n"
            << "\n"
            << "Конфигурация: " << bdphone::kConfigPath << "\n";
}

/// Разбор аргументов. nullopt = ошибка использования (уже выведена).
std::optional<CliOptions> parse_args(int argc, char *argv[]) {
  CliOptions cli;

  auto next_value = [&](int &i, std::string_view flag) -> const char * {
    if (i + 1 >= argc) {
      std::cerr << "[bdphone] Error: " << flag << " requires a value\n";
      return nullptr;
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      const char *value = next_value(i, arg);
      if (!value) {
        return std::nullopt;
      }
      cli.config_path = value;
    } else if (arg == "--use-case") {
      const char *value = next_value(i, arg);
      if (!value) {
        return std::nullopt;
      }
      cli.use_case = bdphone::parse_use_case(value);
      if (!cli.use_case) {
        std::cerr << "[bdphone] Error: unknown use case: " << value << "\n";
        return std::nullopt;
      }
    } else if (arg == "--format") {
      const char *value = next_value(i, arg);
      if (!value) {
        return std::nullopt;
      }
      cli.format = bdphone::parse_format_mode(value);
      if (!cli.format) {
        std::cerr << "[bdphone] Error: unknown format: " << value << "\n";
        return std::nullopt;
      }
    } else if (arg == "--lang") {
      const char *value = next_value(i, arg);
      if (!value) {
        return std::nullopt;
      }
      cli.language = bdphone::parse_language(value);
      if (!cli.language) {
        std::cerr << "[bdphone] Error: unknown language: " << value << "\n";
        return std::nullopt;
      }
    } else if (arg == "--stats") {
      cli.stats = true;
    } else if (arg == "--live") {
      cli.live = true;
    } else if (arg == "--operators") {
      cli.list_operators = true;
    } else if (arg == "--areas") {
      cli.list_areas = true;
    } else if (arg == "--allow-special") {
      cli.allow_special = true;
    } else if (arg == "--no-landline") {
      cli.no_landline = true;
    } else if (arg.size() > 1 && arg.front() == '-' &&
               !bdphone::is_ascii_digit(arg[1])) {
      std::cerr << "[bdphone] Error: unknown option: " << arg << "\n";
      return std::nullopt;
    } else {
      cli.phones.emplace_back(arg);
    }
  }

  // Сценарий задаёт категории сам, статистика считается без сценария
  if (cli.use_case && (cli.allow_special || cli.no_landline)) {
    std::cerr << "[bdphone] Error: --use-case cannot be combined with "
                 "--allow-special or --no-landline\n";
    return std::nullopt;
  }
  if (cli.use_case && cli.stats) {
    std::cerr << "[bdphone] Error: --use-case cannot be combined with "
                 "--stats\n";
    return std::nullopt;
  }

  return cli;
}

void print_operators(bdphone::Language lang) {
  for (const auto &op : bdphone::get_supported_operators()) {
    std::cout << op.prefix << '\t'
              << (lang == bdphone::Language::Bengali ? op.name_bn : op.name)
              << '\t' << op.network << '\n';
  }
}

void print_areas(bdphone::Language lang) {
  const bool bn = lang == bdphone::Language::Bengali;
  for (const auto &area : bdphone::get_supported_landline_areas()) {
    std::cout << area.code << '\t' << (bn ? area.area_bn : area.area) << '\t'
              << (bn ? area.region_bn : area.region) << '\n';
  }
}

/// Описание валидного номера: оператор, город или категория спецномера
std::string_view describe(const bdphone::ValidPhone &phone,
                          bdphone::Language lang) {
  const bool bn = lang == bdphone::Language::Bengali;
  if (phone.operator_info) {
    return bn ? phone.operator_info->name_bn : phone.operator_info->name;
  }
  if (phone.area) {
    return bn ? phone.area->area_bn : phone.area->area;
  }
  if (phone.special) {
    return phone.special->description_text(lang);
  }
  return {};
}

/// Проверяет и печатает один номер. Возвращает true если номер валиден.
bool report_phone(std::string_view phone, const bdphone::Config &config,
                  const std::optional<bdphone::UseCase> &use_case) {
  const bdphone::ValidationResult result =
      use_case ? bdphone::validate_for_use_case(phone, *use_case)
               : bdphone::validate(phone, config.validation);

  if (!result.is_valid()) {
    const bdphone::InvalidPhone &err = result.invalid();
    std::cout << phone << "\tINVALID\t" << bdphone::error_code_to_string(err.code)
              << '\t' << err.text(config.output.language) << '\n';
    return false;
  }

  const bdphone::ValidPhone &valid = result.valid();
  const bdphone::ValidationOptions &options =
      use_case ? bdphone::options_for_use_case(*use_case) : config.validation;
  std::cout << phone << '\t'
            << bdphone::format(phone, config.output.format, options) << '\t'
            << bdphone::phone_type_to_string(valid.type) << '\t'
            << describe(valid, config.output.language) << '\n';
  return true;
}

void print_stats(const bdphone::ValidationStats &stats) {
  std::cout << "total: " << stats.total << '\n'
            << "valid: " << stats.valid << '\n'
            << "invalid: " << stats.invalid << '\n'
            << "mobile: " << stats.mobile << '\n'
            << "landline: " << stats.landline << '\n'
            << "special: " << stats.special << '\n';

  for (const auto &[name, count] : stats.operators) {
    std::cout << "operator " << name << ": " << count << '\n';
  }
  for (const auto &[code, count] : stats.areas) {
    std::cout << "area " << code << ": " << count << '\n';
  }

  std::cout << "format international: " << stats.formats.international << '\n'
            << "format country_code: " << stats.formats.country_code << '\n'
            << "format local: " << stats.formats.local << '\n'
            << "format unknown: " << stats.formats.unknown << '\n';
}

} // namespace

int main(int argc, char *argv[]) {
  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return kExitOk;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return kExitOk;
    }
  }

  auto cli = parse_args(argc, argv);
  if (!cli) {
    print_usage(argv[0]);
    return kExitUsage;
  }

  // Загрузка конфигурации
  bdphone::Config config = bdphone::load_config(cli->config_path);
  if (cli->format) {
    config.output.format = *cli->format;
  }
  if (cli->language) {
    config.output.language = *cli->language;
  }
  if (cli->allow_special) {
    config.validation.allow_special = true;
  }
  if (cli->no_landline) {
    config.validation.allow_landline = false;
  }
  if (!config.validation.any_allowed()) {
    std::cerr << "[bdphone] Error: no phone category is allowed\n";
    return kExitUsage;
  }

  if (cli->list_operators || cli->list_areas) {
    if (cli->list_operators) {
      print_operators(config.output.language);
    }
    if (cli->list_areas) {
      print_areas(config.output.language);
    }
    return kExitOk;
  }

  std::vector<std::string> phones = std::move(cli->phones);
  if (phones.empty()) {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (!line.empty()) {
        phones.push_back(std::move(line));
      }
    }
  }

  if (cli->live) {
    for (const auto &phone : phones) {
      std::cout << bdphone::format_live_input(phone) << '\n';
    }
    return kExitOk;
  }

  if (cli->stats) {
    const auto stats = bdphone::generate_validation_stats(
        std::span<const std::string>{phones}, config.validation);
    print_stats(stats);
    return stats.invalid == 0 ? kExitOk : kExitInvalid;
  }

  bool all_valid = true;
  for (const auto &phone : phones) {
    if (!report_phone(phone, config, cli->use_case)) {
      all_valid = false;
    }
  }

  return all_valid ? kExitOk : kExitInvalid;
}
