/**
 * @file debounced_validator.hpp
 * @brief Отложенная валидация для ввода "на лету"
 *
 * Каждый вызов schedule() отменяет ожидающий таймер и взводит новый:
 * из серии вызовов в пределах задержки callback получает только результат
 * последнего. Таймер: GLib timeout source в указанном GMainContext,
 * callback вызывается в потоке, который итерирует этот контекст.
 */

#pragma once

#include <glib.h>

#include <chrono>
#include <functional>
#include <string>

#include "bdphone/config.hpp"
#include "bdphone/types.hpp"
#include "bdphone/validation_result.hpp"

namespace bdphone {

class DebouncedValidator {
public:
  using Callback = std::function<void(const ValidationResult &)>;

  /**
   * @param delay Задержка debounce, ограничивается диапазоном 0..G_MAXUINT мс
   * @param context Контекст GLib; nullptr = thread-default контекст
   * @param options Опции классификатора
   */
  explicit DebouncedValidator(std::chrono::milliseconds delay,
                              GMainContext *context = nullptr,
                              const ValidationOptions &options = {});
  ~DebouncedValidator();

  // Источник GLib хранит указатель на this
  DebouncedValidator(const DebouncedValidator &) = delete;
  DebouncedValidator &operator=(const DebouncedValidator &) = delete;

  /**
   * @brief Планирует валидацию, отменяя предыдущую ожидающую
   * @param phone Номер для проверки
   * @param callback Получатель результата
   */
  void schedule(std::string phone, Callback callback);

  /// Взведён ли таймер
  [[nodiscard]] bool pending() const noexcept { return source_ != nullptr; }

  [[nodiscard]] std::chrono::milliseconds delay() const noexcept {
    return delay_;
  }

private:
  static gboolean on_timeout(gpointer user_data);

  void cancel_pending() noexcept;

  std::chrono::milliseconds delay_;
  GMainContext *context_ = nullptr;
  ValidationOptions options_;

  GSource *source_ = nullptr;
  std::string pending_phone_;
  Callback pending_callback_;
};

/// Функция-обёртка (phone, callback) над собственным DebouncedValidator
using DebouncedFn =
    std::function<void(std::string, DebouncedValidator::Callback)>;

/**
 * @brief Создаёт debounced-валидатор в виде функции
 *
 * Возвращаемая функция владеет своим экземпляром DebouncedValidator;
 * разные функции не делят таймеры.
 */
[[nodiscard]] DebouncedFn
make_debounced_validator(std::chrono::milliseconds delay,
                         GMainContext *context = nullptr,
                         const ValidationOptions &options = {});

/// Задержка и разрешённые категории берутся из секций debounce и validation
[[nodiscard]] DebouncedFn
make_debounced_validator(const Config &config, GMainContext *context = nullptr);

} // namespace bdphone
