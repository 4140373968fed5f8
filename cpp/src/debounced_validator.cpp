/**
 * @file debounced_validator.cpp
 * @brief Реализация debounce поверх GLib timeout source
 */

#include "bdphone/debounced_validator.hpp"
#include "bdphone/classifier.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace bdphone {

namespace {

/// Интервал GLib таймера задаётся в guint миллисекундах
std::chrono::milliseconds clamp_delay(std::chrono::milliseconds delay) noexcept {
  constexpr std::chrono::milliseconds kMaxDelay{G_MAXUINT};
  return std::clamp(delay, std::chrono::milliseconds{0}, kMaxDelay);
}

} // namespace

DebouncedValidator::DebouncedValidator(std::chrono::milliseconds delay,
                                       GMainContext *context,
                                       const ValidationOptions &options)
    : delay_{clamp_delay(delay)},
      context_{context ? g_main_context_ref(context)
                       : g_main_context_ref_thread_default()},
      options_{options} {}

DebouncedValidator::~DebouncedValidator() {
  cancel_pending();
  if (context_) {
    g_main_context_unref(context_);
  }
}

void DebouncedValidator::schedule(std::string phone, Callback callback) {
  cancel_pending();

  pending_phone_ = std::move(phone);
  pending_callback_ = std::move(callback);

  source_ = g_timeout_source_new(static_cast<guint>(delay_.count()));
  g_source_set_callback(source_, &DebouncedValidator::on_timeout, this,
                        nullptr);
  g_source_attach(source_, context_);
}

gboolean DebouncedValidator::on_timeout(gpointer user_data) {
  auto *self = static_cast<DebouncedValidator *>(user_data);

  // Контекст держит собственную ссылку на время dispatch
  g_source_unref(self->source_);
  self->source_ = nullptr;

  std::string phone = std::move(self->pending_phone_);
  Callback callback = std::move(self->pending_callback_);
  self->pending_phone_.clear();
  self->pending_callback_ = nullptr;

  // callback может снова вызвать schedule(), поэтому состояние уже сброшено
  if (callback) {
    const ValidationResult result = validate(phone, self->options_);
    callback(result);
  }

  return G_SOURCE_REMOVE;
}

void DebouncedValidator::cancel_pending() noexcept {
  if (source_) {
    g_source_destroy(source_);
    g_source_unref(source_);
    source_ = nullptr;
  }
  pending_phone_.clear();
  pending_callback_ = nullptr;
}

DebouncedFn make_debounced_validator(std::chrono::milliseconds delay,
                                     GMainContext *context,
                                     const ValidationOptions &options) {
  auto validator =
      std::make_shared<DebouncedValidator>(delay, context, options);
  return [validator](std::string phone, DebouncedValidator::Callback callback) {
    validator->schedule(std::move(phone), std::move(callback));
  };
}

DebouncedFn make_debounced_validator(const Config &config,
                                     GMainContext *context) {
  return make_debounced_validator(config.debounce.delay, context,
                                  config.validation);
}

} // namespace bdphone
