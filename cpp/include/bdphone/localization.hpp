/**
 * @file localization.hpp
 * @brief Двуязычные (EN/BN) сообщения движка
 *
 * Все пользовательские строки собраны в одной таблице, индексированной
 * MessageId. Классификатор оперирует только кодами, тексты подставляются
 * при сборке результата.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "bdphone/types.hpp"

namespace bdphone {

/// Идентификатор сообщения в таблице локализации
enum class MessageId : std::uint8_t {
  // Ошибки (порядок совпадает с ErrorCode)
  ErrInvalidInput,
  ErrEmptyPhone,
  ErrInvalidMobileFormat,
  ErrUnsupportedOperator,
  ErrInvalidLandlineFormat,
  ErrInvalidSpecialFormat,
  ErrInvalidFormat,
  ErrMobileOnly,

  // Описания категорий спецномеров
  DescEmergency,
  DescTollFree,
  DescPremium,
  DescCorporate,

  // Подсказки по формату
  HintMobileInternational,
  HintMobileLocal,
  HintLandlineInternational,
  HintLandlineLocal,

  Count
};

inline constexpr std::size_t kMessageCount =
    static_cast<std::size_t>(MessageId::Count);

/// Пара строк: английский и бенгальский варианты
struct LocalizedText {
  std::string_view en;
  std::string_view bn;

  [[nodiscard]] constexpr std::string_view get(Language lang) const noexcept {
    return lang == Language::Bengali ? bn : en;
  }
};

/**
 * @brief Возвращает запись таблицы локализации
 * @param id Идентификатор сообщения
 */
[[nodiscard]] const LocalizedText &localized(MessageId id) noexcept;

/**
 * @brief Возвращает текст сообщения на нужном языке
 */
[[nodiscard]] std::string_view localize(MessageId id, Language lang) noexcept;

/// Сообщение, соответствующее коду ошибки
[[nodiscard]] constexpr MessageId message_for(ErrorCode code) noexcept {
  return static_cast<MessageId>(static_cast<std::uint8_t>(code));
}

} // namespace bdphone
