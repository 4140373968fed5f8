/**
 * @file localization.cpp
 * @brief Таблица двуязычных сообщений
 */

#include "bdphone/localization.hpp"

#include <array>

namespace bdphone {

namespace {

static_assert(static_cast<std::size_t>(MessageId::ErrMobileOnly) ==
                  static_cast<std::size_t>(ErrorCode::MobileOnly),
              "MessageId error block must mirror ErrorCode");

// Порядок строк строго соответствует MessageId
constexpr std::array<LocalizedText, kMessageCount> kMessages = {{
    // Ошибки
    {"Phone number is required and must be a string",
     "ফোন নম্বর প্রয়োজনীয় এবং এটি স্ট্রিং হতে হবে"},
    {"Phone number cannot be empty", "ফোন নম্বর খালি হতে পারে না"},
    {"Invalid mobile number format", "অবৈধ মোবাইল নম্বর ফরম্যাট"},
    {"Unsupported mobile operator", "অসমর্থিত মোবাইল অপারেটর"},
    {"Invalid landline number format", "অবৈধ ল্যান্ডলাইন নম্বর ফরম্যাট"},
    {"Not a recognized special number", "স্বীকৃত বিশেষ নম্বর নয়"},
    {"Invalid Bangladesh phone number format",
     "অবৈধ বাংলাদেশ ফোন নম্বর ফরম্যাট"},
    {"Only mobile numbers can receive SMS/OTP",
     "শুধুমাত্র মোবাইল নম্বর SMS/OTP পেতে পারে"},

    // Спецномера
    {"Emergency Services", "জরুরি সেবা"},
    {"Toll-Free Numbers", "টোল-ফ্রি নম্বর"},
    {"Premium Rate Numbers", "প্রিমিয়াম নম্বর"},
    {"Corporate Numbers", "কর্পোরেট নম্বর"},

    // Подсказки
    {"+8801XXXXXXXXX (International format)",
     "+8801XXXXXXXXX (আন্তর্জাতিক ফরম্যাট)"},
    {"01XXXXXXXXX (Local format)", "01XXXXXXXXX (স্থানীয় ফরম্যাট)"},
    {"+8802XXXXXXXX (Landline international)",
     "+8802XXXXXXXX (ল্যান্ডলাইন আন্তর্জাতিক)"},
    {"02XXXXXXXX (Landline local)", "02XXXXXXXX (ল্যান্ডলাইন স্থানীয়)"},
}};

} // namespace

const LocalizedText &localized(MessageId id) noexcept {
  const auto idx = static_cast<std::size_t>(id);
  if (idx >= kMessages.size()) {
    return kMessages[static_cast<std::size_t>(MessageId::ErrInvalidFormat)];
  }
  return kMessages[idx];
}

std::string_view localize(MessageId id, Language lang) noexcept {
  return localized(id).get(lang);
}

} // namespace bdphone
