/**
 * @file pattern_registry.cpp
 * @brief Таблицы нумерации Бангладеш
 */

#include "bdphone/pattern_registry.hpp"

#include <algorithm>
#include <array>
#include <iostream>

namespace bdphone {

namespace {

// ===========================================================================
// Мобильные операторы
// ===========================================================================

constexpr std::array<OperatorInfo, 7> kMobileOperators = {{
    {"013", "Teletalk", "টেলিটক", "2G/3G", "#8B4513",
     "/assets/operators/teletalk.png"},
    {"014", "Banglalink", "বাংলালিংক", "2G/3G/4G", "#FF6B35",
     "/assets/operators/banglalink.png"},
    {"015", "Teletalk", "টেলিটক", "2G/3G", "#8B4513",
     "/assets/operators/teletalk.png"},
    {"016", "Airtel", "এয়ারটেল", "2G/3G/4G", "#ED1C24",
     "/assets/operators/airtel.png"},
    {"017", "Grameenphone", "গ্রামীণফোন", "2G/3G/4G/5G", "#00BCD4",
     "/assets/operators/grameenphone.png"},
    {"018", "Robi", "রবি", "2G/3G/4G", "#E91E63",
     "/assets/operators/robi.png"},
    {"019", "Banglalink", "বাংলালিংক", "2G/3G/4G", "#FF6B35",
     "/assets/operators/banglalink.png"},
}};

// ===========================================================================
// Коды городов
// ===========================================================================

constexpr std::array<AreaInfo, 8> kLandlineAreas = {{
    {"02", "Dhaka", "ঢাকা", "Central", "কেন্দ্রীয়"},
    {"031", "Chittagong", "চট্টগ্রাম", "Southeast", "দক্ষিণ-পূর্ব"},
    {"041", "Khulna", "খুলনা", "Southwest", "দক্ষিণ-পশ্চিম"},
    {"051", "Rajshahi", "রাজশাহী", "Northwest", "উত্তর-পশ্চিম"},
    {"061", "Sylhet", "সিলেট", "Northeast", "উত্তর-পূর্ব"},
    {"071", "Barisal", "বরিশাল", "South", "দক্ষিণ"},
    {"081", "Rangpur", "রংপুর", "North", "উত্তর"},
    {"091", "Mymensingh", "ময়মনসিংহ", "North-central", "উত্তর-মধ্য"},
}};

// ===========================================================================
// Спецномера
// ===========================================================================

constexpr std::array<DigitPattern, 4> kEmergencyPatterns = {{
    {"999", 3},
    {"100", 3},
    {"101", 3},
    {"102", 3},
}};
constexpr std::array<DigitPattern, 1> kTollFreePatterns = {{{"800", 10}}};
constexpr std::array<DigitPattern, 1> kPremiumPatterns = {{{"900", 10}}};
constexpr std::array<DigitPattern, 1> kCorporatePatterns = {{{"1", 9}}};

constexpr std::array<std::string_view, 4> kEmergencyExamples = {
    "999", "100", "101", "102"};
constexpr std::array<std::string_view, 1> kTollFreeExamples = {"8001234567"};
constexpr std::array<std::string_view, 1> kPremiumExamples = {"9001234567"};
constexpr std::array<std::string_view, 1> kCorporateExamples = {"123456789"};

const std::array<SpecialCategory, 4> kSpecialCategories = {{
    {SpecialKind::Emergency, kEmergencyPatterns, MessageId::DescEmergency,
     kEmergencyExamples},
    {SpecialKind::TollFree, kTollFreePatterns, MessageId::DescTollFree,
     kTollFreeExamples},
    {SpecialKind::Premium, kPremiumPatterns, MessageId::DescPremium,
     kPremiumExamples},
    {SpecialKind::Corporate, kCorporatePatterns, MessageId::DescCorporate,
     kCorporateExamples},
}};

// ===========================================================================
// Подсказки и примеры для ошибок
// ===========================================================================

constexpr std::array<MessageId, 4> kFormatHints = {
    MessageId::HintMobileInternational, MessageId::HintMobileLocal,
    MessageId::HintLandlineInternational, MessageId::HintLandlineLocal};

constexpr std::array<std::string_view, 4> kMobileExamples = {
    "+8801712345678", "01712345678", "+8801812345678", "01812345678"};

constexpr std::array<std::string_view, 4> kLandlineExamples = {
    "+880212345678", "0212345678", "+880311234567", "0311234567"};

bool all_digits(std::string_view sv) noexcept {
  return std::all_of(sv.begin(), sv.end(), is_ascii_digit);
}

template <class Range, class Proj>
std::string join_alternation(const Range &range, Proj proj) {
  std::string out;
  for (const auto &item : range) {
    if (!out.empty()) {
      out += '|';
    }
    out += proj(item);
  }
  return out;
}

} // namespace

// ===========================================================================
// DigitPattern / SpecialCategory
// ===========================================================================

bool DigitPattern::matches(std::string_view digits) const noexcept {
  return digits.size() == length && digits.starts_with(prefix) &&
         all_digits(digits);
}

std::string DigitPattern::to_regex() const {
  std::string out{prefix};
  const std::size_t tail = length > prefix.size() ? length - prefix.size() : 0;
  if (tail > 0) {
    out += "\\d{" + std::to_string(tail) + "}";
  }
  return out;
}

bool DigitPattern::overlaps(const DigitPattern &other) const noexcept {
  if (length != other.length) {
    return false;
  }
  const std::size_t common = std::min(prefix.size(), other.prefix.size());
  return prefix.substr(0, common) == other.prefix.substr(0, common);
}

bool SpecialCategory::matches(std::string_view digits) const noexcept {
  return std::any_of(patterns.begin(), patterns.end(),
                     [digits](const DigitPattern &p) {
                       return p.matches(digits);
                     });
}

// ===========================================================================
// PatternRegistry
// ===========================================================================

PatternRegistry::PatternRegistry() {
  if (!is_consistent()) {
    std::cerr << "[bdphone] Error: numbering plan tables overlap, "
                 "classification results are unreliable\n";
  }
}

const PatternRegistry &PatternRegistry::instance() {
  static const PatternRegistry registry;
  return registry;
}

std::span<const OperatorInfo> PatternRegistry::operators() const noexcept {
  return kMobileOperators;
}

std::span<const AreaInfo> PatternRegistry::areas() const noexcept {
  return kLandlineAreas;
}

std::span<const SpecialCategory>
PatternRegistry::special_categories() const noexcept {
  return kSpecialCategories;
}

const OperatorInfo *
PatternRegistry::find_operator(std::string_view prefix) const noexcept {
  auto it = std::find_if(
      kMobileOperators.begin(), kMobileOperators.end(),
      [prefix](const OperatorInfo &op) { return op.prefix == prefix; });
  return it != kMobileOperators.end() ? &*it : nullptr;
}

const AreaInfo *
PatternRegistry::find_area(std::string_view code) const noexcept {
  auto it = std::find_if(
      kLandlineAreas.begin(), kLandlineAreas.end(),
      [code](const AreaInfo &area) { return area.code == code; });
  return it != kLandlineAreas.end() ? &*it : nullptr;
}

const AreaInfo *
PatternRegistry::match_area(std::string_view national) const noexcept {
  for (const auto &area : kLandlineAreas) {
    // Код хранится с транк-нулём, национальный номер его не содержит
    std::string_view code_digits = area.code.substr(1);
    if (national.size() > code_digits.size() &&
        national.starts_with(code_digits)) {
      return &area;
    }
  }
  return nullptr;
}

const SpecialCategory *
PatternRegistry::match_special(std::string_view digits) const noexcept {
  for (const auto &category : kSpecialCategories) {
    if (category.matches(digits)) {
      return &category;
    }
  }
  return nullptr;
}

std::vector<std::string_view> PatternRegistry::operator_names() const {
  std::vector<std::string_view> names;
  for (const auto &op : kMobileOperators) {
    if (std::find(names.begin(), names.end(), op.name) == names.end()) {
      names.push_back(op.name);
    }
  }
  return names;
}

std::string PatternRegistry::mobile_prefix_alternation() const {
  return join_alternation(kMobileOperators, [](const OperatorInfo &op) {
    return std::string{op.prefix};
  });
}

std::string PatternRegistry::area_code_alternation() const {
  return join_alternation(kLandlineAreas, [](const AreaInfo &area) {
    return std::string{area.code};
  });
}

std::string
PatternRegistry::special_pattern_alternation(SpecialKind kind) const {
  for (const auto &category : kSpecialCategories) {
    if (category.kind == kind) {
      return join_alternation(category.patterns, [](const DigitPattern &p) {
        return p.to_regex();
      });
    }
  }
  return {};
}

std::span<const MessageId> PatternRegistry::format_hints() const noexcept {
  return kFormatHints;
}

std::span<const std::string_view>
PatternRegistry::mobile_examples() const noexcept {
  return kMobileExamples;
}

std::span<const std::string_view>
PatternRegistry::landline_examples() const noexcept {
  return kLandlineExamples;
}

bool PatternRegistry::is_consistent() const {
  // Операторы
  for (std::size_t i = 0; i < kMobileOperators.size(); ++i) {
    const auto &op = kMobileOperators[i];
    if (op.prefix.size() != 3 || !op.prefix.starts_with("01") ||
        !all_digits(op.prefix)) {
      return false;
    }
    for (std::size_t j = i + 1; j < kMobileOperators.size(); ++j) {
      if (kMobileOperators[j].prefix == op.prefix) {
        return false;
      }
    }
  }

  // Коды городов
  std::size_t two_digit = 0;
  for (std::size_t i = 0; i < kLandlineAreas.size(); ++i) {
    const auto &a = kLandlineAreas[i];
    if ((a.code.size() != 2 && a.code.size() != 3) ||
        !a.code.starts_with('0') || a.code.starts_with("01") ||
        !all_digits(a.code)) {
      return false;
    }
    if (a.code.size() == 2) {
      ++two_digit;
    }
    for (std::size_t j = 0; j < kLandlineAreas.size(); ++j) {
      if (i != j && kLandlineAreas[j].code.starts_with(a.code)) {
        return false;
      }
    }
  }
  if (two_digit != 1) {
    return false;
  }

  // Спецномера: категории попарно не пересекаются
  for (std::size_t i = 0; i < kSpecialCategories.size(); ++i) {
    for (std::size_t j = i + 1; j < kSpecialCategories.size(); ++j) {
      for (const auto &p : kSpecialCategories[i].patterns) {
        for (const auto &q : kSpecialCategories[j].patterns) {
          if (p.overlaps(q)) {
            return false;
          }
        }
      }
    }
  }

  return true;
}

} // namespace bdphone
