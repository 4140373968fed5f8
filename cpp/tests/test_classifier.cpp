#include "bdphone/classifier.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void test_fail(const char* expr, const char* file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr) \
  do { \
    if (!(expr)) { \
      test_fail(#expr, __FILE__, __LINE__); \
    } \
  } while (0)

using bdphone::ErrorCode;
using bdphone::PhoneFormat;
using bdphone::PhoneType;
using bdphone::ValidationOptions;

void test_mobile_formats() {
  auto local = bdphone::validate("01712345678");
  CHECK(local.is_valid());
  CHECK(local.valid().type == PhoneType::Mobile);
  CHECK(local.valid().format == PhoneFormat::Local);
  CHECK(local.valid().normalized_phone == "+8801712345678");
  CHECK(local.valid().original_phone == "01712345678");
  CHECK(local.valid().operator_info != nullptr);
  CHECK(local.valid().operator_info->name == "Grameenphone");
  CHECK(local.valid().area == nullptr);
  CHECK(local.valid().metadata.length == 14);
  CHECK(local.valid().metadata.country_code == "+880");
  CHECK(local.valid().metadata.number_without_country == "01712345678");

  auto intl = bdphone::validate("+8801712345678");
  CHECK(intl.is_valid());
  CHECK(intl.valid().format == PhoneFormat::International);
  CHECK(intl.valid().normalized_phone == "+8801712345678");

  auto cc = bdphone::validate("8801712345678");
  CHECK(cc.is_valid());
  CHECK(cc.valid().format == PhoneFormat::CountryCode);
  CHECK(cc.valid().normalized_phone == "+8801712345678");

  // Разделители игнорируются
  auto spaced = bdphone::validate("+880 1712-345 678");
  CHECK(spaced.is_valid());
  CHECK(spaced.valid().normalized_phone == "+8801712345678");
  CHECK(spaced.valid().original_phone == "+880 1712-345 678");

  auto parens = bdphone::validate("(017) 1234.5678");
  CHECK(parens.is_valid());
  CHECK(parens.valid().normalized_phone == "+8801712345678");
}

void test_operator_coverage() {
  for (const auto& op : bdphone::get_supported_operators()) {
    std::string phone{op.prefix};
    phone += "12345678";

    auto result = bdphone::validate(phone);
    CHECK(result.is_valid());
    CHECK(result.valid().type == PhoneType::Mobile);
    CHECK(result.valid().operator_info != nullptr);
    CHECK(result.valid().operator_info->prefix == op.prefix);
    CHECK(result.valid().operator_info->name == op.name);
  }
}

void test_area_coverage() {
  for (const auto& area : bdphone::get_supported_landline_areas()) {
    // 10 цифр в локальном виде: код города + абонент без ведущего нуля
    std::string phone{area.code};
    phone += std::string{"123456789"}.substr(0, 10 - area.code.size());

    auto result = bdphone::validate(phone);
    CHECK(result.is_valid());
    CHECK(result.valid().type == PhoneType::Landline);
    CHECK(result.valid().area != nullptr);
    CHECK(result.valid().area->code == area.code);
    CHECK(result.valid().operator_info == nullptr);

    std::string expected{"+880"};
    expected += phone.substr(1);
    CHECK(result.valid().normalized_phone == expected);
  }

  auto dhaka = bdphone::validate("+880212345678");
  CHECK(dhaka.is_valid());
  CHECK(dhaka.valid().area->area == "Dhaka");
  CHECK(dhaka.valid().format == PhoneFormat::International);

  auto ctg = bdphone::validate("0311234567");
  CHECK(ctg.is_valid());
  CHECK(ctg.valid().area->area == "Chittagong");
  CHECK(ctg.valid().normalized_phone == "+880311234567");
}

void test_length_boundaries() {
  // 10 и 12 цифр вместо 11
  auto short_mobile = bdphone::validate("0171234567");
  CHECK(!short_mobile.is_valid());
  CHECK(short_mobile.error_code() == ErrorCode::InvalidMobileFormat);

  auto long_mobile = bdphone::validate("017123456789");
  CHECK(!long_mobile.is_valid());
  CHECK(long_mobile.error_code() == ErrorCode::InvalidMobileFormat);

  auto ten_digits = bdphone::validate("0191428753");
  CHECK(!ten_digits.is_valid());
  CHECK(ten_digits.error_code() == ErrorCode::InvalidMobileFormat);

  auto twelve_digits = bdphone::validate("019142875301");
  CHECK(!twelve_digits.is_valid());
  CHECK(twelve_digits.error_code() == ErrorCode::InvalidMobileFormat);

  auto short_intl = bdphone::validate("+880171234567");
  CHECK(!short_intl.is_valid());

  auto long_landline = bdphone::validate("02123456789");
  CHECK(!long_landline.is_valid());
  CHECK(long_landline.error_code() == ErrorCode::InvalidLandlineFormat);

  auto short_landline = bdphone::validate("021234567");
  CHECK(!short_landline.is_valid());
  CHECK(short_landline.error_code() == ErrorCode::InvalidLandlineFormat);

  // Абонент не может начинаться с нуля
  auto zero_subscriber = bdphone::validate("0201234567");
  CHECK(!zero_subscriber.is_valid());
  CHECK(zero_subscriber.error_code() == ErrorCode::InvalidLandlineFormat);

  // Неизвестный код города
  auto unknown_area = bdphone::validate("0421234567");
  CHECK(!unknown_area.is_valid());
  CHECK(unknown_area.error_code() == ErrorCode::InvalidLandlineFormat);
}

void test_error_codes() {
  auto empty = bdphone::validate("");
  CHECK(empty.error_code() == ErrorCode::InvalidInput);

  auto garbage = bdphone::validate("garbage");
  CHECK(garbage.error_code() == ErrorCode::EmptyPhone);

  auto plus = bdphone::validate("+");
  CHECK(plus.error_code() == ErrorCode::EmptyPhone);

  auto broken_utf8 = bdphone::validate("\xff" "01712345678");
  CHECK(broken_utf8.error_code() == ErrorCode::InvalidInput);

  // Overlong-форма, UTF-16 суррогат и код выше U+10FFFF
  auto overlong = bdphone::validate("\xC0\xAF" "01712345678");
  CHECK(overlong.error_code() == ErrorCode::InvalidInput);
  auto surrogate = bdphone::validate("\xED\xA0\x80" "01712345678");
  CHECK(surrogate.error_code() == ErrorCode::InvalidInput);
  auto beyond_max = bdphone::validate("\xF5\x80\x80\x80" "01712345678");
  CHECK(beyond_max.error_code() == ErrorCode::InvalidInput);

  std::string with_nul{"0171234"};
  with_nul.push_back('\0');
  with_nul += "5678";
  CHECK(bdphone::validate(with_nul).error_code() == ErrorCode::InvalidInput);

  std::string too_long(65, '1');
  CHECK(bdphone::validate(too_long).error_code() == ErrorCode::InvalidInput);

  auto unsupported = bdphone::validate("01112345678");
  CHECK(!unsupported.is_valid());
  CHECK(unsupported.error_code() == ErrorCode::UnsupportedOperator);
  const auto& names = unsupported.invalid().supported_operators;
  CHECK(names.size() == 5);
  CHECK(names.front() == "Teletalk");

  auto operator_012 = bdphone::validate("01234567890");
  CHECK(operator_012.error_code() == ErrorCode::UnsupportedOperator);
  CHECK(operator_012.invalid().supported_operators.size() == 5);
  CHECK(bdphone::validate("01012345678").error_code() ==
        ErrorCode::UnsupportedOperator);

  auto no_prefix = bdphone::validate("1712345678");
  CHECK(no_prefix.error_code() == ErrorCode::InvalidFormat);

  // Подсказки прикладываются к ошибкам формата
  auto mobile_err = bdphone::validate("0171234567");
  CHECK(mobile_err.invalid().suggestions.size() == 4);
  CHECK(mobile_err.invalid().examples.size() == 8);
  CHECK(mobile_err.invalid().examples.front() == "+8801712345678");
  CHECK(!mobile_err.invalid().message.empty());
  CHECK(!mobile_err.invalid().message_bn.empty());
  CHECK(mobile_err.invalid().text(bdphone::Language::Bengali) ==
        mobile_err.invalid().message_bn);
}

void test_category_options() {
  ValidationOptions mobile_only;
  mobile_only.allow_landline = false;
  auto landline = bdphone::validate("0212345678", mobile_only);
  CHECK(!landline.is_valid());
  CHECK(landline.error_code() == ErrorCode::InvalidFormat);

  ValidationOptions landline_only;
  landline_only.allow_mobile = false;
  auto mobile = bdphone::validate("01712345678", landline_only);
  CHECK(!mobile.is_valid());
  CHECK(mobile.error_code() == ErrorCode::InvalidFormat);
  CHECK(bdphone::validate("0212345678", landline_only).is_valid());

  ValidationOptions special_only;
  special_only.allow_mobile = false;
  special_only.allow_landline = false;
  special_only.allow_special = true;
  auto bad_special = bdphone::validate("12345", special_only);
  CHECK(bad_special.error_code() == ErrorCode::InvalidSpecialFormat);
  CHECK(bad_special.invalid().suggestions.empty());
  CHECK(bad_special.invalid().examples.size() == 7);
  CHECK(bad_special.invalid().examples.front() == "999");
}

void test_special_numbers() {
  ValidationOptions options;
  options.allow_special = true;

  auto emergency = bdphone::validate("999", options);
  CHECK(emergency.is_valid());
  CHECK(emergency.valid().type == PhoneType::Special);
  CHECK(emergency.valid().format == PhoneFormat::Unknown);
  CHECK(emergency.valid().normalized_phone == "999");
  CHECK(emergency.valid().special != nullptr);
  CHECK(emergency.valid().special->name() == "emergency");
  CHECK(emergency.valid().metadata.country_code.empty());

  auto toll_free = bdphone::validate("800-123-4567", options);
  CHECK(toll_free.is_valid());
  CHECK(toll_free.valid().special->kind == bdphone::SpecialKind::TollFree);
  CHECK(toll_free.valid().normalized_phone == "8001234567");

  auto premium = bdphone::validate("9001234567", options);
  CHECK(premium.is_valid());
  CHECK(premium.valid().special->name() == "premium");

  auto corporate = bdphone::validate("123456789", options);
  CHECK(corporate.is_valid());
  CHECK(corporate.valid().special->name() == "corporate");

  // Обычные номера по-прежнему распознаются
  CHECK(bdphone::validate("01712345678", options).type() == PhoneType::Mobile);

  // Без allow_special спецномера отвергаются
  CHECK(!bdphone::validate("999").is_valid());
  CHECK(bdphone::validate("999").error_code() == ErrorCode::InvalidFormat);
}

void test_bengali_digits() {
  // ০১৭১২৩৪৫৬৭৮
  auto result = bdphone::validate("০১৭১২৩৪৫৬৭৮");
  CHECK(result.is_valid());
  CHECK(result.valid().normalized_phone == "+8801712345678");
  CHECK(result.valid().operator_info->name == "Grameenphone");

  auto mixed = bdphone::validate("+৮৮০ 1812345678");
  CHECK(mixed.is_valid());
  CHECK(mixed.valid().normalized_phone == "+8801812345678");
}

void test_operator_helpers() {
  const auto* robi = bdphone::get_operator_info("01812345678");
  CHECK(robi != nullptr);
  CHECK(robi->name == "Robi");
  CHECK(robi->prefix == "018");

  CHECK(bdphone::get_operator_info("0212345678") == nullptr);
  CHECK(bdphone::get_operator_info("garbage") == nullptr);

  CHECK(bdphone::is_operator("01912345678", "Banglalink"));
  CHECK(bdphone::is_operator("+8801412345678", "banglalink"));
  CHECK(!bdphone::is_operator("01712345678", "Robi"));
  CHECK(!bdphone::is_operator("0212345678", "Grameenphone"));
}

void test_format_detection() {
  CHECK(bdphone::detect_format("+8801712345678") == PhoneFormat::International);
  CHECK(bdphone::detect_format("8801712345678") == PhoneFormat::CountryCode);
  CHECK(bdphone::detect_format("01712345678") == PhoneFormat::Local);
  CHECK(bdphone::detect_format("999") == PhoneFormat::Unknown);

  CHECK(bdphone::national_number("+8801712345678",
                                 PhoneFormat::International) == "1712345678");
  CHECK(bdphone::national_number("0212345678", PhoneFormat::Local) ==
        "212345678");
  CHECK(bdphone::national_number("999", PhoneFormat::Unknown).empty());
}

} // namespace

#undef CHECK

int main() {
  test_mobile_formats();
  test_operator_coverage();
  test_area_coverage();
  test_length_boundaries();
  test_error_codes();
  test_category_options();
  test_special_numbers();
  test_bengali_digits();
  test_operator_helpers();
  test_format_detection();

  std::cout << "OK\n";
  return 0;
}
