#include "bdphone/statistics.hpp"
#include "bdphone/use_case_validator.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

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
using bdphone::PhoneType;
using bdphone::UseCase;

void test_options_for_use_case() {
  static_assert(bdphone::options_for_use_case(UseCase::Registration)
                    .allow_landline);
  static_assert(!bdphone::options_for_use_case(UseCase::Otp).allow_landline);
  static_assert(!bdphone::options_for_use_case(UseCase::Sms).allow_landline);
  static_assert(!bdphone::options_for_use_case(UseCase::Otp).allow_special);

  CHECK(bdphone::options_for_use_case(UseCase::Verification).allow_mobile);
  CHECK(bdphone::options_for_use_case(UseCase::Verification).allow_landline);
}

void test_parse_names() {
  CHECK(bdphone::parse_use_case("otp") == UseCase::Otp);
  CHECK(bdphone::parse_use_case("registration") == UseCase::Registration);
  CHECK(!bdphone::parse_use_case("OTP").has_value());
  CHECK(bdphone::use_case_to_string(UseCase::Verification) == "verification");

  CHECK(bdphone::parse_format_mode("display") == bdphone::FormatMode::Display);
  CHECK(!bdphone::parse_format_mode("e164").has_value());
  CHECK(bdphone::parse_language("bangla") == bdphone::Language::Bengali);

  CHECK(bdphone::error_code_to_string(ErrorCode::MobileOnly) == "MOBILE_ONLY");
  CHECK(bdphone::error_code_to_string(ErrorCode::UnsupportedOperator) ==
        "UNSUPPORTED_OPERATOR");
}

void test_mobile_only_use_cases() {
  for (UseCase use_case : {UseCase::Otp, UseCase::Sms}) {
    auto mobile = bdphone::validate_for_use_case("01712345678", use_case);
    CHECK(mobile.is_valid());
    CHECK(mobile.valid().type == PhoneType::Mobile);
    CHECK(!mobile.valid().use_case.has_value());

    auto landline = bdphone::validate_for_use_case("0212345678", use_case);
    CHECK(!landline.is_valid());
    CHECK(landline.error_code() == ErrorCode::MobileOnly);
    CHECK(!landline.invalid().message.empty());

    auto intl_landline =
        bdphone::validate_for_use_case("+880311234567", use_case);
    CHECK(intl_landline.error_code() == ErrorCode::MobileOnly);

    // Ошибки, не связанные с категорией, не подменяются
    auto garbage = bdphone::validate_for_use_case("garbage", use_case);
    CHECK(garbage.error_code() == ErrorCode::EmptyPhone);

    auto short_mobile = bdphone::validate_for_use_case("0171234567", use_case);
    CHECK(short_mobile.error_code() == ErrorCode::InvalidMobileFormat);
  }
}

void test_registration_flags() {
  auto mobile =
      bdphone::validate_for_use_case("01812345678", UseCase::Registration);
  CHECK(mobile.is_valid());
  CHECK(mobile.valid().use_case.has_value());
  CHECK(mobile.valid().use_case->can_receive_sms);
  CHECK(mobile.valid().use_case->can_receive_otp);
  CHECK(mobile.valid().use_case->requires_verification);
  CHECK(!mobile.valid().use_case->is_verifiable);

  auto landline =
      bdphone::validate_for_use_case("0212345678", UseCase::Registration);
  CHECK(landline.is_valid());
  CHECK(landline.valid().type == PhoneType::Landline);
  CHECK(!landline.valid().use_case->can_receive_sms);
  CHECK(!landline.valid().use_case->can_receive_otp);
  CHECK(landline.valid().use_case->requires_verification);
}

void test_verification_flags() {
  auto result =
      bdphone::validate_for_use_case("+8801912345678", UseCase::Verification);
  CHECK(result.is_valid());
  CHECK(result.valid().use_case.has_value());
  CHECK(result.valid().use_case->is_verifiable);

  auto landline =
      bdphone::validate_for_use_case("0311234567", UseCase::Verification);
  CHECK(landline.is_valid());
  CHECK(landline.valid().use_case->is_verifiable);

  // Спецномера для сценариев не разрешены
  auto special = bdphone::validate_for_use_case("999", UseCase::Verification);
  CHECK(!special.is_valid());
}

void test_statistics() {
  const std::vector<std::string> phones = {"01712345678", "0212345678",
                                           "garbage"};
  const auto stats = bdphone::generate_validation_stats(
      std::span<const std::string>{phones});

  CHECK(stats.total == 3);
  CHECK(stats.valid == 2);
  CHECK(stats.invalid == 1);
  CHECK(stats.mobile == 1);
  CHECK(stats.landline == 1);
  CHECK(stats.special == 0);
  CHECK(stats.operators.size() == 1);
  CHECK(stats.operators.at("Grameenphone") == 1);
  CHECK(stats.areas.at("02") == 1);
  CHECK(stats.formats.local == 2);
  CHECK(stats.formats.international == 0);
  CHECK(stats.valid + stats.invalid == stats.total);
}

void test_statistics_grouping() {
  // 014 и 019 принадлежат одному оператору
  const std::vector<std::string_view> phones = {
      "01412345678", "+8801912345678", "8801712345678", "999", "",
      "0311234567"};

  bdphone::ValidationOptions options;
  options.allow_special = true;
  const auto stats = bdphone::generate_validation_stats(
      std::span<const std::string_view>{phones}, options);

  CHECK(stats.total == 6);
  CHECK(stats.valid == 5);
  CHECK(stats.invalid == 1);
  CHECK(stats.mobile == 3);
  CHECK(stats.landline == 1);
  CHECK(stats.special == 1);
  CHECK(stats.operators.at("Banglalink") == 2);
  CHECK(stats.operators.at("Grameenphone") == 1);
  CHECK(stats.areas.at("031") == 1);
  CHECK(stats.formats.local == 2);
  CHECK(stats.formats.international == 1);
  CHECK(stats.formats.country_code == 1);
  CHECK(stats.formats.unknown == 1);

  const auto empty = bdphone::generate_validation_stats(
      std::span<const std::string_view>{});
  CHECK(empty.total == 0);
  CHECK(empty.valid == 0);
  CHECK(empty.operators.empty());
}

} // namespace

#undef CHECK

int main() {
  test_options_for_use_case();
  test_parse_names();
  test_mobile_only_use_cases();
  test_registration_flags();
  test_verification_flags();
  test_statistics();
  test_statistics_grouping();

  std::cout << "OK\n";
  return 0;
}
