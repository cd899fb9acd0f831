// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string_view>
#include <vector>

#include "exception.hpp"
#include "validator.hpp"

#include "common/gtest_utils.hpp"

using namespace govid;
using namespace std::literals;

namespace {

void expect_outcome(const std::vector<std::string_view> &samples, validation_outcome expected,
    char separator = default_separator)
{
    for (auto sample : samples) {
        EXPECT_EQ(validate(sample, separator, identifier_kind::us_ssn), expected)
            << "value: '" << sample << "'";
    }
}

TEST(TestUsSsnValidator, ValidValues)
{
    expect_outcome({"078051120", "078-05-1120", "001-01-0001", "899-99-9999", "665-01-0001"},
        validation_outcome::validation_passed);
    expect_outcome({"078051120", "078 05 1120"}, validation_outcome::validation_passed, ' ');
    expect_outcome({"078.05.1120"}, validation_outcome::validation_passed, '.');
}

TEST(TestUsSsnValidator, DefaultSeparator)
{
    EXPECT_EQ(validate("078-05-1120", identifier_kind::us_ssn),
        validation_outcome::validation_passed);
    EXPECT_EQ(validate("078 05 1120", identifier_kind::us_ssn),
        validation_outcome::invalid_separator_encountered);
}

TEST(TestUsSsnValidator, Empty)
{
    expect_outcome({""sv, "\t"sv, " "sv, "           "sv, " \r\n\v\f"sv}, validation_outcome::empty);
    expect_outcome({""sv, "\t"sv}, validation_outcome::empty, ' ');
}

TEST(TestUsSsnValidator, InvalidLength)
{
    expect_outcome({"01234567", "0123456789", "012-34-56789", "012-34-567", "1", "0123456789012"},
        validation_outcome::invalid_length);
    expect_outcome({"01234567", "0123456789", "012 34 56789"}, validation_outcome::invalid_length,
        ' ');
}

TEST(TestUsSsnValidator, InvalidSeparator)
{
    expect_outcome(
        {"012 34-5678", "012-34 5678", "0123-4-5678", "012345-678x"},
        validation_outcome::invalid_separator_encountered);
    expect_outcome({"012.34 5678", "012 34.5678", "012-34-5678"},
        validation_outcome::invalid_separator_encountered, ' ');
}

TEST(TestUsSsnValidator, InvalidCharacter)
{
    expect_outcome({"A12345678", "0A2345678", "01A345678", "012A45678", "0123A5678", "01234A678",
                       "012345A78", "0123456A8", "01234567A", "0;2345678", "0\xb2"
                                                                           "2345678",
                       "A12-34-5678", "0A2-34-5678", "01A-34-5678", "012-A4-5678", "012-3A-5678",
                       "012-34-A678", "012-34-5A78", "012-34-56A8", "012-34-567A", "0;2-34-5678",
                       "012-34-567 ", " 12-34-5678", "0\xb2"
                                                     "2-34-5678"},
        validation_outcome::invalid_character_encountered);

    expect_outcome({"A12 34 5678", "012 A4 5678", "012 34 567A", "0;2 34 5678"},
        validation_outcome::invalid_character_encountered, ' ');
}

TEST(TestUsSsnValidator, InvalidAreaNumber)
{
    expect_outcome({"000123456", "666123456", "900123456", "999123456", "000-12-3456",
                       "666-12-3456", "900-12-3456", "999-12-3456", "000000000", "666666666",
                       "999999999"},
        validation_outcome::invalid_area_number);
    expect_outcome({"000 12 3456", "666 12 3456", "900 12 3456", "999 12 3456"},
        validation_outcome::invalid_area_number, ' ');
}

TEST(TestUsSsnValidator, InvalidGroupNumber)
{
    expect_outcome({"012005678", "012-00-5678"}, validation_outcome::invalid_group_number);
    expect_outcome({"012 00 5678"}, validation_outcome::invalid_group_number, ' ');
}

TEST(TestUsSsnValidator, InvalidSerialNumber)
{
    expect_outcome({"012340000", "012-34-0000"}, validation_outcome::invalid_serial_number);
    expect_outcome({"012 34 0000"}, validation_outcome::invalid_serial_number, ' ');
}

TEST(TestUsSsnValidator, AllIdenticalDigits)
{
    expect_outcome({"111111111", "222222222", "333333333", "444444444", "555555555", "777777777",
                       "888888888", "111-11-1111", "222-22-2222", "333-33-3333", "444-44-4444",
                       "555-55-5555", "777-77-7777", "888-88-8888"},
        validation_outcome::all_identical_digits);
    expect_outcome({"111 11 1111", "888 88 8888"}, validation_outcome::all_identical_digits, ' ');
}

TEST(TestUsSsnValidator, ConsecutiveRun)
{
    expect_outcome({"123456789", "123-45-6789"}, validation_outcome::invalid_run);
    expect_outcome({"123 45 6789"}, validation_outcome::invalid_run, ' ');
}

TEST(TestUsSsnValidator, OutcomePriority)
{
    // Invalid length takes precedence over invalid characters
    expect_outcome({"0A234567"}, validation_outcome::invalid_length);
    // Separators are verified before digits
    expect_outcome({"0A2 34-5678"}, validation_outcome::invalid_separator_encountered);
    // Characters are verified before semantic rules
    expect_outcome({"000-00-000A"}, validation_outcome::invalid_character_encountered);
    // Area, group and serial are evaluated in order
    expect_outcome({"000-00-0000", "900000000"}, validation_outcome::invalid_area_number);
    expect_outcome({"012-00-0000"}, validation_outcome::invalid_group_number);
}

TEST(TestUsSsnValidator, DigitSeparator)
{
    for (char separator = '0'; separator <= '9'; ++separator) {
        EXPECT_THROW(
            (void)validate("078-05-1120", separator, identifier_kind::us_ssn), invalid_separator);
    }

    try {
        (void)validate("078051120", '7', identifier_kind::us_ssn);
        FAIL() << "expected invalid_separator";
    } catch (const invalid_separator &e) {
        EXPECT_EQ(e.separator(), '7');
    }

    // Misuse is reported even when the value is empty
    EXPECT_THROW((void)validate("", '0', identifier_kind::us_ssn), contract_violation);
}

TEST(TestUsSsnValidator, TryParse)
{
    {
        auto res = try_parse("078-05-1120", identifier_kind::us_ssn);
        EXPECT_TRUE(res.ok());
        ASSERT_TRUE(res.id.has_value());
        EXPECT_STR(res.id->view(), "078051120");
        EXPECT_EQ(res.id->kind(), identifier_kind::us_ssn);
    }

    {
        auto res = try_parse("078 05 1120", identifier_kind::us_ssn, ' ');
        EXPECT_TRUE(res.ok());
        ASSERT_TRUE(res.id.has_value());
        EXPECT_STR(res.id->view(), "078051120");
    }

    {
        auto res = try_parse("123-45-6789", identifier_kind::us_ssn);
        EXPECT_FALSE(res.ok());
        EXPECT_EQ(res.outcome, validation_outcome::invalid_run);
        EXPECT_FALSE(res.id.has_value());
    }

    EXPECT_THROW((void)try_parse("078051120", identifier_kind::us_ssn, '5'), invalid_separator);
}

} // namespace
