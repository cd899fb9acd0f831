// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <string_view>

#include "identifier_spec.hpp"
#include "rule/semantic_rules.hpp"
#include "validator.hpp"

#include "common/gtest_utils.hpp"

using namespace govid;
using namespace govid::rule;

namespace {

constexpr auto canonical = identifier_form::canonical;
constexpr auto separated = identifier_form::separated;

TEST(TestSemanticRules, AreaNumber)
{
    const auto &spec = spec_for(identifier_kind::us_ssn);

    EXPECT_TRUE(valid_area_number("001010001", canonical, spec));
    EXPECT_TRUE(valid_area_number("665-01-0001", separated, spec));
    EXPECT_TRUE(valid_area_number("667-01-0001", separated, spec));
    EXPECT_TRUE(valid_area_number("899-01-0001", separated, spec));

    EXPECT_FALSE(valid_area_number("000010001", canonical, spec));
    EXPECT_FALSE(valid_area_number("666-01-0001", separated, spec));
    EXPECT_FALSE(valid_area_number("900-01-0001", separated, spec));
    EXPECT_FALSE(valid_area_number("987010001", canonical, spec));
}

TEST(TestSemanticRules, GroupAndSerialNumbers)
{
    const auto &spec = spec_for(identifier_kind::us_ssn);

    EXPECT_TRUE(valid_group_number("001-01-0000", separated, spec));
    EXPECT_TRUE(valid_group_number("001-10-0000", separated, spec));
    EXPECT_FALSE(valid_group_number("001-00-0001", separated, spec));
    EXPECT_FALSE(valid_group_number("001000001", canonical, spec));

    EXPECT_TRUE(valid_serial_number("001-00-0001", separated, spec));
    EXPECT_TRUE(valid_serial_number("001001000", canonical, spec));
    EXPECT_FALSE(valid_serial_number("001-01-0000", separated, spec));
    EXPECT_FALSE(valid_serial_number("001010000", canonical, spec));
}

TEST(TestSemanticRules, IdenticalDigitsAndRun)
{
    const auto &spec = spec_for(identifier_kind::us_ssn);

    EXPECT_FALSE(not_identical_digits("444-44-4444", separated, spec));
    EXPECT_FALSE(not_identical_digits("444444444", canonical, spec));
    EXPECT_TRUE(not_identical_digits("444-44-4445", separated, spec));

    EXPECT_FALSE(not_consecutive_run("123-45-6789", separated, spec));
    EXPECT_FALSE(not_consecutive_run("123456789", canonical, spec));
    EXPECT_TRUE(not_consecutive_run("123-45-6788", separated, spec));
    EXPECT_TRUE(not_consecutive_run("987654321", canonical, spec));
}

TEST(TestSemanticRules, Province)
{
    const auto &spec = spec_for(identifier_kind::ca_sin);

    for (char c = '0'; c <= '9'; ++c) {
        std::array<char, 9> value{c, '0', '0', '0', '0', '0', '0', '0', '0'};
        std::string_view sv{value.data(), value.size()};
        EXPECT_EQ(valid_province(sv, canonical, spec), c != '0' && c != '8') << c;
    }
}

TEST(TestSemanticRules, CheckDigit)
{
    const auto &spec = spec_for(identifier_kind::ca_sin);

    EXPECT_TRUE(valid_check_digit("558199428", canonical, spec));
    EXPECT_TRUE(valid_check_digit("558-199-428", separated, spec));
    EXPECT_TRUE(valid_check_digit("558 199 428", separated, spec));
    EXPECT_FALSE(valid_check_digit("558199429", canonical, spec));
    EXPECT_FALSE(valid_check_digit("558-199-429", separated, spec));
}

TEST(TestSemanticRules, RuleOrder)
{
    auto ssn = us_ssn_rules();
    ASSERT_EQ(ssn.size(), 5);
    EXPECT_STR(ssn[0].name, "area_number");
    EXPECT_STR(ssn[4].name, "consecutive_run");

    auto sin = ca_sin_rules();
    ASSERT_EQ(sin.size(), 2);
    EXPECT_STR(sin[0].name, "province");
    EXPECT_STR(sin[1].name, "check_digit");
}

TEST(TestSemanticRules, EvaluateRules)
{
    const auto &spec = spec_for(identifier_kind::us_ssn);

    EXPECT_EQ(evaluate_rules(spec.rules, "078-05-1120", separated, spec),
        validation_outcome::validation_passed);
    EXPECT_EQ(evaluate_rules(spec.rules, "000-00-0000", separated, spec),
        validation_outcome::invalid_area_number);
    EXPECT_EQ(evaluate_rules(spec.rules.subspan(1), "000-00-0000", separated, spec),
        validation_outcome::invalid_group_number);
    EXPECT_EQ(evaluate_rules(spec.rules.subspan(2), "000-00-0000", separated, spec),
        validation_outcome::invalid_serial_number);
    EXPECT_EQ(evaluate_rules(spec.rules.subspan(3), "000-00-0000", separated, spec),
        validation_outcome::all_identical_digits);

    // No rules, no failures
    EXPECT_EQ(evaluate_rules({}, "000-00-0000", separated, spec),
        validation_outcome::validation_passed);
}

} // namespace
