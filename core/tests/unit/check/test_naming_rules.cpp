// tests/unit/check/test_naming_rules.cpp - Unit tests for the camelCase and ALL_CAPS rules
//

#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "namecheck/check/naming_rules.hpp"

using namespace namecheck;

namespace
{

std::optional<NamingViolation> upper_camel(const std::string & name)
{
  return check_camel_case(name, true);
}

std::optional<NamingViolation> lower_camel(const std::string & name)
{
  return check_camel_case(name, false);
}

}  // namespace

// ============================================================================
// UpperCamelCase (types)
// ============================================================================

TEST(NamingRulesTest, TypeNamesThatConform)
{
  EXPECT_EQ(upper_camel("Parser"), std::nullopt);
  EXPECT_EQ(upper_camel("HttpServer"), std::nullopt);
  EXPECT_EQ(upper_camel("Vec3"), std::nullopt);
  EXPECT_EQ(upper_camel("A"), std::nullopt);
  EXPECT_EQ(upper_camel("AbC"), std::nullopt);
}

TEST(NamingRulesTest, TypeNameStartingLowercase)
{
  EXPECT_EQ(upper_camel("myClass"), NamingViolation::ShouldStartUppercase);
  EXPECT_EQ(upper_camel("hTMLParser"), NamingViolation::ShouldStartUppercase);
  EXPECT_EQ(upper_camel("x"), NamingViolation::ShouldStartUppercase);
}

TEST(NamingRulesTest, TypeNameWithConsecutiveCapitals)
{
  EXPECT_EQ(upper_camel("HTTPServer"), NamingViolation::NotCamelCase);
  EXPECT_EQ(upper_camel("IO"), NamingViolation::NotCamelCase);
  EXPECT_EQ(upper_camel("ParserXML"), NamingViolation::NotCamelCase);
}

// ============================================================================
// lowerCamelCase (methods, variables)
// ============================================================================

TEST(NamingRulesTest, MemberNamesThatConform)
{
  EXPECT_EQ(lower_camel("doWork"), std::nullopt);
  EXPECT_EQ(lower_camel("parseUrl"), std::nullopt);
  EXPECT_EQ(lower_camel("i"), std::nullopt);
  EXPECT_EQ(lower_camel("x2y"), std::nullopt);
  EXPECT_EQ(lower_camel("aBcD"), std::nullopt);
}

TEST(NamingRulesTest, MemberNameStartingUppercase)
{
  EXPECT_EQ(lower_camel("DoWork"), NamingViolation::ShouldStartLowercase);
  // The start check stops the scan, so only one violation is reported
  EXPECT_EQ(lower_camel("DOWORK"), NamingViolation::ShouldStartLowercase);
}

TEST(NamingRulesTest, MemberNameWithConsecutiveCapitals)
{
  EXPECT_EQ(lower_camel("getHTTPCode"), NamingViolation::NotCamelCase);
  EXPECT_EQ(lower_camel("myHTTP"), NamingViolation::NotCamelCase);
}

TEST(NamingRulesTest, AcronymSegmentsAreRejected)
{
  EXPECT_EQ(lower_camel("parseURL"), NamingViolation::NotCamelCase);
  EXPECT_EQ(lower_camel("parseUrl"), std::nullopt);
}

TEST(NamingRulesTest, UncasedFirstCharacterIsNotCamelCase)
{
  for (const char * name : {"_value", "2fast", "$x", "_", "9"}) {
    EXPECT_EQ(lower_camel(name), NamingViolation::NotCamelCase) << name;
    EXPECT_EQ(upper_camel(name), NamingViolation::NotCamelCase) << name;
  }
}

TEST(NamingRulesTest, UnderscoresAndDigitsAfterTheStartAreAllowed)
{
  EXPECT_EQ(lower_camel("my_value"), std::nullopt);
  EXPECT_EQ(lower_camel("value2"), std::nullopt);
  // A non-capital between two capitals resets the run
  EXPECT_EQ(upper_camel("A_B"), std::nullopt);
  EXPECT_EQ(upper_camel("A1B"), std::nullopt);
}

TEST(NamingRulesTest, EmptyNameIsNotCamelCase)
{
  EXPECT_EQ(lower_camel(""), NamingViolation::NotCamelCase);
  EXPECT_EQ(upper_camel(""), NamingViolation::NotCamelCase);
}

// ============================================================================
// ALL_CAPS (constants)
// ============================================================================

TEST(NamingRulesTest, ConstantNamesThatConform)
{
  EXPECT_EQ(check_all_caps("MAX_SIZE"), std::nullopt);
  EXPECT_EQ(check_all_caps("X"), std::nullopt);
  EXPECT_EQ(check_all_caps("HTTP2_PORT"), std::nullopt);
  EXPECT_EQ(check_all_caps("A_B_C"), std::nullopt);
  EXPECT_EQ(check_all_caps("TRAILING_"), std::nullopt);
}

TEST(NamingRulesTest, ConstantNameViolations)
{
  EXPECT_EQ(check_all_caps("maxSize"), NamingViolation::NotAllCaps);
  EXPECT_EQ(check_all_caps("MAX__SIZE"), NamingViolation::NotAllCaps);
  EXPECT_EQ(check_all_caps("2MAX"), NamingViolation::NotAllCaps);
  EXPECT_EQ(check_all_caps("_MAX"), NamingViolation::NotAllCaps);
  EXPECT_EQ(check_all_caps("MAX_size"), NamingViolation::NotAllCaps);
  EXPECT_EQ(check_all_caps("MAX-SIZE"), NamingViolation::NotAllCaps);
  EXPECT_EQ(check_all_caps("MAX$"), NamingViolation::NotAllCaps);
}

TEST(NamingRulesTest, EmptyConstantNameIsRejected)
{
  EXPECT_EQ(check_all_caps(""), NamingViolation::NotAllCaps);
}

// ============================================================================
// Non-ASCII names
// ============================================================================

TEST(NamingRulesTest, MultiByteCodePointsAreScannedWhole)
{
  // U+00E9 (e acute) is a lowercase letter encoded in two bytes
  EXPECT_EQ(lower_camel("caf\xC3\xA9"), std::nullopt);
  EXPECT_EQ(upper_camel("Caf\xC3\xA9" "Bar"), std::nullopt);
}

TEST(NamingRulesTest, MalformedUtf8StartIsNotCamelCase)
{
  // A lone continuation byte decodes to U+FFFD, which has no case
  EXPECT_EQ(lower_camel("\x80" "abc"), NamingViolation::NotCamelCase);
  EXPECT_EQ(check_all_caps("\x80" "ABC"), NamingViolation::NotAllCaps);
}

// ============================================================================
// Dispatch and presentation
// ============================================================================

TEST(NamingRulesTest, CheckConventionDispatches)
{
  EXPECT_EQ(check_convention("Parser", ConventionKind::UpperCamelCase), std::nullopt);
  EXPECT_EQ(
    check_convention("parser", ConventionKind::UpperCamelCase),
    NamingViolation::ShouldStartUppercase);
  EXPECT_EQ(
    check_convention("Parser", ConventionKind::LowerCamelCase),
    NamingViolation::ShouldStartLowercase);
  EXPECT_EQ(check_convention("MAX", ConventionKind::AllCapsUnderscore), std::nullopt);
  EXPECT_EQ(
    check_convention("Max", ConventionKind::AllCapsUnderscore), NamingViolation::NotAllCaps);
}

TEST(NamingRulesTest, ViolationCodesAreStable)
{
  EXPECT_STREQ(violation_code(NamingViolation::ShouldStartUppercase), "N001");
  EXPECT_STREQ(violation_code(NamingViolation::ShouldStartLowercase), "N002");
  EXPECT_STREQ(violation_code(NamingViolation::NotCamelCase), "N003");
  EXPECT_STREQ(violation_code(NamingViolation::NotAllCaps), "N004");
  EXPECT_STREQ(k_constructor_lookalike_code, "N005");
}

TEST(NamingRulesTest, MessagesNameTheOffender)
{
  EXPECT_EQ(
    violation_message(NamingViolation::ShouldStartUppercase, "myClass"),
    "name 'myClass' should start with an uppercase letter");
  EXPECT_EQ(
    violation_message(NamingViolation::ShouldStartLowercase, "DoWork"),
    "name 'DoWork' should start with a lowercase letter");
  EXPECT_EQ(
    violation_message(NamingViolation::NotCamelCase, "getHTTPCode"),
    "name 'getHTTPCode' should follow camelCase");
  EXPECT_EQ(
    violation_message(NamingViolation::NotAllCaps, "maxSize"),
    "constant 'maxSize' should be all uppercase letters or underscores, starting with a letter");
}

TEST(NamingRulesTest, HelpTextShowsAnExample)
{
  EXPECT_NE(convention_help(ConventionKind::UpperCamelCase).find("HttpServer"), std::string::npos);
  EXPECT_NE(convention_help(ConventionKind::LowerCamelCase).find("parseUrl"), std::string::npos);
  EXPECT_NE(convention_help(ConventionKind::AllCapsUnderscore).find("MAX_SIZE"), std::string::npos);
}

TEST(NamingRulesTest, ConstructorLookalikeMessage)
{
  const std::string msg = constructor_lookalike_message("Parser");
  EXPECT_NE(msg.find("'Parser'"), std::string::npos);
  EXPECT_NE(msg.find("constructor"), std::string::npos);
}
