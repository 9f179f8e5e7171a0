#include <gtest/gtest.h>

#include "fxrates/service/rate_parser.hpp"

#include <stdexcept>
#include <string>

using namespace fxrates;

namespace {

// 2018-03-26 응답 일부
const std::string kLiveResponse =
    R"({"success":true,"terms":"https:\/\/currencylayer.com\/terms",)"
    R"("privacy":"https:\/\/currencylayer.com\/privacy","timestamp":1522051446,)"
    R"("source":"USD","quotes":{"USDAED":3.672504,"USDAFN":69.400002,)"
    R"("USDEUR":0.80929,"USDJPY":104.728996,"USDTHB":31.17037,"USDUSD":1}})";

}  // namespace

// ============================================================================
// parse_all
// ============================================================================

TEST(RateParserTest, ParseAll_TwoPairs_ReturnsBoth) {
    RateParser parser;
    auto rates = parser.parse_all(R"("USDTHB":31.17037,"USDJPY":104.728996)");

    ASSERT_EQ(rates.size(), 2u);
    EXPECT_DOUBLE_EQ(rates.at("THB"), 31.17037);
    EXPECT_DOUBLE_EQ(rates.at("JPY"), 104.728996);
}

TEST(RateParserTest, ParseAll_EmptyText_ReturnsEmptyTable) {
    RateParser parser;
    EXPECT_TRUE(parser.parse_all("").empty());
}

TEST(RateParserTest, ParseAll_NoMatches_ReturnsEmptyTable) {
    RateParser parser;
    EXPECT_TRUE(parser.parse_all(R"({"success":false,"error":{"code":101}})").empty());
}

TEST(RateParserTest, ParseAll_DuplicateCode_LastValueWins) {
    RateParser parser;
    auto rates = parser.parse_all(R"("USDTHB":31.1,"USDJPY":104.7,"USDTHB":32.5)");

    ASSERT_EQ(rates.size(), 2u);
    EXPECT_DOUBLE_EQ(rates.at("THB"), 32.5);
}

TEST(RateParserTest, ParseAll_AdjacentMatches_AllCounted) {
    RateParser parser;
    std::string text = R"("USDAAA":1.1"USDBBB":2.2"USDCCC":3.3"USDDDD":4.4)";
    auto rates = parser.parse_all(text);

    ASSERT_EQ(rates.size(), 4u);
    EXPECT_DOUBLE_EQ(rates.at("AAA"), 1.1);
    EXPECT_DOUBLE_EQ(rates.at("BBB"), 2.2);
    EXPECT_DOUBLE_EQ(rates.at("CCC"), 3.3);
    EXPECT_DOUBLE_EQ(rates.at("DDD"), 4.4);
}

TEST(RateParserTest, ParseAll_MalformedLiteral_SkipsOnlyThatEntry) {
    RateParser parser;
    auto rates = parser.parse_all(R"("USDXXX":abc,"USDYYY":2.5)");

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_EQ(rates.count("XXX"), 0u);
    EXPECT_DOUBLE_EQ(rates.at("YYY"), 2.5);
}

TEST(RateParserTest, ParseAll_OutOfRangeLiteral_SkipsOnlyThatEntry) {
    RateParser parser;
    std::string huge = std::string(400, '9') + ".5";
    auto rates = parser.parse_all("\"USDBIG\":" + huge + ",\"USDTHB\":31.17");

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_EQ(rates.count("BIG"), 0u);
    EXPECT_DOUBLE_EQ(rates.at("THB"), 31.17);
}

TEST(RateParserTest, ParseAll_WhitespaceAfterColon_Matches) {
    RateParser parser;
    auto rates = parser.parse_all("\"USDTHB\": \t31.17037");

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_DOUBLE_EQ(rates.at("THB"), 31.17037);
}

TEST(RateParserTest, ParseAll_LeadingDigitRequired) {
    RateParser parser;
    auto rates = parser.parse_all(R"("USDAAA":.5,"USDBBB":7,"USDCCC":0.25)");

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_DOUBLE_EQ(rates.at("CCC"), 0.25);
}

TEST(RateParserTest, ParseAll_LowercaseOrOtherBase_Ignored) {
    RateParser parser;
    auto rates = parser.parse_all(R"("USDthb":31.1,"EURTHB":38.2,"USDJPY":104.7)");

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_DOUBLE_EQ(rates.at("JPY"), 104.7);
}

TEST(RateParserTest, ParseAll_LiveResponse_SortedByCode) {
    RateParser parser;
    auto rates = parser.parse_all(kLiveResponse);

    // "USDUSD":1 은 정수라서 제외
    ASSERT_EQ(rates.size(), 5u);
    auto it = rates.begin();
    EXPECT_EQ((it++)->first, "AED");
    EXPECT_EQ((it++)->first, "AFN");
    EXPECT_EQ((it++)->first, "EUR");
    EXPECT_EQ((it++)->first, "JPY");
    EXPECT_EQ((it++)->first, "THB");
    EXPECT_DOUBLE_EQ(rates.at("EUR"), 0.80929);
}

TEST(RateParserTest, ParseAll_CustomBase) {
    RateParser parser("EUR");
    auto rates = parser.parse_all(R"("EURUSD":1.2356,"USDTHB":31.1)");

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_DOUBLE_EQ(rates.at("USD"), 1.2356);
}

// ============================================================================
// parse_one
// ============================================================================

TEST(RateParserTest, ParseOne_PresentCode_ReturnsRate) {
    RateParser parser;
    const std::string text = R"("USDTHB":31.17037,"USDJPY":104.728996)";

    EXPECT_DOUBLE_EQ(parser.parse_one("THB", text), 31.17037);
    EXPECT_DOUBLE_EQ(parser.parse_one("JPY", text), 104.728996);
}

TEST(RateParserTest, ParseOne_AbsentCode_ReturnsZero) {
    RateParser parser;
    EXPECT_EQ(parser.parse_one("EUR", R"("USDTHB":31.17037,"USDJPY":104.728996)"), 0.0);
}

TEST(RateParserTest, ParseOne_EmptyText_ReturnsZero) {
    RateParser parser;
    EXPECT_EQ(parser.parse_one("THB", ""), 0.0);
}

TEST(RateParserTest, ParseOne_Duplicate_ReturnsFirst) {
    RateParser parser;
    EXPECT_DOUBLE_EQ(parser.parse_one("THB", R"("USDTHB":31.1,"USDTHB":32.5)"), 31.1);
}

TEST(RateParserTest, ParseOne_MalformedValue_ReturnsZero) {
    RateParser parser;
    EXPECT_EQ(parser.parse_one("XXX", R"("USDXXX":abc)"), 0.0);
    EXPECT_EQ(parser.parse_one("BIG", "\"USDBIG\":" + std::string(400, '9') + ".5"), 0.0);
}

TEST(RateParserTest, ParseOne_InvalidCode_ReturnsZero) {
    RateParser parser;
    const std::string text = R"("USDTHB":31.17037)";

    EXPECT_EQ(parser.parse_one("thb", text), 0.0);
    EXPECT_EQ(parser.parse_one("TH", text), 0.0);
    EXPECT_EQ(parser.parse_one(".*", text), 0.0);
}

TEST(RateParserTest, Constructor_InvalidBase_Throws) {
    EXPECT_THROW(RateParser("usd"), std::invalid_argument);
    EXPECT_THROW(RateParser("US"), std::invalid_argument);
    EXPECT_NO_THROW(RateParser("EUR"));
}
