#include <gtest/gtest.h>

#include "codec/symbolic_text_codec.hpp"
#include "flags/flag_decomposer.hpp"
#include "test_enums.hpp"

namespace sbr {
namespace {

using test_support::make_days;
using test_support::make_priority;
using test_support::make_sides;
using test_support::make_status;

class SymbolicTextCodecTest : public ::testing::Test {
protected:
    EnumDescriptor sides_ = make_sides();
    EnumDescriptor days_ = make_days();
};

// =============================================================================
// Formatting
// =============================================================================

TEST_F(SymbolicTextCodecTest, FormatsExactUnionInDeclarationOrder) {
    EXPECT_EQ(format(sides_, 3), "Left, Right");
    EXPECT_EQ(format(sides_, 12), "Top, Bottom");
    EXPECT_EQ(format(sides_, 8), "Bottom");
}

TEST_F(SymbolicTextCodecTest, FormatsZeroMember) {
    EXPECT_EQ(format(sides_, 0), "None");
    EXPECT_EQ(format(make_priority(), 0), "0");
}

TEST_F(SymbolicTextCodecTest, FallsBackToDecimal) {
    EXPECT_EQ(format(sides_, 255), "255");
    EXPECT_EQ(format(sides_, 16), "16");
    EXPECT_EQ(format(make_priority(), 999), "999");
}

TEST_F(SymbolicTextCodecTest, ValueBeyondWidthFormatsAsDecimal) {
    auto unsigned8 = make_sides(IntegralWidth::Bits8, false);
    EXPECT_EQ(format(unsigned8, 256), "256");
    EXPECT_EQ(format(unsigned8, 0x103), "259");
    EXPECT_EQ(format(unsigned8, 0x103, FormatStyle::Flags), "259");
    EXPECT_EQ(format(unsigned8, -1), "-1");

    auto reparsed = parse(unsigned8, format(unsigned8, 256));
    ASSERT_FALSE(reparsed.ok());
    EXPECT_EQ(reparsed.error().kind, ParseError::Kind::ValueOutOfRange);
}

TEST_F(SymbolicTextCodecTest, DeclaredCompositeWinsInGeneralStyle) {
    EXPECT_EQ(format(days_, 31), "Weekdays");
    EXPECT_EQ(format(days_, 96), "Weekend");
    EXPECT_EQ(format(days_, 21), "Monday, Wednesday, Friday");
}

TEST_F(SymbolicTextCodecTest, FlagsStyleListsAtomicMembers) {
    EXPECT_EQ(format(days_, 96, FormatStyle::Flags), "Saturday, Sunday");
    EXPECT_EQ(format(days_, 0, FormatStyle::Flags), "None");
    EXPECT_EQ(format(days_, 128, FormatStyle::Flags), "128");
}

TEST_F(SymbolicTextCodecTest, NonFlagEnumMatchesSingleValue) {
    auto status = make_status();
    EXPECT_EQ(format(status, 5), "Active");
    EXPECT_EQ(format(status, 5, FormatStyle::Flags), "Active");
    EXPECT_EQ(format(status, 7), "7");
    EXPECT_EQ(format(make_priority(), 3), "High");
}

TEST_F(SymbolicTextCodecTest, DecimalAndHexStyles) {
    EXPECT_EQ(format(sides_, 4, FormatStyle::Decimal), "4");
    EXPECT_EQ(format(sides_, 4, FormatStyle::Hex), "00000004");
    EXPECT_EQ(format(sides_, 3, FormatStyle::Hex), "00000003");

    auto signed8 = make_sides(IntegralWidth::Bits8, true);
    EXPECT_EQ(format(signed8, 255, FormatStyle::Decimal), "-1");
    EXPECT_EQ(format(signed8, -1, FormatStyle::Hex), "FF");
}

TEST_F(SymbolicTextCodecTest, ExactUnionMatchesAbsenceOfDecimalFallback) {
    for (int raw = 0; raw < 256; ++raw) {
        const std::string text = format(sides_, raw);
        const bool decimal = text == std::to_string(raw);
        EXPECT_EQ(is_exact_union(sides_, raw), !decimal) << raw;
    }
}

TEST_F(SymbolicTextCodecTest, FormatStyleLetters) {
    EXPECT_EQ(parse_format_style("G"), FormatStyle::General);
    EXPECT_EQ(parse_format_style("f"), FormatStyle::Flags);
    EXPECT_EQ(parse_format_style("D"), FormatStyle::Decimal);
    EXPECT_EQ(parse_format_style("x"), FormatStyle::Hex);
    EXPECT_FALSE(parse_format_style("Q").has_value());
    EXPECT_FALSE(parse_format_style("GG").has_value());
}

// =============================================================================
// Parsing
// =============================================================================

TEST_F(SymbolicTextCodecTest, ParsesCommaSeparatedNames) {
    auto result = parse(sides_, "Left, Right");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), WideInt{3});
}

TEST_F(SymbolicTextCodecTest, ParseIsCaseInsensitiveByDefault) {
    auto upper = parse(sides_, "LEFT,RIGHT");
    auto lower = parse(sides_, "left, right");
    ASSERT_TRUE(upper.ok());
    ASSERT_TRUE(lower.ok());
    EXPECT_EQ(upper.value(), lower.value());
    EXPECT_EQ(upper.value(), WideInt{3});
}

TEST_F(SymbolicTextCodecTest, CaseSensitiveParseRejectsWrongCase) {
    auto result = parse(sides_, "Left, right", true);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ParseError::Kind::UnknownMember);
    EXPECT_EQ(result.error().token, "right");
}

TEST_F(SymbolicTextCodecTest, UnknownMemberCarriesToken) {
    auto result = parse(sides_, "Left,Bogus");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ParseError::Kind::UnknownMember);
    EXPECT_EQ(result.error().token, "Bogus");
    EXPECT_EQ(to_string(result.error()), "'Bogus' is not a declared member");
}

TEST_F(SymbolicTextCodecTest, EmptyInputIsRejected) {
    for (const char* text : {"", "   ", "\t"}) {
        auto result = parse(sides_, text);
        ASSERT_FALSE(result.ok()) << text;
        EXPECT_EQ(result.error().kind, ParseError::Kind::EmptyInput);
    }
}

TEST_F(SymbolicTextCodecTest, EmptyTokenIsUnknown) {
    auto result = parse(sides_, "Left,,Right");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ParseError::Kind::UnknownMember);
    EXPECT_EQ(result.error().token, "");
}

TEST_F(SymbolicTextCodecTest, ParsesDecimalLiterals) {
    auto result = parse(sides_, "Left, 4");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), WideInt{5});

    auto undefined = parse(make_priority(), "999");
    ASSERT_TRUE(undefined.ok());
    EXPECT_EQ(undefined.value(), WideInt{999});
}

TEST_F(SymbolicTextCodecTest, LiteralOutsideWidthIsRejected) {
    auto unsigned8 = make_sides(IntegralWidth::Bits8, false);
    auto result = parse(unsigned8, "300");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ParseError::Kind::ValueOutOfRange);
    EXPECT_EQ(result.error().token, "300");
}

TEST_F(SymbolicTextCodecTest, ParsesCompositeAlias) {
    auto result = parse(days_, "Weekend, monday");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), WideInt{97});
}

TEST_F(SymbolicTextCodecTest, ParseInvertsFormatForExactUnions) {
    for (int raw = 0; raw < 16; ++raw) {
        auto parsed = parse(sides_, format(sides_, raw));
        ASSERT_TRUE(parsed.ok()) << raw;
        EXPECT_EQ(parsed.value(), WideInt{raw});
    }
    for (int raw = 0; raw < 128; ++raw) {
        auto parsed = parse(days_, format(days_, raw));
        ASSERT_TRUE(parsed.ok()) << raw;
        EXPECT_EQ(parsed.value(), WideInt{raw});
    }
}

TEST_F(SymbolicTextCodecTest, SignedNegativeMembersRoundTrip) {
    auto temps = EnumDescriptor::build("Temperature", {{"Freezing", -40}, {"Cold", 0}, {"Warm", 20}},
                                       IntegralWidth::Bits16, true);
    ASSERT_TRUE(temps.ok());
    EXPECT_EQ(format(temps.value(), -40), "Freezing");
    auto parsed = parse(temps.value(), "freezing");
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.value(), WideInt{-40});
}

} // namespace
} // namespace sbr
