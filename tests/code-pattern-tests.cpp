#include <gtest/gtest.h>

#include <stdexcept>

#include "code-match.h"
#include "code-pattern.h"

// Classify the first match in text, fails the test if nothing matches.
inline CodeMatch first_match(const CodePattern & pattern, const std::string & text)
{
    boost::smatch match;

    if (!boost::regex_search(text, match, pattern.regex()))
    {
        throw std::runtime_error("No code found in " + text);
    }

    return classify_match(match);
}

inline size_t count_matches(const CodePattern & pattern, const std::string & text)
{
    boost::sregex_iterator it(text.begin(), text.end(), pattern.regex());
    boost::sregex_iterator end;

    return static_cast<size_t>(std::distance(it, end));
}

TEST(CodePatternTests, EscapeToken)
{
    CodePattern ampersand("&");
    EXPECT_EQ(ampersand.marker(), "&");
    EXPECT_EQ(ampersand.escape_token(), "&_");

    CodePattern section("§");
    EXPECT_EQ(section.escape_token(), "§_");
}

TEST(CodePatternTests, MarkerValidation)
{
    EXPECT_TRUE(is_valid_marker("&"));
    EXPECT_TRUE(is_valid_marker("e"));
    EXPECT_TRUE(is_valid_marker("§"));
    EXPECT_TRUE(is_valid_marker("€"));
    EXPECT_TRUE(is_valid_marker("\xF0\x9F\x8E\xA8"));

    EXPECT_FALSE(is_valid_marker(""));
    EXPECT_FALSE(is_valid_marker("&&"));
    EXPECT_FALSE(is_valid_marker("ab"));
    EXPECT_FALSE(is_valid_marker("\xC2"));
    EXPECT_FALSE(is_valid_marker("\xA7"));
    EXPECT_FALSE(is_valid_marker("\xC2\x41"));

    // Overlong forms, a surrogate and a code point past U+10FFFF.
    EXPECT_FALSE(is_valid_marker("\xC0\xA6"));
    EXPECT_FALSE(is_valid_marker("\xE0\x80\x80"));
    EXPECT_FALSE(is_valid_marker("\xED\xA0\x80"));
    EXPECT_FALSE(is_valid_marker("\xF0\x80\x80\xA6"));
    EXPECT_FALSE(is_valid_marker("\xF4\x90\x80\x80"));

    // Edges of the narrowed ranges are still accepted.
    EXPECT_TRUE(is_valid_marker("\xE0\xA0\x80"));
    EXPECT_TRUE(is_valid_marker("\xED\x9F\xBF"));
    EXPECT_TRUE(is_valid_marker("\xF0\x90\x80\x80"));
    EXPECT_TRUE(is_valid_marker("\xF4\x8F\xBF\xBF"));

    EXPECT_THROW(CodePattern(""), std::invalid_argument);
    EXPECT_THROW(CodePattern("&&"), std::invalid_argument);
    EXPECT_THROW(CodePattern("\xED\xA0\x80"), std::invalid_argument);
}

TEST(CodePatternTests, EscapeRegexLiteral)
{
    EXPECT_EQ(escape_regex_literal("&"), "&");
    EXPECT_EQ(escape_regex_literal("$"), "\\$");
    EXPECT_EQ(escape_regex_literal("."), "\\.");
    EXPECT_EQ(escape_regex_literal("\\"), "\\\\");
    EXPECT_EQ(escape_regex_literal("["), "\\[");
    EXPECT_EQ(escape_regex_literal("§"), "§");
}

TEST(CodePatternTests, ClassifiesEveryKind)
{
    CodePattern pattern("&");

    CodeMatch color = first_match(pattern, "x&4y");
    ASSERT_TRUE(std::holds_alternative<ColorCode>(color));
    EXPECT_EQ(std::get<ColorCode>(color).code, '4');
    EXPECT_FALSE(std::get<ColorCode>(color).background);

    CodeMatch bg_color = first_match(pattern, "&~e");
    ASSERT_TRUE(std::holds_alternative<ColorCode>(bg_color));
    EXPECT_EQ(std::get<ColorCode>(bg_color).code, 'e');
    EXPECT_TRUE(std::get<ColorCode>(bg_color).background);

    CodeMatch formatter = first_match(pattern, "&n");
    ASSERT_TRUE(std::holds_alternative<FormatterCode>(formatter));
    EXPECT_EQ(std::get<FormatterCode>(formatter).code, 'n');

    CodeMatch full_reset = first_match(pattern, "&R");
    ASSERT_TRUE(std::holds_alternative<ResetCode>(full_reset));
    EXPECT_EQ(std::get<ResetCode>(full_reset).code, "R");

    CodeMatch color_reset = first_match(pattern, "&rc");
    ASSERT_TRUE(std::holds_alternative<ResetCode>(color_reset));
    EXPECT_EQ(std::get<ResetCode>(color_reset).code, "rc");

    CodeMatch hex = first_match(pattern, "&~#f0f;");
    ASSERT_TRUE(std::holds_alternative<HexCode>(hex));
    EXPECT_TRUE(std::get<HexCode>(hex).background);
    EXPECT_EQ(std::get<HexCode>(hex).rgb, (RGB{255, 0, 255}));
}

TEST(CodePatternTests, RejectsIncompleteCodes)
{
    CodePattern pattern("&");

    // Not codes at all.
    EXPECT_EQ(count_matches(pattern, "plain text"), 0);
    EXPECT_EQ(count_matches(pattern, "&g &p &z &_4 &r &~ &~n"), 0);

    // Hex needs 3 or 6 digits and the terminating ';'.
    EXPECT_EQ(count_matches(pattern, "&#ff;"), 0);
    EXPECT_EQ(count_matches(pattern, "&#ffff;"), 0);
    EXPECT_EQ(count_matches(pattern, "&#fff"), 0);
    EXPECT_EQ(count_matches(pattern, "&#FFF;"), 0);

    // Uppercase letters other than R are plain text.
    EXPECT_EQ(count_matches(pattern, "&A &L"), 0);
}

TEST(CodePatternTests, CountsEveryCode)
{
    CodePattern pattern("&");

    EXPECT_EQ(count_matches(pattern, "&a&~b&l&rl&R&rf&rb&#abc;&~#aabbcc;"), 9);

    // "&ra" is not a reset, "&r" is never a code on its own.
    EXPECT_EQ(count_matches(pattern, "&ra"), 0);
}

TEST(CodePatternTests, MetacharacterMarkers)
{
    for (std::string marker : {"$", "^", "?", "(", ")", "\\", "/", "[", "]",
                               "*", "+", ".", "|", "{", "}", "#", "~"})
    {
        CodePattern pattern(marker);

        EXPECT_EQ(count_matches(pattern, marker + "4foo" + marker + "R"), 2)
            << "marker " << marker;

        // The marker must not behave like regex syntax.
        EXPECT_EQ(count_matches(pattern, "x4foo"), 0) << "marker " << marker;
    }
}

TEST(CodePatternTests, HexParsing)
{
    EXPECT_EQ(parse_hex_color("f0f"), (RGB{255, 0, 255}));
    EXPECT_EQ(parse_hex_color("ff00ff"), (RGB{255, 0, 255}));
    EXPECT_EQ(parse_hex_color("f00ffa"), (RGB{240, 15, 250}));
    EXPECT_EQ(parse_hex_color("000"), (RGB{0, 0, 0}));
    EXPECT_EQ(parse_hex_color("abc"), (RGB{170, 187, 204}));

    EXPECT_FALSE(parse_hex_color(""));
    EXPECT_FALSE(parse_hex_color("ff"));
    EXPECT_FALSE(parse_hex_color("ffff"));
    EXPECT_FALSE(parse_hex_color("fffffff"));
    EXPECT_FALSE(parse_hex_color("ggg"));
}
