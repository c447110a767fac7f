#include "lexer/tokenizer.hpp"

#include <gtest/gtest.h>

using namespace hbs;
using namespace hbs::lexer;

class TokenizerTest : public ::testing::Test {
protected:
    Tokenizer tokenizer_;

    auto scan(std::string_view code) -> std::vector<Token> {
        return tokenizer_.scan(code);
    }

    auto scan_one(std::string_view code) -> Token {
        auto tokens = scan(code);
        EXPECT_EQ(tokens.size(), 1u);
        return tokens.empty() ? Token{} : tokens[0];
    }
};

// Plain text and interpolation
TEST_F(TokenizerTest, PlainTextOnly) {
    auto token = scan_one("Hello, world");
    EXPECT_EQ(token.kind, TagKind::Text);
    EXPECT_EQ(token.value, "Hello, world");
    EXPECT_EQ(token.name, "Hello, world");
    EXPECT_EQ(token.index, 12u);
}

TEST_F(TokenizerTest, EmptyInput) {
    EXPECT_TRUE(scan("").empty());
    EXPECT_FALSE(tokenizer_.has_errors());
}

TEST_F(TokenizerTest, TextAroundInterpolation) {
    auto tokens = scan("Hello {{name}}!");
    ASSERT_EQ(tokens.size(), 3u);

    EXPECT_EQ(tokens[0].kind, TagKind::Text);
    EXPECT_EQ(tokens[0].value, "Hello ");
    EXPECT_EQ(tokens[0].index, 6u);

    EXPECT_EQ(tokens[1].kind, TagKind::Escaped);
    EXPECT_EQ(tokens[1].name, "name");
    EXPECT_EQ(tokens[1].open_delimiter, "{{");
    EXPECT_EQ(tokens[1].close_delimiter, "}}");
    EXPECT_EQ(tokens[1].index, 14u);
    EXPECT_FALSE(tokens[1].args.has_value());

    EXPECT_EQ(tokens[2].kind, TagKind::Text);
    EXPECT_EQ(tokens[2].value, "!");
}

TEST_F(TokenizerTest, TagBodyIsTrimmed) {
    auto token = scan_one("{{   user.name \t}}");
    EXPECT_EQ(token.kind, TagKind::Escaped);
    EXPECT_EQ(token.name, "user.name");
}

TEST_F(TokenizerTest, TripleBraceUnescaped) {
    auto tokens = scan("{{{raw}}}x");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TagKind::Unescaped);
    EXPECT_EQ(tokens[0].name, "raw");
    EXPECT_EQ(tokens[0].index, 8u);
    EXPECT_EQ(tokens[0].span.start.offset, 0u);
    EXPECT_EQ(tokens[0].span.start.length, 9u);
    EXPECT_EQ(tokens[1].value, "x");
}

TEST_F(TokenizerTest, AmpersandUnescaped) {
    auto token = scan_one("{{& raw }}");
    EXPECT_EQ(token.kind, TagKind::UnescapedAmp);
    EXPECT_EQ(token.name, "raw");
}

TEST_F(TokenizerTest, UnknownSigilIsInterpolation) {
    auto token = scan_one("{{%name}}");
    EXPECT_EQ(token.kind, TagKind::Escaped);
    EXPECT_EQ(token.name, "%name");
}

// Sections
TEST_F(TokenizerTest, SectionWithArgs) {
    auto token = scan_one("{{#each  items limit=3}}");
    EXPECT_EQ(token.kind, TagKind::Section);
    EXPECT_EQ(token.name, "each");
    ASSERT_TRUE(token.args.has_value());
    EXPECT_EQ(*token.args, "items limit=3");
}

TEST_F(TokenizerTest, SectionWithoutArgsHasEmptyArgs) {
    auto token = scan_one("{{#if}}");
    EXPECT_EQ(token.kind, TagKind::Section);
    EXPECT_EQ(token.name, "if");
    ASSERT_TRUE(token.args.has_value());
    EXPECT_TRUE(token.args->empty());
}

TEST_F(TokenizerTest, InvertedSectionKeepsWholeBody) {
    auto token = scan_one("{{^ no items }}");
    EXPECT_EQ(token.kind, TagKind::Inverted);
    EXPECT_EQ(token.name, "no items");
    EXPECT_FALSE(token.args.has_value());
}

TEST_F(TokenizerTest, EndSectionIndexPointsAtOpenDelimiter) {
    auto tokens = scan("{{#a}}x{{/a}}");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TagKind::Section);
    EXPECT_EQ(tokens[0].index, 6u);
    EXPECT_EQ(tokens[1].value, "x");
    EXPECT_EQ(tokens[1].index, 7u);
    EXPECT_EQ(tokens[2].kind, TagKind::EndSection);
    EXPECT_EQ(tokens[2].name, "a");
    EXPECT_EQ(tokens[2].index, 7u);
}

TEST_F(TokenizerTest, SectionBlockAcrossLines) {
    auto tokens = scan("{{#items}}\n- {{name}}\n{{/items}}\n");
    ASSERT_EQ(tokens.size(), 5u);

    EXPECT_EQ(tokens[0].kind, TagKind::Section);
    EXPECT_EQ(tokens[0].name, "items");

    EXPECT_EQ(tokens[1].kind, TagKind::Text);
    EXPECT_EQ(tokens[1].value, "- ");
    EXPECT_EQ(tokens[1].index, 13u);

    EXPECT_EQ(tokens[2].kind, TagKind::Escaped);
    EXPECT_EQ(tokens[2].name, "name");
    EXPECT_EQ(tokens[2].index, 21u);

    EXPECT_EQ(tokens[3].kind, TagKind::Text);
    EXPECT_EQ(tokens[3].value, "\n");
    EXPECT_EQ(tokens[3].index, 22u);

    EXPECT_EQ(tokens[4].kind, TagKind::EndSection);
    EXPECT_EQ(tokens[4].name, "items");
    EXPECT_EQ(tokens[4].index, 22u);
}

// Comments and partials
TEST_F(TokenizerTest, Comment) {
    auto token = scan_one("{{! a note }}");
    EXPECT_EQ(token.kind, TagKind::Comment);
    EXPECT_EQ(token.name, "a note");
}

TEST_F(TokenizerTest, PartialBothSpellings) {
    auto gt = scan_one("{{> row cols=2}}");
    EXPECT_EQ(gt.kind, TagKind::Partial);
    EXPECT_EQ(gt.name, "row");
    EXPECT_EQ(gt.args.value_or(""), "cols=2");

    auto lt = scan_one("{{<row}}");
    EXPECT_EQ(lt.kind, TagKind::PartialAlt);
    EXPECT_EQ(lt.name, "row");
    EXPECT_EQ(lt.args.value_or("?"), "");
}

// Escapes
TEST_F(TokenizerTest, EscapedOpenDelimiterIsLiteral) {
    auto token = scan_one("\\{{x}}");
    EXPECT_EQ(token.kind, TagKind::Text);
    EXPECT_EQ(token.value, "{{x}}");
    EXPECT_EQ(token.index, 6u);
}

TEST_F(TokenizerTest, BackslashBeforeOtherCharIsKept) {
    auto token = scan_one("a\\b");
    EXPECT_EQ(token.value, "a\\b");
}

TEST_F(TokenizerTest, TrailingBackslash) {
    auto token = scan_one("end\\");
    EXPECT_EQ(token.value, "end\\");
}

// Delimiters
TEST_F(TokenizerTest, DelimiterChangeTag) {
    auto tokens = scan("{{=<% %>=}}<%name%> {{literal}}");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TagKind::Escaped);
    EXPECT_EQ(tokens[0].name, "name");
    EXPECT_EQ(tokens[0].open_delimiter, "<%");
    EXPECT_EQ(tokens[0].close_delimiter, "%>");
    EXPECT_EQ(tokens[0].index, 19u);
    EXPECT_EQ(tokens[1].kind, TagKind::Text);
    EXPECT_EQ(tokens[1].value, " {{literal}}");
    EXPECT_FALSE(tokenizer_.has_errors());
}

TEST_F(TokenizerTest, DelimiterChangeBackToDefault) {
    auto tokens = scan("{{=| |=}}|a||={{ }}=|{{b}}");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].name, "a");
    EXPECT_EQ(tokens[0].open_delimiter, "|");
    EXPECT_EQ(tokens[1].name, "b");
    EXPECT_EQ(tokens[1].open_delimiter, "{{");
}

TEST_F(TokenizerTest, DelimiterOverride) {
    auto tokens = tokenizer_.scan("<%#list%>{{x}}<%/list%>", "<% %>");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TagKind::Section);
    EXPECT_EQ(tokens[0].name, "list");
    EXPECT_EQ(tokens[1].value, "{{x}}");
    EXPECT_EQ(tokens[2].kind, TagKind::EndSection);
    EXPECT_EQ(tokens[2].index, 14u);
}

TEST_F(TokenizerTest, DelimiterOverrideWithExtraWhitespace) {
    auto token = tokenizer_.scan("[[x]]", "  [[ \t ]]  ")[0];
    EXPECT_EQ(token.kind, TagKind::Escaped);
    EXPECT_EQ(token.name, "x");
}

TEST_F(TokenizerTest, BlankDelimiterOverrideIsIgnored) {
    auto token = tokenizer_.scan("{{x}}", "   ")[0];
    EXPECT_EQ(token.kind, TagKind::Escaped);
    EXPECT_FALSE(tokenizer_.has_errors());
}

TEST_F(TokenizerTest, EscapeUsesActiveOpenDelimiter) {
    auto tokens = tokenizer_.scan("\\<%a%>", "<% %>");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, "<%a%>");
}

TEST_F(TokenizerTest, CustomDelimiterUnescapedTrimsBrace) {
    auto token = tokenizer_.scan("<%{ raw }%>", "<% %>")[0];
    EXPECT_EQ(token.kind, TagKind::Unescaped);
    EXPECT_EQ(token.name, "raw");
}

TEST_F(TokenizerTest, CustomDelimiterAmpersand) {
    auto token = tokenizer_.scan("<%&raw%>", "<% %>")[0];
    EXPECT_EQ(token.kind, TagKind::UnescapedAmp);
    EXPECT_EQ(token.name, "raw");
}

// Spans
TEST_F(TokenizerTest, SpansCoverWholeTag) {
    auto tokens = scan("ab\n  {{name}}");
    ASSERT_EQ(tokens.size(), 4u);
    const auto& tag = tokens[3];
    EXPECT_EQ(tag.span.start.line, 2u);
    EXPECT_EQ(tag.span.start.column, 3u);
    EXPECT_EQ(tag.span.start.offset, 5u);
    EXPECT_EQ(tag.span.start.length, 8u);
    EXPECT_EQ(tag.span.end.offset, 12u);
}

// Reuse
TEST_F(TokenizerTest, ScanResetsState) {
    auto first = tokenizer_.scan("{{=<% %>=}}<%a%>{{b");
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[1].value, "{{b");
    EXPECT_FALSE(tokenizer_.has_errors());

    auto second = scan("{{x}}");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].kind, TagKind::Escaped);
    EXPECT_EQ(second[0].open_delimiter, "{{");
}

TEST_F(TokenizerTest, ErrorsClearedBetweenScans) {
    (void)scan("{{oops");
    EXPECT_TRUE(tokenizer_.has_errors());
    (void)scan("fine");
    EXPECT_FALSE(tokenizer_.has_errors());
}

// Errors
TEST_F(TokenizerTest, UnterminatedTag) {
    auto tokens = scan("abc {{name");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, "abc ");

    ASSERT_EQ(tokenizer_.errors().size(), 1u);
    const auto& err = tokenizer_.errors()[0];
    EXPECT_EQ(err.code, "L001");
    EXPECT_EQ(err.span.start.offset, 4u);
    EXPECT_EQ(err.span.start.column, 5u);
}

TEST_F(TokenizerTest, OpenDelimiterAtEndOfInput) {
    auto tokens = scan("x{{");
    ASSERT_EQ(tokens.size(), 1u);
    ASSERT_EQ(tokenizer_.errors().size(), 1u);
    EXPECT_EQ(tokenizer_.errors()[0].code, "L001");
}

TEST_F(TokenizerTest, UnterminatedDelimiterChange) {
    auto tokens = scan("a{{=<% %>");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, "a");
    ASSERT_EQ(tokenizer_.errors().size(), 1u);
    EXPECT_EQ(tokenizer_.errors()[0].code, "L002");
}

TEST_F(TokenizerTest, MalformedDelimiterChangeKeepsDelimiters) {
    auto tokens = scan("{{=<%=}}{{x}}");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].name, "x");
    EXPECT_EQ(tokens[0].open_delimiter, "{{");
    ASSERT_EQ(tokenizer_.errors().size(), 1u);
    EXPECT_EQ(tokenizer_.errors()[0].code, "L003");
}

TEST_F(TokenizerTest, InvalidDelimiterOverride) {
    auto tokens = tokenizer_.scan("{{x}}", "<%");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TagKind::Escaped);
    ASSERT_EQ(tokenizer_.errors().size(), 1u);
    EXPECT_EQ(tokenizer_.errors()[0].code, "L004");

    (void)tokenizer_.scan("{{x}}", "a b c");
    ASSERT_EQ(tokenizer_.errors().size(), 1u);
    EXPECT_EQ(tokenizer_.errors()[0].code, "L004");
}

// Input kinds
namespace {

class FixedProvider : public TextProvider {
public:
    explicit FixedProvider(std::string text) : text_(std::move(text)) {}

    auto text() const -> std::string override {
        return text_;
    }

private:
    std::string text_;
};

} // namespace

TEST_F(TokenizerTest, ScanFromTextProvider) {
    FixedProvider provider("Hi {{who}}");
    auto tokens = tokenizer_.scan(std::cref<TextProvider>(provider));
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].name, "who");
}

TEST_F(TokenizerTest, ScanFromSource) {
    auto source = Source::from_string("{{#a}}{{/a}}", "inline.hbs");
    const TextProvider& provider = source;
    auto tokens = tokenizer_.scan(std::cref(provider));
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TagKind::Section);
    EXPECT_EQ(tokens[1].kind, TagKind::EndSection);
}

// Gettext extension
TEST(TokenizerGettextTest, DisabledByDefault) {
    Tokenizer tokenizer;
    EXPECT_FALSE(tokenizer.options().enable_gettext);

    auto tokens = tokenizer.scan("{{_ Hello}}{{ngettext one many}}");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TagKind::Escaped);
    EXPECT_EQ(tokens[0].name, "_ Hello");
    EXPECT_EQ(tokens[1].kind, TagKind::Escaped);
    EXPECT_EQ(tokens[1].name, "ngettext one many");
}

TEST(TokenizerGettextTest, GettextSigil) {
    Tokenizer tokenizer(TokenizerOptions{.enable_gettext = true});
    auto tokens = tokenizer.scan("{{_ Hello world }}");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TagKind::Gettext);
    EXPECT_EQ(tokens[0].name, "Hello world");
}

TEST(TokenizerGettextTest, NGettextKeyword) {
    Tokenizer tokenizer(TokenizerOptions{.enable_gettext = true});
    auto tokens = tokenizer.scan("{{ngettext  item items}}");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TagKind::NGettext);
    EXPECT_EQ(tokens[0].name, "item");
    EXPECT_EQ(tokens[0].args.value_or(""), "items");
}

TEST(TokenizerGettextTest, NGettextNeedsWhitespace) {
    Tokenizer tokenizer(TokenizerOptions{.enable_gettext = true});
    auto tokens = tokenizer.scan("{{ngettextual}}");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TagKind::Escaped);
    EXPECT_EQ(tokens[0].name, "ngettextual");
}

TEST(TokenizerGettextTest, CreateFromOptionMap) {
    auto result = Tokenizer::create(OptionMap{{"enable_gettext", true}});
    ASSERT_TRUE(is_ok(result));
    auto& tokenizer = unwrap(result);
    EXPECT_TRUE(tokenizer.options().enable_gettext);
    auto tokens = tokenizer.scan("{{_ x}}");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TagKind::Gettext);
}

TEST(TokenizerGettextTest, CreateRejectsNonBoolean) {
    auto result = Tokenizer::create(OptionMap{{"enable_gettext", std::string{"yes"}}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).option, "enable_gettext");
}

TEST(SigilTableTest, GettextSigilsOnlyInExtendedTable) {
    EXPECT_FALSE(SigilTable::base().lookup('_').has_value());
    EXPECT_EQ(SigilTable::with_gettext().lookup('_'), TagKind::Gettext);
    EXPECT_FALSE(SigilTable::base().contains(TagKind::NGettext));
    EXPECT_TRUE(SigilTable::with_gettext().contains(TagKind::NGettext));
    EXPECT_EQ(SigilTable::base().lookup('#'), TagKind::Section);
    EXPECT_FALSE(SigilTable::base().lookup('a').has_value());
}
