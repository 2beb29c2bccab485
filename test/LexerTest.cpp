/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <flagcleaner/Syntax/Lexer.hpp>

using namespace flagcleaner;
using namespace flagcleaner::syntax;

namespace {

    std::vector< Token > lex(llvm::StringRef source) {
        auto tokens = tokenize(source);
        EXPECT_TRUE(static_cast< bool >(tokens)) << llvm::toString(tokens.takeError());
        return tokens ? std::move(*tokens) : std::vector< Token >{};
    }

    std::string reassemble(const std::vector< Token > &tokens) {
        std::string text;
        llvm::raw_string_ostream os(text);
        for (const auto &token : tokens) {
            token.print(os);
        }
        os.flush();
        return text;
    }

    std::string lexError(llvm::StringRef source) {
        auto tokens = tokenize(source);
        if (tokens) {
            return {};
        }
        return takeFailure(tokens.takeError(), ErrorKind::ReadFailure).message;
    }

} // namespace

TEST(LexerTest, ReproducesInput) {
    const char *source = "#!/usr/bin/env swift\n"
                         "import Foundation // trailing\n"
                         "\n"
                         "/* block /* nested */ */\n"
                         "let s = \"a \\(b + \"c\") d\"\n"
                         "let raw = #\"x\"y\"#\r\n"
                         "\tlet r = #/a+b/#\n"
                         "/// doc\n";
    EXPECT_EQ(reassemble(lex(source)), source);
}

TEST(LexerTest, ClassifiesDirectives) {
    auto tokens = lex("#if A\n#elseif B\n#else\n#endif\n#warning(\"x\")\n#import M");
    ASSERT_EQ(tokens.size(), 13u);
    EXPECT_EQ(tokens[0].kind, TokenKind::PoundIf);
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[2].kind, TokenKind::PoundElseif);
    EXPECT_EQ(tokens[4].kind, TokenKind::PoundElse);
    EXPECT_EQ(tokens[5].kind, TokenKind::PoundEndif);
    EXPECT_EQ(tokens[6].kind, TokenKind::PoundKeyword);
    EXPECT_EQ(tokens[6].text, "#warning");
    EXPECT_EQ(tokens[10].kind, TokenKind::PoundKeyword);
    EXPECT_EQ(tokens[10].text, "#import");
    EXPECT_EQ(tokens.back().kind, TokenKind::EndOfFile);
}

TEST(LexerTest, TrailingTriviaStopsAtLineBreak) {
    auto tokens = lex("let x = 1 // one\n  // two\nlet y = 2");
    ASSERT_GE(tokens.size(), 5u);

    const auto &one = tokens[3];
    EXPECT_EQ(one.text, "1");
    ASSERT_EQ(one.trailing.size(), 2u);
    EXPECT_EQ(one.trailing[0].kind, TriviaKind::Spaces);
    EXPECT_EQ(one.trailing[1].kind, TriviaKind::LineComment);
    EXPECT_EQ(one.trailing[1].text, "// one");

    const auto &let = tokens[4];
    EXPECT_TRUE(let.starts_line());
    ASSERT_EQ(let.leading.size(), 4u);
    EXPECT_EQ(let.leading[0].kind, TriviaKind::Newlines);
    EXPECT_EQ(let.leading[1].kind, TriviaKind::Spaces);
    EXPECT_EQ(let.leading[1].count, 2u);
    EXPECT_EQ(let.leading[2].text, "// two");
    EXPECT_EQ(let.leading[3].kind, TriviaKind::Newlines);
}

TEST(LexerTest, EndOfFileCarriesRemainingTrivia) {
    auto tokens = lex("x\n\n/// last\n");
    ASSERT_EQ(tokens.size(), 2u);
    const auto &eof = tokens.back();
    EXPECT_EQ(eof.kind, TokenKind::EndOfFile);
    ASSERT_EQ(eof.leading.size(), 3u);
    EXPECT_EQ(eof.leading[0].count, 2u);
    EXPECT_EQ(eof.leading[1].kind, TriviaKind::DocLineComment);
}

TEST(LexerTest, GroupsCarriageReturnLineFeeds) {
    auto tokens = lex("a\r\n\r\nb");
    ASSERT_EQ(tokens.size(), 3u);
    ASSERT_EQ(tokens[1].leading.size(), 1u);
    EXPECT_EQ(tokens[1].leading[0].kind, TriviaKind::CarriageReturnLineFeeds);
    EXPECT_EQ(tokens[1].leading[0].count, 2u);
}

TEST(LexerTest, OperatorBinding) {
    auto tokens = lex("!a && b! a+b");
    ASSERT_GE(tokens.size(), 8u);
    EXPECT_TRUE(tokens[0].is_prefix_operator());
    EXPECT_TRUE(tokens[2].is_operator("&&"));
    EXPECT_FALSE(tokens[2].is_prefix_operator());
    EXPECT_FALSE(tokens[2].is_postfix_operator());
    EXPECT_TRUE(tokens[4].is_postfix_operator());
    EXPECT_TRUE(tokens[6].is_operator("+"));
    EXPECT_TRUE(tokens[6].left_bound);
    EXPECT_TRUE(tokens[6].right_bound);
}

TEST(LexerTest, DoubleNegationIsOneOperator) {
    auto tokens = lex("!!FLAG");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_TRUE(tokens[0].is_operator("!!"));
}

TEST(LexerTest, KeywordsAndLiterals) {
    auto tokens = lex("func f() -> Int { return 0x1F + 2.5e3 }");
    EXPECT_TRUE(tokens[0].is_keyword("func"));
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[4].kind, TokenKind::Operator);
    EXPECT_EQ(tokens[5].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[6].kind, TokenKind::LeftBrace);
    EXPECT_TRUE(tokens[7].is_keyword("return"));
    EXPECT_EQ(tokens[8].kind, TokenKind::IntegerLiteral);
    EXPECT_EQ(tokens[10].kind, TokenKind::FloatLiteral);
}

TEST(LexerTest, MultilineStringIsOneToken) {
    auto tokens = lex("let s = \"\"\"\n  #if FLAG\n  \"\"\"\n");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[3].kind, TokenKind::StringLiteral);
}

TEST(LexerTest, ReportsUnterminatedLiterals) {
    EXPECT_EQ(lexError("let s = \"abc\nlet t = 1"), "1:9: unterminated string literal");
    EXPECT_EQ(lexError("x\n  /* open"), "2:3: unterminated '/*' comment");
    EXPECT_EQ(lexError("let r = #/abc"), "1:9: unterminated regex literal");
    EXPECT_EQ(lexError("let `x = 1"), "1:5: unterminated '`' identifier");
    EXPECT_TRUE(lexError("let s = \"ok\"").empty());
}
