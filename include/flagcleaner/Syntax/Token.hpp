/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <flagcleaner/Syntax/Trivia.hpp>

namespace flagcleaner::syntax {

    enum class TokenKind {
        Identifier,
        Keyword,
        IntegerLiteral,
        FloatLiteral,
        StringLiteral,
        RegexLiteral,
        Operator,
        LeftParen,
        RightParen,
        LeftBrace,
        RightBrace,
        LeftSquare,
        RightSquare,
        Comma,
        Semicolon,
        Colon,
        Period,
        AtSign,
        PoundIf,
        PoundElseif,
        PoundElse,
        PoundEndif,
        PoundKeyword, // any other `#name`, e.g. `#warning`, `#selector`
        Other,
        EndOfFile
    };

    llvm::StringRef tokenKindName(TokenKind kind);

    struct Token
    {
        TokenKind kind = TokenKind::EndOfFile;
        std::string text;

        Trivia leading;
        Trivia trailing;

        unsigned line   = 0;
        unsigned column = 0;

        // Operator spacing, as Swift uses it to tell prefix, postfix and
        // binary operators apart.
        bool left_bound  = false;
        bool right_bound = false;

        bool is(TokenKind k) const { return kind == k; }

        bool is_keyword(llvm::StringRef word) const {
            return kind == TokenKind::Keyword && text == word;
        }

        bool is_operator(llvm::StringRef op) const {
            return kind == TokenKind::Operator && text == op;
        }

        bool is_directive() const {
            return kind == TokenKind::PoundIf || kind == TokenKind::PoundElseif
                || kind == TokenKind::PoundElse || kind == TokenKind::PoundEndif;
        }

        bool is_prefix_operator() const {
            return kind == TokenKind::Operator && right_bound && !left_bound;
        }

        bool is_postfix_operator() const {
            return kind == TokenKind::Operator && left_bound && !right_bound;
        }

        bool starts_line() const { return containsLineBreak(leading); }

        void print(llvm::raw_ostream &os) const {
            printTrivia(os, leading);
            os << text;
            printTrivia(os, trailing);
        }
    };

    bool isKeyword(llvm::StringRef word);

} // namespace flagcleaner::syntax
