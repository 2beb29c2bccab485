/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Syntax/Token.hpp>

#include <llvm/ADT/StringSet.h>
#include <llvm/Support/ErrorHandling.h>

namespace flagcleaner::syntax {

    llvm::StringRef tokenKindName(TokenKind kind) {
        switch (kind) {
            case TokenKind::Identifier:
                return "identifier";
            case TokenKind::Keyword:
                return "keyword";
            case TokenKind::IntegerLiteral:
                return "integer literal";
            case TokenKind::FloatLiteral:
                return "float literal";
            case TokenKind::StringLiteral:
                return "string literal";
            case TokenKind::RegexLiteral:
                return "regex literal";
            case TokenKind::Operator:
                return "operator";
            case TokenKind::LeftParen:
                return "'('";
            case TokenKind::RightParen:
                return "')'";
            case TokenKind::LeftBrace:
                return "'{'";
            case TokenKind::RightBrace:
                return "'}'";
            case TokenKind::LeftSquare:
                return "'['";
            case TokenKind::RightSquare:
                return "']'";
            case TokenKind::Comma:
                return "','";
            case TokenKind::Semicolon:
                return "';'";
            case TokenKind::Colon:
                return "':'";
            case TokenKind::Period:
                return "'.'";
            case TokenKind::AtSign:
                return "'@'";
            case TokenKind::PoundIf:
                return "#if";
            case TokenKind::PoundElseif:
                return "#elseif";
            case TokenKind::PoundElse:
                return "#else";
            case TokenKind::PoundEndif:
                return "#endif";
            case TokenKind::PoundKeyword:
                return "pound keyword";
            case TokenKind::Other:
                return "token";
            case TokenKind::EndOfFile:
                return "end of file";
        }
        llvm_unreachable("unknown token kind");
    }

    bool isKeyword(llvm::StringRef word) {
        static const llvm::StringSet<> keywords = {
            // declarations
            "associatedtype", "class", "deinit", "enum", "extension", "fileprivate", "func",
            "import", "init", "inout", "internal", "let", "open", "operator", "private",
            "precedencegroup", "protocol", "public", "rethrows", "static", "struct",
            "subscript", "typealias", "var",
            // statements
            "break", "case", "catch", "continue", "default", "defer", "do", "else",
            "fallthrough", "for", "guard", "if", "in", "repeat", "return", "throw", "switch",
            "where", "while",
            // expressions and types
            "Any", "as", "await", "false", "is", "nil", "self", "Self", "super", "throws",
            "true", "try"
        };
        return keywords.count(word) != 0;
    }

} // namespace flagcleaner::syntax
