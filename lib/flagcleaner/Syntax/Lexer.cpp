/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Syntax/Lexer.hpp>

#include <cctype>

#include <llvm/ADT/StringSwitch.h>

namespace flagcleaner::syntax {

    namespace {
        bool isIdentifierHead(char c) {
            return std::isalpha(static_cast< unsigned char >(c)) || c == '_'
                || static_cast< unsigned char >(c) >= 0x80;
        }

        bool isIdentifierBody(char c) {
            return isIdentifierHead(c) || std::isdigit(static_cast< unsigned char >(c));
        }

        bool isDigit(char c) { return std::isdigit(static_cast< unsigned char >(c)); }

        bool isOperatorChar(char c) {
            return llvm::StringRef("/=-+!*%<>&|^~?").contains(c);
        }

        bool isWhitespace(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        // Characters that leave an operator unbound on the respective side.
        bool breaksLeftBinding(char c) {
            return isWhitespace(c) || llvm::StringRef("([{,;:").contains(c);
        }

        bool breaksRightBinding(char c) {
            return c == '\0' || isWhitespace(c) || llvm::StringRef(")]},;:").contains(c);
        }
    } // namespace

    void Lexer::advance(std::size_t count) {
        for (std::size_t i = 0; i < count && !at_end(); ++i) {
            if (source[pos] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
            ++pos;
        }
    }

    llvm::Error
    Lexer::error_at(unsigned at_line, unsigned at_column, const llvm::Twine &msg) const {
        return error(
            ErrorKind::ParseFailure,
            llvm::Twine(at_line) + ":" + llvm::Twine(at_column) + ": " + msg
        );
    }

    llvm::Error Lexer::lex_trivia(Trivia &trivia, bool trailing) {
        auto count_run = [this](char c) {
            unsigned count = 0;
            while (!at_end() && peek() == c) {
                advance();
                ++count;
            }
            return count;
        };

        while (!at_end()) {
            switch (peek()) {
                case ' ':
                    trivia.push_back(TriviaPiece::run(TriviaKind::Spaces, count_run(' ')));
                    break;
                case '\t':
                    trivia.push_back(TriviaPiece::run(TriviaKind::Tabs, count_run('\t')));
                    break;
                case '\v':
                    trivia.push_back(TriviaPiece::run(TriviaKind::VerticalTabs, count_run('\v')));
                    break;
                case '\f':
                    trivia.push_back(TriviaPiece::run(TriviaKind::FormFeeds, count_run('\f')));
                    break;
                case '\n':
                    if (trailing) {
                        return llvm::Error::success();
                    }
                    trivia.push_back(TriviaPiece::run(TriviaKind::Newlines, count_run('\n')));
                    break;
                case '\r': {
                    if (trailing) {
                        return llvm::Error::success();
                    }
                    if (peek(1) != '\n') {
                        trivia.push_back(
                            TriviaPiece::run(TriviaKind::CarriageReturns, count_run('\r'))
                        );
                        break;
                    }
                    unsigned count = 0;
                    while (peek() == '\r' && peek(1) == '\n') {
                        advance(2);
                        ++count;
                    }
                    trivia.push_back(TriviaPiece::run(TriviaKind::CarriageReturnLineFeeds, count));
                    break;
                }
                case '/': {
                    if (peek(1) == '*') {
                        if (auto err = lex_block_comment(trivia)) {
                            return err;
                        }
                        break;
                    }
                    if (peek(1) != '/') {
                        return llvm::Error::success();
                    }
                    auto start = pos;
                    while (!at_end() && peek() != '\n' && peek() != '\r') {
                        advance();
                    }
                    auto text = source.slice(start, pos);
                    trivia.push_back(TriviaPiece::comment(
                        text.startswith("///") ? TriviaKind::DocLineComment
                                               : TriviaKind::LineComment,
                        text.str()
                    ));
                    break;
                }
                case '#': {
                    if (pos != 0 || peek(1) != '!') {
                        return llvm::Error::success();
                    }
                    auto start = pos;
                    while (!at_end() && peek() != '\n' && peek() != '\r') {
                        advance();
                    }
                    trivia.push_back(
                        TriviaPiece::comment(TriviaKind::Shebang, source.slice(start, pos).str())
                    );
                    break;
                }
                default:
                    return llvm::Error::success();
            }
        }
        return llvm::Error::success();
    }

    llvm::Error Lexer::lex_block_comment(Trivia &trivia) {
        auto start        = pos;
        auto start_line   = line;
        auto start_column = column;

        // Swift block comments nest.
        advance(2);
        unsigned depth = 1;
        while (depth > 0) {
            if (at_end()) {
                return error_at(start_line, start_column, "unterminated '/*' comment");
            }
            if (peek() == '/' && peek(1) == '*') {
                advance(2);
                ++depth;
            } else if (peek() == '*' && peek(1) == '/') {
                advance(2);
                --depth;
            } else {
                advance();
            }
        }

        auto text = source.slice(start, pos);
        auto kind = text.startswith("/**") && text != "/**/" ? TriviaKind::DocBlockComment
                                                              : TriviaKind::BlockComment;
        trivia.push_back(TriviaPiece::comment(kind, text.str()));
        return llvm::Error::success();
    }

    void Lexer::lex_identifier() {
        while (!at_end() && isIdentifierBody(peek())) {
            advance();
        }
    }

    bool Lexer::lex_number() {
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'o' || peek(1) == 'b')) {
            advance(2);
            while (!at_end() && (std::isalnum(static_cast< unsigned char >(peek())) || peek() == '_'))
            {
                advance();
            }
            return false;
        }

        auto digits = [this] {
            while (!at_end() && (isDigit(peek()) || peek() == '_')) {
                advance();
            }
        };

        digits();
        bool is_float = false;
        if (peek() == '.' && isDigit(peek(1))) {
            is_float = true;
            advance();
            digits();
        }
        if (peek() == 'e' || peek() == 'E') {
            std::size_t ahead = (peek(1) == '+' || peek(1) == '-') ? 2 : 1;
            if (isDigit(peek(ahead))) {
                is_float = true;
                advance(ahead);
                digits();
            }
        }
        return is_float;
    }

    void Lexer::lex_operator() {
        auto start        = pos;
        bool dot_operator = peek() == '.';
        while (!at_end()) {
            char c = peek();
            if (pos > start && c == '/' && (peek(1) == '/' || peek(1) == '*')) {
                break;
            }
            if (!isOperatorChar(c) && !(dot_operator && c == '.')) {
                break;
            }
            advance();
        }
    }

    llvm::Error Lexer::lex_string_literal(unsigned hashes) {
        auto start_line   = line;
        auto start_column = column;

        advance(hashes);
        bool multiline = peek() == '"' && peek(1) == '"' && peek(2) == '"';
        std::size_t quotes = multiline ? 3 : 1;
        advance(quotes);

        auto closes_here = [&] {
            for (std::size_t i = 0; i < quotes; ++i) {
                if (peek(i) != '"') {
                    return false;
                }
            }
            for (unsigned i = 0; i < hashes; ++i) {
                if (peek(quotes + i) != '#') {
                    return false;
                }
            }
            return true;
        };

        while (true) {
            if (at_end()) {
                return error_at(start_line, start_column, "unterminated string literal");
            }

            char c = peek();
            if (!multiline && (c == '\n' || c == '\r')) {
                return error_at(start_line, start_column, "unterminated string literal");
            }

            if (c == '\\') {
                bool escape = true;
                for (unsigned i = 0; i < hashes; ++i) {
                    if (peek(1 + i) != '#') {
                        escape = false;
                        break;
                    }
                }
                if (!escape) {
                    advance();
                    continue;
                }

                advance(1 + hashes);
                if (peek() == '(') {
                    if (auto err = lex_interpolation(line, column)) {
                        return err;
                    }
                } else {
                    advance();
                }
                continue;
            }

            if (c == '"' && closes_here()) {
                advance(quotes + hashes);
                return llvm::Error::success();
            }

            advance();
        }
    }

    llvm::Error Lexer::lex_interpolation(unsigned start_line, unsigned start_column) {
        advance();
        unsigned depth = 1;
        while (true) {
            Trivia ignored;
            if (auto err = lex_trivia(ignored, false)) {
                return err;
            }
            if (at_end()) {
                return error_at(start_line, start_column, "unterminated string interpolation");
            }

            auto token = lex_token();
            if (!token) {
                return token.takeError();
            }
            if (token->is(TokenKind::LeftParen)) {
                ++depth;
            } else if (token->is(TokenKind::RightParen) && --depth == 0) {
                return llvm::Error::success();
            }
        }
    }

    llvm::Error Lexer::lex_regex_literal(unsigned hashes) {
        auto start_line   = line;
        auto start_column = column;

        advance(hashes + 1);
        while (true) {
            if (at_end()) {
                return error_at(start_line, start_column, "unterminated regex literal");
            }
            char c = peek();
            if (c == '\\') {
                advance(2);
                continue;
            }
            if (c == '/') {
                bool closes = true;
                for (unsigned i = 0; i < hashes; ++i) {
                    if (peek(1 + i) != '#') {
                        closes = false;
                        break;
                    }
                }
                advance(closes ? 1 + hashes : 1);
                if (closes) {
                    return llvm::Error::success();
                }
                continue;
            }
            advance();
        }
    }

    expected< Token > Lexer::lex_token() {
        Token token;
        token.line   = line;
        token.column = column;

        auto start  = pos;
        auto finish = [&](TokenKind kind) -> Token {
            token.kind = kind;
            token.text = source.slice(start, pos).str();
            return std::move(token);
        };

        char c = peek();

        if (isIdentifierHead(c)) {
            lex_identifier();
            return finish(
                isKeyword(source.slice(start, pos)) ? TokenKind::Keyword : TokenKind::Identifier
            );
        }

        if (c == '$') {
            advance();
            lex_identifier();
            return finish(TokenKind::Identifier);
        }

        if (c == '`') {
            advance();
            while (!at_end() && peek() != '`' && peek() != '\n' && peek() != '\r') {
                advance();
            }
            if (peek() != '`') {
                return error_at(token.line, token.column, "unterminated '`' identifier");
            }
            advance();
            return finish(TokenKind::Identifier);
        }

        if (isDigit(c)) {
            bool is_float = lex_number();
            return finish(is_float ? TokenKind::FloatLiteral : TokenKind::IntegerLiteral);
        }

        if (c == '"') {
            if (auto err = lex_string_literal(0)) {
                return std::move(err);
            }
            return finish(TokenKind::StringLiteral);
        }

        if (c == '#') {
            unsigned hashes = 0;
            while (peek(hashes) == '#') {
                ++hashes;
            }
            if (peek(hashes) == '"') {
                if (auto err = lex_string_literal(hashes)) {
                    return std::move(err);
                }
                return finish(TokenKind::StringLiteral);
            }
            if (peek(hashes) == '/') {
                if (auto err = lex_regex_literal(hashes)) {
                    return std::move(err);
                }
                return finish(TokenKind::RegexLiteral);
            }
            if (isIdentifierHead(peek(1))) {
                advance();
                lex_identifier();
                auto text = source.slice(start, pos);
                auto kind = llvm::StringSwitch< TokenKind >(text)
                                .Case("#if", TokenKind::PoundIf)
                                .Case("#elseif", TokenKind::PoundElseif)
                                .Case("#else", TokenKind::PoundElse)
                                .Case("#endif", TokenKind::PoundEndif)
                                .Default(TokenKind::PoundKeyword);
                return finish(kind);
            }
            advance();
            return finish(TokenKind::Other);
        }

        auto punctuation = [&](TokenKind kind) {
            advance();
            return finish(kind);
        };

        switch (c) {
            case '(':
                return punctuation(TokenKind::LeftParen);
            case ')':
                return punctuation(TokenKind::RightParen);
            case '{':
                return punctuation(TokenKind::LeftBrace);
            case '}':
                return punctuation(TokenKind::RightBrace);
            case '[':
                return punctuation(TokenKind::LeftSquare);
            case ']':
                return punctuation(TokenKind::RightSquare);
            case ',':
                return punctuation(TokenKind::Comma);
            case ';':
                return punctuation(TokenKind::Semicolon);
            case ':':
                return punctuation(TokenKind::Colon);
            case '@':
                return punctuation(TokenKind::AtSign);
            case '.':
                if (peek(1) != '.') {
                    return punctuation(TokenKind::Period);
                }
                break;
            default:
                break;
        }

        if (isOperatorChar(c) || c == '.') {
            lex_operator();
            bool after_comment = start >= 2 && source[start - 2] == '*' && source[start - 1] == '/';
            token.left_bound   = start > 0 && !after_comment && !breaksLeftBinding(source[start - 1]);
            bool before_comment = peek() == '/' && (peek(1) == '/' || peek(1) == '*');
            token.right_bound   = !at_end() && !before_comment && !breaksRightBinding(peek());
            return finish(TokenKind::Operator);
        }

        advance();
        return finish(TokenKind::Other);
    }

    expected< std::vector< Token > > Lexer::tokenize() {
        std::vector< Token > tokens;

        Trivia leading;
        if (auto err = lex_trivia(leading, false)) {
            return std::move(err);
        }

        while (!at_end()) {
            auto token = lex_token();
            if (!token) {
                return token.takeError();
            }

            token->leading = std::move(leading);
            leading.clear();

            if (auto err = lex_trivia(token->trailing, true)) {
                return std::move(err);
            }
            if (auto err = lex_trivia(leading, false)) {
                return std::move(err);
            }

            tokens.push_back(std::move(*token));
        }

        Token eof;
        eof.kind    = TokenKind::EndOfFile;
        eof.line    = line;
        eof.column  = column;
        eof.leading = std::move(leading);
        tokens.push_back(std::move(eof));

        return tokens;
    }

    expected< std::vector< Token > > tokenize(llvm::StringRef source) {
        return Lexer(source).tokenize();
    }

} // namespace flagcleaner::syntax
