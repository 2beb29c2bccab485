/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Syntax/Parser.hpp>

#include <optional>
#include <string>

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/ADT/StringSwitch.h>

#include <flagcleaner/Syntax/Lexer.hpp>

namespace flagcleaner::syntax {

    namespace {

        bool isAny(llvm::StringRef text, std::initializer_list< llvm::StringRef > words) {
            return llvm::is_contained(words, text);
        }

        // Whether a line break after `prev` keeps the current item open.
        bool continuesAfter(const Token &prev) {
            switch (prev.kind) {
                case TokenKind::Operator:
                    return !prev.is_postfix_operator();
                case TokenKind::Comma:
                case TokenKind::Colon:
                case TokenKind::Period:
                case TokenKind::AtSign:
                case TokenKind::LeftParen:
                case TokenKind::LeftSquare:
                    return true;
                case TokenKind::Keyword:
                    return isAny(prev.text, { "as", "is", "try", "await", "where" });
                default:
                    return false;
            }
        }

        // Whether `next`, first on its line, continues the current item.
        bool continuesBefore(const Token &next) {
            switch (next.kind) {
                case TokenKind::Operator:
                    return !next.is_prefix_operator();
                case TokenKind::Period:
                case TokenKind::LeftBrace:
                case TokenKind::Colon:
                    return true;
                case TokenKind::Keyword:
                    return isAny(
                        next.text, { "else", "catch", "where", "throws", "rethrows", "as", "is" }
                    );
                default:
                    return false;
            }
        }

        std::string joinTokens(llvm::ArrayRef< Token > tokens) {
            std::string text;
            for (const auto &token : tokens) {
                if (!text.empty()) {
                    text += ' ';
                }
                text += token.text;
            }
            return text;
        }

        class ConditionParser
        {
          public:
            explicit ConditionParser(llvm::ArrayRef< Token > tokens) : tokens(tokens) {}

            bool done() const { return index == tokens.size(); }

            std::optional< ConditionExpr > parse_or() {
                auto lhs = parse_and();
                while (lhs && current() && current()->is_operator("||")) {
                    ++index;
                    auto rhs = parse_and();
                    if (!rhs) {
                        return std::nullopt;
                    }
                    lhs = ConditionExpr::disjunction(std::move(*lhs), std::move(*rhs));
                }
                return lhs;
            }

          private:
            const Token *current() const { return done() ? nullptr : &tokens[index]; }

            std::optional< ConditionExpr > parse_and() {
                auto lhs = parse_unary();
                while (lhs && current() && current()->is_operator("&&")) {
                    ++index;
                    auto rhs = parse_unary();
                    if (!rhs) {
                        return std::nullopt;
                    }
                    lhs = ConditionExpr::conjunction(std::move(*lhs), std::move(*rhs));
                }
                return lhs;
            }

            std::optional< ConditionExpr > parse_unary() {
                const auto *token = current();
                if (token == nullptr) {
                    return std::nullopt;
                }

                // `!!F` lexes as a single operator.
                if (token->is(TokenKind::Operator)
                    && llvm::all_of(token->text, [](char c) { return c == '!'; }))
                {
                    auto negations = token->text.size();
                    ++index;
                    auto operand = parse_unary();
                    if (!operand) {
                        return std::nullopt;
                    }
                    for (std::size_t i = 0; i < negations; ++i) {
                        operand = ConditionExpr::negate(std::move(*operand));
                    }
                    return operand;
                }

                return parse_primary();
            }

            std::optional< ConditionExpr > parse_primary() {
                const auto *token = current();
                if (token == nullptr) {
                    return std::nullopt;
                }

                switch (token->kind) {
                    case TokenKind::LeftParen: {
                        ++index;
                        auto inner = parse_or();
                        if (!inner || !current() || !current()->is(TokenKind::RightParen)) {
                            return std::nullopt;
                        }
                        ++index;
                        return ConditionExpr::parenthesized(std::move(*inner));
                    }
                    case TokenKind::Identifier: {
                        auto start = index++;
                        if (current() && current()->is(TokenKind::LeftParen)) {
                            return parse_call(start);
                        }
                        return ConditionExpr::identifier(token->text);
                    }
                    case TokenKind::Keyword:
                        if (token->text == "true" || token->text == "false") {
                            ++index;
                            return ConditionExpr::boolean(token->text == "true");
                        }
                        return std::nullopt;
                    case TokenKind::IntegerLiteral:
                        ++index;
                        return ConditionExpr::integer(token->text);
                    default:
                        return std::nullopt;
                }
            }

            // Platform and version checks: `os(iOS)`, `swift(>=5.9)`, ...
            std::optional< ConditionExpr > parse_call(std::size_t start) {
                unsigned depth = 0;
                while (const auto *token = current()) {
                    ++index;
                    if (token->is(TokenKind::LeftParen)) {
                        ++depth;
                    } else if (token->is(TokenKind::RightParen) && --depth == 0) {
                        return ConditionExpr::unsupported(
                            joinTokens(tokens.slice(start, index - start))
                        );
                    }
                }
                return std::nullopt;
            }

            llvm::ArrayRef< Token > tokens;
            std::size_t index = 0;
        };

        bool isModifier(const Token &token, const Token *next) {
            static const llvm::StringSet<> modifiers = {
                "public",     "private",     "fileprivate", "internal",    "open",
                "package",    "static",      "final",       "override",    "required",
                "convenience", "mutating",   "nonmutating", "lazy",        "weak",
                "unowned",    "dynamic",     "optional",    "indirect",    "nonisolated",
                "distributed", "prefix",     "postfix",     "infix",       "consuming",
                "borrowing",  "__consuming"
            };

            if (token.is_keyword("class")) {
                // `class func`, `class var`, `class override func`, ...
                return next != nullptr
                    && (next->is(TokenKind::Keyword) || next->is(TokenKind::Identifier))
                    && (isAny(next->text, { "func", "var", "let", "subscript", "typealias" })
                        || modifiers.count(next->text) != 0);
            }

            return (token.is(TokenKind::Keyword) || token.is(TokenKind::Identifier))
                && modifiers.count(token.text) != 0;
        }

        DeclKind kindOf(const Token &token, const Token *next) {
            switch (token.kind) {
                case TokenKind::Keyword:
                    return llvm::StringSwitch< DeclKind >(token.text)
                        .Case("struct", DeclKind::Struct)
                        .Case("enum", DeclKind::Enum)
                        .Case("protocol", DeclKind::Protocol)
                        .Case("class", DeclKind::Class)
                        .Case("extension", DeclKind::Extension)
                        .Case("typealias", DeclKind::TypeAlias)
                        .Case("func", DeclKind::Function)
                        .Cases("var", "let", DeclKind::Variable)
                        .Case("import", DeclKind::Import)
                        .Case("init", DeclKind::Initializer)
                        .Case("deinit", DeclKind::Deinitializer)
                        .Case("subscript", DeclKind::Subscript)
                        .Case("case", DeclKind::EnumCase)
                        .Case("associatedtype", DeclKind::AssociatedType)
                        .Case("operator", DeclKind::Operator)
                        .Case("precedencegroup", DeclKind::PrecedenceGroup)
                        .Default(DeclKind::Statement);
                case TokenKind::Identifier:
                    if (next != nullptr && next->is(TokenKind::Identifier)) {
                        if (token.text == "actor") {
                            return DeclKind::Actor;
                        }
                        if (token.text == "macro") {
                            return DeclKind::Macro;
                        }
                    }
                    return DeclKind::Statement;
                case TokenKind::PoundKeyword:
                    return DeclKind::MacroExpansion;
                case TokenKind::Semicolon:
                    return DeclKind::Empty;
                default:
                    return DeclKind::Statement;
            }
        }

    } // namespace

    Token Parser::take() {
        Token token = std::move(tokens[index]);
        if (index + 1 < tokens.size()) {
            ++index;
        }
        return token;
    }

    llvm::Error Parser::error_at(const Token &token, const llvm::Twine &msg) const {
        return error(
            ErrorKind::ParseFailure,
            llvm::Twine(token.line) + ":" + llvm::Twine(token.column) + ": " + msg
        );
    }

    expected< SourceFile > Parser::parse_source_file() {
        auto items = parse_items(Scope::TopLevel);
        if (!items) {
            return items.takeError();
        }

        SourceFile file;
        file.items = std::move(*items);
        file.eof   = take();
        return file;
    }

    expected< NodeList > Parser::parse_items(Scope scope) {
        NodeList items;
        while (true) {
            const auto &token = peek();
            switch (token.kind) {
                case TokenKind::EndOfFile:
                    if (scope == Scope::TopLevel) {
                        return items;
                    }
                    return error_at(token, scope == Scope::Braces ? "expected '}'" : "expected #endif");
                case TokenKind::RightBrace:
                    if (scope == Scope::Braces) {
                        return items;
                    }
                    return error_at(token, "unexpected '}'");
                case TokenKind::PoundElseif:
                case TokenKind::PoundElse:
                case TokenKind::PoundEndif:
                    if (scope == Scope::Clause) {
                        return items;
                    }
                    return error_at(token, token.text + " without a matching #if");
                case TokenKind::PoundIf: {
                    auto block = parse_conditional_block();
                    if (!block) {
                        return block.takeError();
                    }
                    items.emplace_back(std::move(*block));
                    break;
                }
                default: {
                    auto decl = parse_declaration();
                    if (!decl) {
                        return decl.takeError();
                    }
                    items.emplace_back(std::move(*decl));
                    break;
                }
            }
        }
    }

    expected< Declaration > Parser::parse_declaration() {
        Declaration decl;

        // Nesting of `(` and `[`; braces are handled by parse_brace_group.
        unsigned depth = 0;

        // The item so far is only attributes, e.g. `@objc` on its own line.
        bool attributes_only = true;
        bool seen_attribute  = false;
        bool after_at        = false;

        while (true) {
            const auto &token = peek();

            if (token.is(TokenKind::EndOfFile)) {
                if (depth > 0) {
                    return error_at(token, "expected ')' or ']'");
                }
                break;
            }
            if (token.is_directive()) {
                if (depth > 0) {
                    return error_at(token, token.text + " inside an unclosed bracket");
                }
                break;
            }
            if (token.is(TokenKind::RightBrace)) {
                if (depth > 0) {
                    return error_at(token, "unexpected '}'");
                }
                break;
            }

            if (!decl.elements.empty() && depth == 0 && token.starts_line() && !attributes_only) {
                const auto *prev = std::get_if< Token >(&decl.elements.back());
                if (!(prev && continuesAfter(*prev)) && !continuesBefore(token)) {
                    break;
                }
            }

            if (token.is(TokenKind::LeftBrace)) {
                auto group = parse_brace_group();
                if (!group) {
                    return group.takeError();
                }
                decl.elements.emplace_back(std::move(*group));
                attributes_only = false;
                continue;
            }

            if (depth == 0 && attributes_only) {
                if (token.is(TokenKind::AtSign)) {
                    after_at       = true;
                    seen_attribute = true;
                } else if (after_at && (token.is(TokenKind::Identifier) || token.is(TokenKind::Keyword))) {
                    after_at = false;
                } else if (seen_attribute && !after_at && token.is(TokenKind::Period)) {
                    after_at = true;
                } else if (seen_attribute && !after_at && token.is(TokenKind::LeftParen)
                           && token.leading.empty())
                {
                    // attribute arguments
                } else {
                    attributes_only = false;
                }
            }

            if (token.is(TokenKind::LeftParen) || token.is(TokenKind::LeftSquare)) {
                ++depth;
            } else if (token.is(TokenKind::RightParen) || token.is(TokenKind::RightSquare)) {
                if (depth == 0) {
                    return error_at(token, "unexpected '" + token.text + "'");
                }
                --depth;
            }

            bool ends_item = token.is(TokenKind::Semicolon) && depth == 0;
            decl.elements.emplace_back(take());
            if (ends_item) {
                break;
            }
        }

        decl.kind = classifyDeclaration(decl);
        return decl;
    }

    expected< BraceGroup > Parser::parse_brace_group() {
        BraceGroup group;
        group.open = take();

        auto items = parse_items(Scope::Braces);
        if (!items) {
            return items.takeError();
        }
        group.items = std::move(*items);
        group.close = take();
        return group;
    }

    std::vector< Token > Parser::take_condition_tokens() {
        std::vector< Token > condition;
        unsigned depth = 0;
        while (true) {
            const auto &token = peek();
            if (token.is(TokenKind::EndOfFile) || token.is_directive()
                || token.is(TokenKind::LeftBrace) || token.is(TokenKind::RightBrace))
            {
                break;
            }

            if (token.starts_line() && depth == 0) {
                if (condition.empty()) {
                    break;
                }
                const auto &prev = condition.back();
                bool joined      = prev.is_operator("&&") || prev.is_operator("||")
                    || prev.is_operator("!") || token.is_operator("&&")
                    || token.is_operator("||");
                if (!joined) {
                    break;
                }
            }

            if (token.is(TokenKind::LeftParen)) {
                ++depth;
            } else if (token.is(TokenKind::RightParen) && depth > 0) {
                --depth;
            }
            condition.push_back(take());
        }
        return condition;
    }

    expected< ConditionalBlock > Parser::parse_conditional_block() {
        ConditionalBlock block;
        bool seen_else = false;

        while (true) {
            const auto &token = peek();
            if (!block.clauses.empty() && token.is(TokenKind::PoundEndif)) {
                block.endif = take();
                return block;
            }

            Clause clause;
            if (block.clauses.empty()) {
                clause.kind = ClauseKind::If;
            } else if (token.is(TokenKind::PoundElseif)) {
                if (seen_else) {
                    return error_at(token, "#elseif after #else");
                }
                clause.kind = ClauseKind::ElseIf;
            } else {
                if (seen_else) {
                    return error_at(token, "#else after #else");
                }
                seen_else   = true;
                clause.kind = ClauseKind::Else;
            }

            clause.pound = take();
            if (clause.kind != ClauseKind::Else) {
                clause.condition_tokens = take_condition_tokens();
                clause.condition        = parseCondition(clause.condition_tokens);
            }

            auto body = parse_items(Scope::Clause);
            if (!body) {
                return body.takeError();
            }
            clause.body = std::move(*body);
            block.clauses.push_back(std::move(clause));
        }
    }

    ConditionExpr parseCondition(llvm::ArrayRef< Token > tokens) {
        ConditionParser parser(tokens);
        auto expr = parser.parse_or();
        if (!expr || !parser.done()) {
            return ConditionExpr::unsupported(joinTokens(tokens));
        }
        return std::move(*expr);
    }

    DeclKind classifyDeclaration(const Declaration &decl) {
        const auto &elements = decl.elements;

        auto token_at = [&](std::size_t at) -> const Token * {
            return at < elements.size() ? std::get_if< Token >(&elements[at]) : nullptr;
        };

        // Index just past the parenthesized group opening at `at`.
        auto skip_group = [&](std::size_t at) {
            unsigned depth = 0;
            for (; at < elements.size(); ++at) {
                const auto *token = token_at(at);
                if (token == nullptr) {
                    continue;
                }
                if (token->is(TokenKind::LeftParen)) {
                    ++depth;
                } else if (token->is(TokenKind::RightParen) && --depth == 0) {
                    return at + 1;
                }
            }
            return at;
        };

        std::size_t i = 0;
        while (i < elements.size()) {
            const auto *token = token_at(i);
            if (token == nullptr) {
                return DeclKind::Statement;
            }

            if (token->is(TokenKind::AtSign)) {
                ++i;
                while (token_at(i)
                       && (token_at(i)->is(TokenKind::Identifier)
                           || token_at(i)->is(TokenKind::Keyword)))
                {
                    ++i;
                    if (!token_at(i) || !token_at(i)->is(TokenKind::Period)) {
                        break;
                    }
                    ++i;
                }
                if (token_at(i) && token_at(i)->is(TokenKind::LeftParen)
                    && token_at(i)->leading.empty())
                {
                    i = skip_group(i);
                }
                continue;
            }

            if (isModifier(*token, token_at(i + 1))) {
                ++i;
                // `private(set)`, `unowned(safe)`
                if (token_at(i) && token_at(i)->is(TokenKind::LeftParen)) {
                    i = skip_group(i);
                }
                continue;
            }

            return kindOf(*token, token_at(i + 1));
        }

        return DeclKind::Statement;
    }

    expected< SourceFile > parse(llvm::StringRef source) {
        auto tokens = tokenize(source);
        if (!tokens) {
            return tokens.takeError();
        }
        return Parser(std::move(*tokens)).parse_source_file();
    }

} // namespace flagcleaner::syntax
