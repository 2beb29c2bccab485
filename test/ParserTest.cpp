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
#include <flagcleaner/Syntax/Parser.hpp>
#include <flagcleaner/Syntax/Printer.hpp>

using namespace flagcleaner;
using namespace flagcleaner::syntax;

namespace {

    SourceFile parseOk(llvm::StringRef source) {
        auto file = parse(source);
        if (!file) {
            ADD_FAILURE() << llvm::toString(file.takeError());
            return {};
        }
        return std::move(*file);
    }

    std::string parseError(llvm::StringRef source) {
        auto file = parse(source);
        if (file) {
            return {};
        }
        auto failure = takeFailure(file.takeError(), ErrorKind::ReadFailure);
        EXPECT_EQ(failure.kind, ErrorKind::ParseFailure);
        return failure.message;
    }

    std::vector< DeclKind > topLevelKinds(llvm::StringRef source) {
        auto file = parseOk(source);
        std::vector< DeclKind > kinds;
        for (const auto &node : file.items) {
            if (const auto *decl = std::get_if< Declaration >(&node.value)) {
                kinds.push_back(decl->kind);
            }
        }
        return kinds;
    }

    std::string condition(llvm::StringRef text) {
        auto tokens = tokenize(text);
        if (!tokens) {
            return "<" + llvm::toString(tokens.takeError()) + ">";
        }
        tokens->pop_back(); // EndOfFile
        return dumpCondition(parseCondition(*tokens));
    }

} // namespace

TEST(ParserTest, PrintsBackExactInput) {
    const char *source = "import Foundation\n"
                         "\n"
                         "@objc(Foo) public final class Foo: NSObject {\n"
                         "    #if FEATURE_FLAG // on\n"
                         "    let a = 1\n"
                         "    #elseif os(iOS)\n"
                         "    func b() { print(\"b\") }\n"
                         "    #else\n"
                         "    #endif\n"
                         "}\n"
                         "\n"
                         "let x = [1,\n"
                         "         2]\n"
                         "    .map { $0 + 1 }\n";
    EXPECT_EQ(printSource(parseOk(source)), source);
}

TEST(ParserTest, BuildsConditionalBlock) {
    auto file = parseOk("#if A\nlet a = 1\n#elseif B\nlet b = 2\n#else\nlet c = 3\nlet d = 4\n#endif\n");
    ASSERT_EQ(file.items.size(), 1u);
    const auto *block = std::get_if< ConditionalBlock >(&file.items[0].value);
    ASSERT_NE(block, nullptr);
    ASSERT_EQ(block->clauses.size(), 3u);

    EXPECT_EQ(block->clauses[0].kind, ClauseKind::If);
    EXPECT_EQ(block->clauses[1].kind, ClauseKind::ElseIf);
    EXPECT_EQ(block->clauses[2].kind, ClauseKind::Else);
    EXPECT_FALSE(block->clauses[2].condition.has_value());
    ASSERT_TRUE(block->clauses[1].condition.has_value());
    EXPECT_EQ(dumpCondition(*block->clauses[1].condition), "B");

    EXPECT_EQ(block->clauses[0].body.size(), 1u);
    EXPECT_EQ(block->clauses[2].body.size(), 2u);
    EXPECT_EQ(block->endif.kind, TokenKind::PoundEndif);
}

TEST(ParserTest, ParsesNestedBlocksInsideBraces) {
    auto file = parseOk("struct S {\n#if A\n#if B\nvar x = 0\n#endif\n#endif\n}\n");
    ASSERT_EQ(file.items.size(), 1u);
    const auto *decl = std::get_if< Declaration >(&file.items[0].value);
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(decl->kind, DeclKind::Struct);

    const BraceGroup *body = nullptr;
    for (const auto &element : decl->elements) {
        if (const auto *group = std::get_if< BraceGroup >(&element)) {
            body = group;
        }
    }
    ASSERT_NE(body, nullptr);
    ASSERT_EQ(body->items.size(), 1u);

    const auto *outer = std::get_if< ConditionalBlock >(&body->items[0].value);
    ASSERT_NE(outer, nullptr);
    ASSERT_EQ(outer->clauses[0].body.size(), 1u);
    EXPECT_NE(std::get_if< ConditionalBlock >(&outer->clauses[0].body[0].value), nullptr);
}

TEST(ParserTest, SplitsItemsAtLineBoundaries) {
    auto file = parseOk("let a = 1\nlet b = a +\n    2\nlet c = foo()\n    .bar()\nfoo(); bar()\n");
    EXPECT_EQ(file.items.size(), 5u);
}

TEST(ParserTest, KeepsAttributeLinesWithTheirDeclaration) {
    auto kinds = topLevelKinds("@available(iOS 15, *)\n@MainActor\nfinal class A {}\n");
    ASSERT_EQ(kinds.size(), 1u);
    EXPECT_EQ(kinds[0], DeclKind::Class);
}

TEST(ParserTest, LeadingMemberAccessIsAStatement) {
    auto kinds = topLevelKinds(".foo()\nlet y = 1\n");
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds[0], DeclKind::Statement);
    EXPECT_EQ(kinds[1], DeclKind::Variable);
}

TEST(ParserTest, ClassifiesDeclarations) {
    auto kinds = topLevelKinds(
        "import UIKit\n"
        "struct S {}\n"
        "enum E {}\n"
        "protocol P {}\n"
        "extension S {}\n"
        "actor A {}\n"
        "typealias T = Int\n"
        "private(set) static var v = 0\n"
        "class func f() {}\n"
        "@discardableResult func g() -> Int { 0 }\n"
        "macro m() = #externalMacro(module: \"M\", type: \"T\")\n"
        "#warning(\"w\")\n"
        "print(1)\n"
        ";\n"
    );
    std::vector< DeclKind > expected = {
        DeclKind::Import,    DeclKind::Struct,   DeclKind::Enum,           DeclKind::Protocol,
        DeclKind::Extension, DeclKind::Actor,    DeclKind::TypeAlias,      DeclKind::Variable,
        DeclKind::Function,  DeclKind::Function, DeclKind::Macro,          DeclKind::MacroExpansion,
        DeclKind::Statement, DeclKind::Empty
    };
    EXPECT_EQ(kinds, expected);
}

TEST(ParserTest, ConditionGrammar) {
    EXPECT_EQ(condition("FLAG"), "FLAG");
    EXPECT_EQ(condition("!FLAG"), "not(FLAG)");
    EXPECT_EQ(condition("!!FLAG"), "not(not(FLAG))");
    EXPECT_EQ(condition("A || B && C"), "or(A, and(B, C))");
    EXPECT_EQ(condition("(A || B) && !C"), "and((or(A, B)), not(C))");
    EXPECT_EQ(condition("true && 0"), "and(true, 0)");
}

TEST(ParserTest, UnsupportedConditions) {
    EXPECT_EQ(condition("os(iOS)"), "unsupported(os ( iOS ))");
    EXPECT_EQ(condition("FLAG && os(iOS)"), "and(FLAG, unsupported(os ( iOS )))");
    EXPECT_EQ(condition("swift(>=5.9)"), "unsupported(swift ( >= 5.9 ))");
    EXPECT_EQ(condition("A == B"), "unsupported(A == B)");
    EXPECT_EQ(condition("(A"), "unsupported(( A)");
    EXPECT_EQ(condition(""), "unsupported()");
}

TEST(ParserTest, ConditionMayContinueOnNextLine) {
    auto file = parseOk("#if A &&\n    B\nlet x = 1\n#endif\n");
    const auto *block = std::get_if< ConditionalBlock >(&file.items[0].value);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(dumpCondition(*block->clauses[0].condition), "and(A, B)");
    EXPECT_EQ(block->clauses[0].body.size(), 1u);
}

TEST(ParserTest, ReportsStructuralErrors) {
    EXPECT_EQ(parseError("#if A\nlet a = 1\n"), "3:1: expected #endif");
    EXPECT_EQ(parseError("#endif\n"), "1:1: #endif without a matching #if");
    EXPECT_EQ(parseError("#if A\n#else\n#else\n#endif\n"), "3:1: #else after #else");
    EXPECT_EQ(parseError("#if A\n#else\n#elseif B\n#endif\n"), "3:1: #elseif after #else");
    EXPECT_EQ(parseError("struct S {\n"), "2:1: expected '}'");
    EXPECT_EQ(parseError("}\n"), "1:1: unexpected '}'");
    EXPECT_EQ(parseError("foo(\n"), "2:1: expected ')' or ']'");
    EXPECT_EQ(parseError("let s = \"open\n"), "1:9: unterminated string literal");
}
