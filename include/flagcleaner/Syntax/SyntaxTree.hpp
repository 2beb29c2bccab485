/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Syntax/Token.hpp>
#include <flagcleaner/Syntax/Trivia.hpp>

namespace flagcleaner::syntax {

    //
    // Conditions of `#if` / `#elseif` clauses
    //

    struct ConditionExpr;
    using ConditionPtr = std::unique_ptr< ConditionExpr >;

    struct IdentifierExpr
    {
        std::string name;
    };

    struct IntegerLiteralExpr
    {
        std::string text;
    };

    struct BooleanLiteralExpr
    {
        bool value;
    };

    struct NotExpr
    {
        ConditionPtr operand;
    };

    struct AndExpr
    {
        ConditionPtr lhs;
        ConditionPtr rhs;
    };

    struct OrExpr
    {
        ConditionPtr lhs;
        ConditionPtr rhs;
    };

    struct ParenExpr
    {
        ConditionPtr inner;
    };

    // Anything the condition grammar does not cover: `os(iOS)`,
    // `swift(>=5.9)`, comparisons, an empty condition.
    struct UnsupportedExpr
    {
        std::string text;
    };

    struct ConditionExpr
    {
        using variant_t = std::variant<
            IdentifierExpr, IntegerLiteralExpr, BooleanLiteralExpr, NotExpr, AndExpr, OrExpr,
            ParenExpr, UnsupportedExpr >;

        variant_t node;

        static ConditionExpr identifier(std::string name) {
            return { IdentifierExpr{ std::move(name) } };
        }

        static ConditionExpr integer(std::string text) {
            return { IntegerLiteralExpr{ std::move(text) } };
        }

        static ConditionExpr boolean(bool value) { return { BooleanLiteralExpr{ value } }; }

        static ConditionExpr negate(ConditionExpr operand) {
            return { NotExpr{ std::make_unique< ConditionExpr >(std::move(operand)) } };
        }

        static ConditionExpr conjunction(ConditionExpr lhs, ConditionExpr rhs) {
            return { AndExpr{ std::make_unique< ConditionExpr >(std::move(lhs)),
                              std::make_unique< ConditionExpr >(std::move(rhs)) } };
        }

        static ConditionExpr disjunction(ConditionExpr lhs, ConditionExpr rhs) {
            return { OrExpr{ std::make_unique< ConditionExpr >(std::move(lhs)),
                             std::make_unique< ConditionExpr >(std::move(rhs)) } };
        }

        static ConditionExpr parenthesized(ConditionExpr inner) {
            return { ParenExpr{ std::make_unique< ConditionExpr >(std::move(inner)) } };
        }

        static ConditionExpr unsupported(std::string text) {
            return { UnsupportedExpr{ std::move(text) } };
        }
    };

    //
    // Declarations and conditional compilation blocks
    //

    enum class DeclKind {
        Struct,
        Enum,
        Protocol,
        Class,
        Extension,
        Actor,
        TypeAlias,
        Function,
        Variable,
        Macro,
        MacroExpansion,
        Import,
        Initializer,
        Deinitializer,
        Subscript,
        EnumCase,
        AssociatedType,
        Operator,
        PrecedenceGroup,
        Statement,
        Empty
    };

    llvm::StringRef declKindName(DeclKind kind);

    struct Node;
    using NodeList = std::vector< Node >;

    struct BraceGroup
    {
        Token open;
        NodeList items;
        Token close;
    };

    using Element = std::variant< Token, BraceGroup >;

    // An item between two statement boundaries, kept as tokens plus nested
    // brace bodies. Only its kind is interpreted.
    struct Declaration
    {
        DeclKind kind = DeclKind::Statement;
        std::vector< Element > elements;
    };

    enum class ClauseKind { If, ElseIf, Else };

    struct Clause
    {
        ClauseKind kind = ClauseKind::If;
        Token pound;
        std::vector< Token > condition_tokens;
        std::optional< ConditionExpr > condition; // absent only for Else
        NodeList body;
    };

    struct ConditionalBlock
    {
        std::vector< Clause > clauses;
        Token endif;
    };

    // What remains of a removed block: its surrounding trivia and nothing else.
    struct Placeholder
    {
        Trivia leading;
        Trivia trailing;
    };

    struct Node
    {
        using variant_t = std::variant< Declaration, ConditionalBlock, Placeholder >;

        Node(Declaration decl) : value(std::move(decl)) {}             // NOLINT
        Node(ConditionalBlock block) : value(std::move(block)) {}      // NOLINT
        Node(Placeholder placeholder) : value(std::move(placeholder)) {} // NOLINT

        Node(const Node &)            = delete;
        Node &operator=(const Node &) = delete;

        Node(Node &&) noexcept            = default;
        Node &operator=(Node &&) noexcept = default;

        // Leading trivia of the first token this node prints.
        Trivia &leading_trivia();

        variant_t value;
    };

    struct SourceFile
    {
        NodeList items;
        Token eof;
    };

} // namespace flagcleaner::syntax
