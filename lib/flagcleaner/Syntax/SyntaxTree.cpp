/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Syntax/SyntaxTree.hpp>

#include <llvm/Support/ErrorHandling.h>

namespace flagcleaner::syntax {

    llvm::StringRef declKindName(DeclKind kind) {
        switch (kind) {
            case DeclKind::Struct:
                return "struct";
            case DeclKind::Enum:
                return "enum";
            case DeclKind::Protocol:
                return "protocol";
            case DeclKind::Class:
                return "class";
            case DeclKind::Extension:
                return "extension";
            case DeclKind::Actor:
                return "actor";
            case DeclKind::TypeAlias:
                return "typealias";
            case DeclKind::Function:
                return "function";
            case DeclKind::Variable:
                return "variable";
            case DeclKind::Macro:
                return "macro";
            case DeclKind::MacroExpansion:
                return "macro expansion";
            case DeclKind::Import:
                return "import";
            case DeclKind::Initializer:
                return "initializer";
            case DeclKind::Deinitializer:
                return "deinitializer";
            case DeclKind::Subscript:
                return "subscript";
            case DeclKind::EnumCase:
                return "enum case";
            case DeclKind::AssociatedType:
                return "associatedtype";
            case DeclKind::Operator:
                return "operator";
            case DeclKind::PrecedenceGroup:
                return "precedencegroup";
            case DeclKind::Statement:
                return "statement";
            case DeclKind::Empty:
                return "empty";
        }
        llvm_unreachable("unknown declaration kind");
    }

    namespace {
        struct leading_trivia_visitor
        {
            Trivia &operator()(Declaration &decl) {
                auto &first = decl.elements.front();
                if (auto *token = std::get_if< Token >(&first)) {
                    return token->leading;
                }
                return std::get< BraceGroup >(first).open.leading;
            }

            Trivia &operator()(ConditionalBlock &block) {
                return block.clauses.front().pound.leading;
            }

            Trivia &operator()(Placeholder &placeholder) { return placeholder.leading; }
        };
    } // namespace

    Trivia &Node::leading_trivia() { return std::visit(leading_trivia_visitor{}, value); }

} // namespace flagcleaner::syntax
