/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Rewrite/Emptiness.hpp>

#include <llvm/ADT/STLExtras.h>

namespace flagcleaner::rewrite {

    using namespace syntax;

    namespace {
        bool containsMeaningful(const NodeList &nodes);

        struct meaningful_visitor
        {
            bool operator()(const Declaration &decl) const {
                if (isMeaningfulDeclaration(decl.kind)) {
                    return true;
                }
                return llvm::any_of(decl.elements, [](const Element &element) {
                    const auto *group = std::get_if< BraceGroup >(&element);
                    return group && containsMeaningful(group->items);
                });
            }

            bool operator()(const ConditionalBlock &block) const {
                return llvm::any_of(block.clauses, [](const Clause &clause) {
                    return containsMeaningful(clause.body);
                });
            }

            bool operator()(const Placeholder &) const { return false; }
        };

        bool containsMeaningful(const NodeList &nodes) {
            return llvm::any_of(nodes, [](const Node &node) {
                return std::visit(meaningful_visitor{}, node.value);
            });
        }
    } // namespace

    bool isMeaningfulDeclaration(DeclKind kind) {
        switch (kind) {
            case DeclKind::Struct:
            case DeclKind::Enum:
            case DeclKind::Protocol:
            case DeclKind::Class:
            case DeclKind::Extension:
            case DeclKind::Actor:
            case DeclKind::TypeAlias:
            case DeclKind::Function:
            case DeclKind::Variable:
            case DeclKind::Macro:
            case DeclKind::MacroExpansion:
                return true;
            default:
                return false;
        }
    }

    bool isContentFree(const SourceFile &file) { return !containsMeaningful(file.items); }

} // namespace flagcleaner::rewrite
