/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Syntax/Printer.hpp>

namespace flagcleaner::syntax {

    void Printer::print(const SourceFile &file) {
        print(file.items);
        (*this)(file.eof);
    }

    void Printer::print(const NodeList &nodes) {
        for (const auto &node : nodes) {
            print(node);
        }
    }

    void Printer::print(const Node &node) { std::visit(*this, node.value); }

    void Printer::operator()(const Declaration &decl) {
        for (const auto &element : decl.elements) {
            std::visit(*this, element);
        }
    }

    void Printer::operator()(const ConditionalBlock &block) {
        for (const auto &clause : block.clauses) {
            (*this)(clause.pound);
            for (const auto &token : clause.condition_tokens) {
                (*this)(token);
            }
            print(clause.body);
        }
        (*this)(block.endif);
    }

    void Printer::operator()(const Placeholder &placeholder) {
        printTrivia(os, placeholder.leading);
        printTrivia(os, placeholder.trailing);
    }

    void Printer::operator()(const Token &token) { token.print(os); }

    void Printer::operator()(const BraceGroup &group) {
        (*this)(group.open);
        print(group.items);
        (*this)(group.close);
    }

    std::string printSource(const SourceFile &file) {
        std::string text;
        llvm::raw_string_ostream os(text);
        Printer(os).print(file);
        os.flush();
        return text;
    }

    std::string printNodes(const NodeList &nodes) {
        std::string text;
        llvm::raw_string_ostream os(text);
        Printer(os).print(nodes);
        os.flush();
        return text;
    }

    namespace {
        struct condition_dumper
        {
            llvm::raw_ostream &os;

            void dump(const ConditionExpr &expr) { std::visit(*this, expr.node); }

            void operator()(const IdentifierExpr &expr) { os << expr.name; }
            void operator()(const IntegerLiteralExpr &expr) { os << expr.text; }
            void operator()(const BooleanLiteralExpr &expr) { os << (expr.value ? "true" : "false"); }

            void operator()(const NotExpr &expr) {
                os << "not(";
                dump(*expr.operand);
                os << ")";
            }

            void operator()(const AndExpr &expr) { binary("and", *expr.lhs, *expr.rhs); }
            void operator()(const OrExpr &expr) { binary("or", *expr.lhs, *expr.rhs); }

            void operator()(const ParenExpr &expr) {
                os << "(";
                dump(*expr.inner);
                os << ")";
            }

            void operator()(const UnsupportedExpr &expr) { os << "unsupported(" << expr.text << ")"; }

            void binary(llvm::StringRef name, const ConditionExpr &lhs, const ConditionExpr &rhs) {
                os << name << "(";
                dump(lhs);
                os << ", ";
                dump(rhs);
                os << ")";
            }
        };
    } // namespace

    std::string dumpCondition(const ConditionExpr &expr) {
        std::string text;
        llvm::raw_string_ostream os(text);
        condition_dumper{ os }.dump(expr);
        os.flush();
        return text;
    }

} // namespace flagcleaner::syntax
