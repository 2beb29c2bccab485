/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Rewrite/FlagReferences.hpp>

namespace flagcleaner::rewrite {

    namespace {
        using namespace syntax;

        struct reference_collector
        {
            FlagSet &flags;

            void collect(const ConditionExpr &expr) { std::visit(*this, expr.node); }

            void operator()(const IdentifierExpr &expr) { flags.names.insert(expr.name); }
            void operator()(const IntegerLiteralExpr &) {}
            void operator()(const BooleanLiteralExpr &) {}
            void operator()(const NotExpr &expr) { collect(*expr.operand); }

            void operator()(const AndExpr &expr) {
                collect(*expr.lhs);
                collect(*expr.rhs);
            }

            void operator()(const OrExpr &expr) {
                collect(*expr.lhs);
                collect(*expr.rhs);
            }

            void operator()(const ParenExpr &expr) { collect(*expr.inner); }
            void operator()(const UnsupportedExpr &) { flags.has_unsupported = true; }
        };
    } // namespace

    FlagSet collectFlagReferences(const syntax::ConditionExpr &expr) {
        FlagSet flags;
        reference_collector{ flags }.collect(expr);
        return flags;
    }

    FlagSet collectFlagReferences(const syntax::ConditionalBlock &block) {
        FlagSet flags;
        reference_collector collector{ flags };
        for (const auto &clause : block.clauses) {
            if (clause.condition) {
                collector.collect(*clause.condition);
            }
        }
        return flags;
    }

} // namespace flagcleaner::rewrite
