/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Rewrite/ConditionEvaluator.hpp>

#include <cstdint>

namespace flagcleaner::rewrite {

    namespace {
        using namespace syntax;

        bool integerValue(llvm::StringRef text) {
            int64_t value = 0;
            if (text.getAsInteger(10, value)) {
                return true;
            }
            return value > 0;
        }

        //
        // Left-to-right stack evaluation
        //

        struct StackEntry
        {
            enum Kind { Value, Not, And, Or, Open, Close } kind;
            bool value = false;
        };

        struct token_flattener
        {
            llvm::StringRef flag;
            std::vector< StackEntry > &out;

            void flatten(const ConditionExpr &expr) { std::visit(*this, expr.node); }

            void operator()(const IdentifierExpr &expr) {
                out.push_back({ StackEntry::Value, expr.name == flag });
            }

            void operator()(const IntegerLiteralExpr &expr) {
                out.push_back({ StackEntry::Value, integerValue(expr.text) });
            }

            void operator()(const BooleanLiteralExpr &expr) {
                out.push_back({ StackEntry::Value, expr.value });
            }

            void operator()(const NotExpr &expr) {
                out.push_back({ StackEntry::Not });
                flatten(*expr.operand);
            }

            void operator()(const AndExpr &expr) {
                flatten(*expr.lhs);
                out.push_back({ StackEntry::And });
                flatten(*expr.rhs);
            }

            void operator()(const OrExpr &expr) {
                flatten(*expr.lhs);
                out.push_back({ StackEntry::Or });
                flatten(*expr.rhs);
            }

            void operator()(const ParenExpr &expr) {
                out.push_back({ StackEntry::Open });
                flatten(*expr.inner);
                out.push_back({ StackEntry::Close });
            }

            void operator()(const UnsupportedExpr &) { out.push_back({ StackEntry::Value, false }); }
        };

        // A missing or non-value left operand reads as true.
        bool takeOperand(std::vector< StackEntry > &stack) {
            if (stack.empty()) {
                return true;
            }
            auto entry = stack.back();
            stack.pop_back();
            return entry.kind == StackEntry::Value ? entry.value : true;
        }

        void pushOperand(std::vector< StackEntry > &stack, bool value) {
            while (!stack.empty()) {
                auto op = stack.back().kind;
                if (op == StackEntry::Not) {
                    stack.pop_back();
                    value = !value;
                } else if (op == StackEntry::And || op == StackEntry::Or) {
                    stack.pop_back();
                    bool prev = takeOperand(stack);
                    value     = op == StackEntry::And ? (prev && value) : (prev || value);
                } else {
                    break;
                }
            }
            stack.push_back({ StackEntry::Value, value });
        }

        //
        // Structural evaluation
        //

        struct structural_evaluator
        {
            llvm::StringRef flag;

            bool eval(const ConditionExpr &expr) { return std::visit(*this, expr.node); }

            bool operator()(const IdentifierExpr &expr) { return expr.name == flag; }
            bool operator()(const IntegerLiteralExpr &expr) { return integerValue(expr.text); }
            bool operator()(const BooleanLiteralExpr &expr) { return expr.value; }
            bool operator()(const NotExpr &expr) { return !eval(*expr.operand); }
            bool operator()(const AndExpr &expr) { return eval(*expr.lhs) && eval(*expr.rhs); }
            bool operator()(const OrExpr &expr) { return eval(*expr.lhs) || eval(*expr.rhs); }
            bool operator()(const ParenExpr &expr) { return eval(*expr.inner); }
            bool operator()(const UnsupportedExpr &) { return false; }
        };
    } // namespace

    bool evaluateLeftToRight(const syntax::ConditionExpr &expr, llvm::StringRef flag) {
        std::vector< StackEntry > tokens;
        token_flattener{ flag, tokens }.flatten(expr);

        std::vector< StackEntry > stack;
        for (const auto &token : tokens) {
            switch (token.kind) {
                case StackEntry::Value:
                    pushOperand(stack, token.value);
                    break;
                case StackEntry::Close: {
                    if (stack.empty()) {
                        break;
                    }
                    auto top  = stack.back();
                    auto last = top;
                    stack.pop_back();
                    while (!stack.empty() && last.kind != StackEntry::Open) {
                        last = stack.back();
                        stack.pop_back();
                    }
                    pushOperand(stack, top.kind == StackEntry::Value ? top.value : true);
                    break;
                }
                default:
                    stack.push_back(token);
                    break;
            }
        }

        if (stack.empty()) {
            return true;
        }
        return stack.back().kind == StackEntry::Value && stack.back().value;
    }

    bool evaluateStructural(const syntax::ConditionExpr &expr, llvm::StringRef flag) {
        return structural_evaluator{ flag }.eval(expr);
    }

    bool evaluateCondition(
        const syntax::ConditionExpr &expr, llvm::StringRef flag, EvaluationStrategy strategy
    ) {
        switch (strategy) {
            case EvaluationStrategy::LeftToRight:
                return evaluateLeftToRight(expr, flag);
            case EvaluationStrategy::Structural:
                return evaluateStructural(expr, flag);
        }
        return evaluateLeftToRight(expr, flag);
    }

    std::optional< std::size_t > selectClause(
        const std::vector< syntax::Clause > &clauses, llvm::StringRef flag,
        EvaluationStrategy strategy
    ) {
        for (std::size_t i = 0; i < clauses.size(); ++i) {
            const auto &clause = clauses[i];
            if (clause.kind == syntax::ClauseKind::Else) {
                return i;
            }
            if (clause.condition && evaluateCondition(*clause.condition, flag, strategy)) {
                return i;
            }
        }
        return std::nullopt;
    }

} // namespace flagcleaner::rewrite
