/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Syntax/SyntaxTree.hpp>
#include <flagcleaner/Util/Options.hpp>

namespace flagcleaner::rewrite {

    // Leaf semantics shared by both strategies: `flag` is true, any other
    // identifier is false, an integer literal is `n > 0` (text that is not a
    // decimal number counts as true), booleans are themselves and
    // unsupported constructs are false.

    /**
     * @brief Reproduces the stack evaluator of the original tool.
     *
     * The condition is walked as a token stream. A pending `!`, `&&` or `||`
     * collapses against each operand as soon as the operand is produced, and
     * `)` only bounds how far the stack is popped. `F || 0 && 0` is therefore
     * `(F || 0) && 0`, i.e. false.
     */
    bool evaluateLeftToRight(const syntax::ConditionExpr &expr, llvm::StringRef flag);

    // Precedence-correct recursive evaluation over the expression tree.
    bool evaluateStructural(const syntax::ConditionExpr &expr, llvm::StringRef flag);

    bool evaluateCondition(
        const syntax::ConditionExpr &expr, llvm::StringRef flag, EvaluationStrategy strategy
    );

    // Index of the clause that survives once `flag` is fixed to true: the
    // first #if/#elseif whose condition holds, else the #else clause.
    std::optional< std::size_t > selectClause(
        const std::vector< syntax::Clause > &clauses, llvm::StringRef flag,
        EvaluationStrategy strategy
    );

} // namespace flagcleaner::rewrite
