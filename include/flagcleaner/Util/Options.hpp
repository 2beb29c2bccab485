/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <flagcleaner/Util/Error.hpp>

namespace flagcleaner {

    // How `#if` conditions are reduced to a boolean once the target flag is
    // fixed to true.
    enum class EvaluationStrategy {
        LeftToRight, // operand/operator stack, operators collapse eagerly
        Structural   // recursive, `!` > `&&` > `||`
    };

    struct Options
    {
        bool verbose = false;
        unsigned jobs = 0; // 0 selects the hardware concurrency

        EvaluationStrategy evaluator = EvaluationStrategy::LeftToRight;

        std::string flag;
        std::string path;
        std::string config_file;

        std::vector< std::string > exclude;
    };

    // Accepts `left-to-right` and `structural`.
    expected< EvaluationStrategy > parseEvaluationStrategy(llvm::StringRef name);
    llvm::StringRef evaluationStrategyName(EvaluationStrategy strategy);

    // A flag must be a plain identifier: a letter or `_` followed by
    // letters, digits or `_`.
    llvm::Error validateFlagName(llvm::StringRef flag);

} // namespace flagcleaner
