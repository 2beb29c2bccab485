/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Util/Options.hpp>

#include <cctype>
#include <optional>

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/ErrorHandling.h>

namespace flagcleaner {

    expected< EvaluationStrategy > parseEvaluationStrategy(llvm::StringRef name) {
        auto strategy = llvm::StringSwitch< std::optional< EvaluationStrategy > >(name)
                            .Case("left-to-right", EvaluationStrategy::LeftToRight)
                            .Case("structural", EvaluationStrategy::Structural)
                            .Default(std::nullopt);
        if (!strategy) {
            return error(
                ErrorKind::InvalidArgument,
                "unknown evaluator '" + name + "', expected 'left-to-right' or 'structural'"
            );
        }
        return *strategy;
    }

    llvm::StringRef evaluationStrategyName(EvaluationStrategy strategy) {
        switch (strategy) {
            case EvaluationStrategy::LeftToRight:
                return "left-to-right";
            case EvaluationStrategy::Structural:
                return "structural";
        }
        llvm_unreachable("unknown evaluation strategy");
    }

    llvm::Error validateFlagName(llvm::StringRef flag) {
        auto is_head = [](char c) { return std::isalpha(static_cast< unsigned char >(c)) || c == '_'; };
        auto is_tail = [](char c) { return std::isalnum(static_cast< unsigned char >(c)) || c == '_'; };

        if (flag.empty() || !is_head(flag.front()) || !llvm::all_of(flag.drop_front(), is_tail)) {
            return error(ErrorKind::InvalidArgument, "invalid flag name '" + flag + "'");
        }
        return llvm::Error::success();
    }

} // namespace flagcleaner
