/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <set>
#include <string>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Syntax/SyntaxTree.hpp>

namespace flagcleaner::rewrite {

    // Identifiers referenced by the conditions of one conditional block.
    struct FlagSet
    {
        std::set< std::string > names;

        // Some condition holds a construct the evaluator cannot interpret.
        bool has_unsupported = false;

        // True iff `flag` is the one and only name and every condition was
        // understood.
        bool matches_only(llvm::StringRef flag) const {
            return !has_unsupported && names.size() == 1 && *names.begin() == flag;
        }
    };

    FlagSet collectFlagReferences(const syntax::ConditionExpr &expr);
    FlagSet collectFlagReferences(const syntax::ConditionalBlock &block);

} // namespace flagcleaner::rewrite
