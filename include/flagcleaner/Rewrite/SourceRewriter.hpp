/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Rewrite/BlockRewriter.hpp>
#include <flagcleaner/Util/Error.hpp>
#include <flagcleaner/Util/Options.hpp>

namespace flagcleaner::rewrite {

    struct SourceRewrite
    {
        bool edited           = false;
        bool delete_requested = false;

        // Set only for an edited source that keeps some content.
        std::optional< std::string > new_text;

        RewriteStats stats;
    };

    /**
     * @brief Removes `flag` from one Swift source, assuming it is enabled.
     *
     * Parses `source`, resolves the blocks guarded by `flag` alone and, when
     * anything was resolved, reparses the printed result to decide whether
     * the file still has content. Fails with ParseFailure when either parse
     * fails; nothing is written in that case.
     */
    expected< SourceRewrite > processSource(
        llvm::StringRef source, llvm::StringRef flag,
        EvaluationStrategy strategy = EvaluationStrategy::LeftToRight
    );

} // namespace flagcleaner::rewrite
