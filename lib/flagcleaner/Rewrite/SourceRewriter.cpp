/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Rewrite/SourceRewriter.hpp>

#include <flagcleaner/Rewrite/Emptiness.hpp>
#include <flagcleaner/Syntax/Parser.hpp>
#include <flagcleaner/Syntax/Printer.hpp>

namespace flagcleaner::rewrite {

    expected< SourceRewrite > processSource(
        llvm::StringRef source, llvm::StringRef flag, EvaluationStrategy strategy
    ) {
        auto file = syntax::parse(source);
        if (!file) {
            return file.takeError();
        }

        BlockRewriter rewriter(flag.str(), strategy);
        rewriter.rewrite(*file);

        SourceRewrite result;
        result.edited = rewriter.edited();
        result.stats  = rewriter.stats();
        if (!result.edited) {
            return result;
        }

        auto text     = syntax::printSource(*file);
        auto reparsed = syntax::parse(text);
        if (!reparsed) {
            auto failure = takeFailure(reparsed.takeError(), ErrorKind::ParseFailure);
            return error(
                ErrorKind::ParseFailure, "rewritten source does not parse: " + failure.message
            );
        }

        result.delete_requested = isContentFree(*reparsed);
        if (!result.delete_requested) {
            result.new_text = std::move(text);
        }
        return result;
    }

} // namespace flagcleaner::rewrite
