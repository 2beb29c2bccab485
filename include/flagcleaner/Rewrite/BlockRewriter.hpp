/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <flagcleaner/Syntax/SyntaxTree.hpp>
#include <flagcleaner/Util/Options.hpp>

namespace flagcleaner::rewrite {

    struct RewriteStats
    {
        unsigned blocks_visited     = 0;
        unsigned blocks_resolved    = 0; // passed the single-flag guard
        unsigned blocks_removed     = 0; // resolved to nothing
        unsigned blocks_skipped     = 0; // kept verbatim by the guard
        unsigned blocks_unsupported = 0; // skipped because of an unsupported condition

        RewriteStats &operator+=(const RewriteStats &other) {
            blocks_visited += other.blocks_visited;
            blocks_resolved += other.blocks_resolved;
            blocks_removed += other.blocks_removed;
            blocks_skipped += other.blocks_skipped;
            blocks_unsupported += other.blocks_unsupported;
            return *this;
        }
    };

    llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const RewriteStats &stats);

    /**
     * @brief Resolves every conditional block that depends on the target flag
     * alone.
     *
     * A block passes the guard when its conditions reference exactly the
     * target flag and nothing the evaluator does not understand. Such a block
     * is replaced by the body of its surviving clause, or by a placeholder
     * keeping the block's outer trivia when no clause survives. Blocks that
     * fail the guard are kept as they are, but their clause bodies are still
     * rewritten.
     */
    class BlockRewriter
    {
      public:
        explicit BlockRewriter(
            std::string flag, EvaluationStrategy strategy = EvaluationStrategy::LeftToRight
        )
            : flag(std::move(flag)), strategy(strategy) {}

        void rewrite(syntax::SourceFile &file);

        bool edited() const { return is_edited; }
        const RewriteStats &stats() const { return counters; }

      private:
        syntax::NodeList rewrite_nodes(syntax::NodeList nodes);
        void rewrite_declaration(syntax::Declaration &decl);
        void rewrite_clauses(syntax::ConditionalBlock &block);

        // Appends to `out` whatever replaces `block`.
        void resolve_block(syntax::ConditionalBlock block, syntax::NodeList &out);

        std::string flag;
        EvaluationStrategy strategy;

        bool is_edited = false;
        RewriteStats counters;
    };

} // namespace flagcleaner::rewrite
