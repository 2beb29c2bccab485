/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Rewrite/BlockRewriter.hpp>

#include <iterator>

#include <flagcleaner/Rewrite/ConditionEvaluator.hpp>
#include <flagcleaner/Rewrite/FlagReferences.hpp>

namespace flagcleaner::rewrite {

    using namespace syntax;

    llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const RewriteStats &stats) {
        return os << stats.blocks_visited << " visited, " << stats.blocks_resolved
                  << " resolved, " << stats.blocks_removed << " removed, "
                  << stats.blocks_skipped << " skipped (" << stats.blocks_unsupported
                  << " unsupported)";
    }

    void BlockRewriter::rewrite(SourceFile &file) {
        file.items = rewrite_nodes(std::move(file.items));
    }

    NodeList BlockRewriter::rewrite_nodes(NodeList nodes) {
        NodeList out;
        out.reserve(nodes.size());

        for (auto &node : nodes) {
            if (auto *block = std::get_if< ConditionalBlock >(&node.value)) {
                resolve_block(std::move(*block), out);
                continue;
            }
            if (auto *decl = std::get_if< Declaration >(&node.value)) {
                rewrite_declaration(*decl);
            }
            out.push_back(std::move(node));
        }

        return out;
    }

    void BlockRewriter::rewrite_declaration(Declaration &decl) {
        for (auto &element : decl.elements) {
            if (auto *group = std::get_if< BraceGroup >(&element)) {
                group->items = rewrite_nodes(std::move(group->items));
            }
        }
    }

    void BlockRewriter::rewrite_clauses(ConditionalBlock &block) {
        for (auto &clause : block.clauses) {
            clause.body = rewrite_nodes(std::move(clause.body));
        }
    }

    void BlockRewriter::resolve_block(ConditionalBlock block, NodeList &out) {
        ++counters.blocks_visited;

        auto flags = collectFlagReferences(block);
        if (!flags.matches_only(flag)) {
            ++counters.blocks_skipped;
            if (flags.has_unsupported) {
                ++counters.blocks_unsupported;
            }
            rewrite_clauses(block);
            out.emplace_back(std::move(block));
            return;
        }

        is_edited = true;
        ++counters.blocks_resolved;

        // The directive line goes away together with its indentation.
        Trivia leading = std::move(block.clauses.front().pound.leading);
        dropTrailingIndentation(leading);

        auto winner = selectClause(block.clauses, flag, strategy);
        if (!winner || block.clauses[*winner].body.empty()) {
            ++counters.blocks_removed;
            out.emplace_back(Placeholder{ std::move(leading), std::move(block.endif.trailing) });
            return;
        }

        auto body = rewrite_nodes(std::move(block.clauses[*winner].body));

        // The directive line is gone, so the body gives up one line break
        // and takes over the trivia that preceded `#if`.
        auto &first = body.front().leading_trivia();
        dropLeadingLineBreak(first);
        leading.insert(
            leading.end(), std::make_move_iterator(first.begin()),
            std::make_move_iterator(first.end())
        );
        first = std::move(leading);

        for (auto &node : body) {
            out.push_back(std::move(node));
        }
    }

} // namespace flagcleaner::rewrite
