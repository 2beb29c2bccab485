/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

namespace flagcleaner::syntax {

    enum class TriviaKind {
        Spaces,
        Tabs,
        VerticalTabs,
        FormFeeds,
        Newlines,
        CarriageReturns,
        CarriageReturnLineFeeds,
        LineComment,
        DocLineComment,
        BlockComment,
        DocBlockComment,
        Shebang
    };

    /**
     * @brief One classified run of formatting text.
     *
     * Whitespace kinds repeat a single character (or "\r\n") `count` times.
     * Comment kinds keep their verbatim text, delimiters included.
     */
    struct TriviaPiece
    {
        TriviaKind kind;
        unsigned count = 0;
        std::string text;

        static TriviaPiece run(TriviaKind kind, unsigned count) { return { kind, count, {} }; }

        static TriviaPiece comment(TriviaKind kind, std::string text) {
            return { kind, 0, std::move(text) };
        }

        bool is_line_break() const {
            return kind == TriviaKind::Newlines || kind == TriviaKind::CarriageReturns
                || kind == TriviaKind::CarriageReturnLineFeeds;
        }

        bool is_comment() const {
            return kind == TriviaKind::LineComment || kind == TriviaKind::DocLineComment
                || kind == TriviaKind::BlockComment || kind == TriviaKind::DocBlockComment;
        }

        void print(llvm::raw_ostream &os) const;
    };

    using Trivia = std::vector< TriviaPiece >;

    void printTrivia(llvm::raw_ostream &os, const Trivia &trivia);

    bool containsLineBreak(const Trivia &trivia);

    // Drops one line break from a leading blank-line run, if the trivia starts
    // with one: a count above one is decremented, a count of one removes the
    // piece.
    void dropLeadingLineBreak(Trivia &trivia);

    // Removes the spaces and tabs that end `trivia`, i.e. the indentation of
    // the token it precedes.
    void dropTrailingIndentation(Trivia &trivia);

} // namespace flagcleaner::syntax
