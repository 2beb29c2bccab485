/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Syntax/Trivia.hpp>

#include <llvm/ADT/STLExtras.h>

namespace flagcleaner::syntax {

    namespace {
        llvm::StringRef runText(TriviaKind kind) {
            switch (kind) {
                case TriviaKind::Spaces:
                    return " ";
                case TriviaKind::Tabs:
                    return "\t";
                case TriviaKind::VerticalTabs:
                    return "\v";
                case TriviaKind::FormFeeds:
                    return "\f";
                case TriviaKind::Newlines:
                    return "\n";
                case TriviaKind::CarriageReturns:
                    return "\r";
                case TriviaKind::CarriageReturnLineFeeds:
                    return "\r\n";
                default:
                    return "";
            }
        }
    } // namespace

    void TriviaPiece::print(llvm::raw_ostream &os) const {
        if (!text.empty()) {
            os << text;
            return;
        }

        auto unit = runText(kind);
        for (unsigned i = 0; i < count; ++i) {
            os << unit;
        }
    }

    void printTrivia(llvm::raw_ostream &os, const Trivia &trivia) {
        for (const auto &piece : trivia) {
            piece.print(os);
        }
    }

    bool containsLineBreak(const Trivia &trivia) {
        return llvm::any_of(trivia, [](const TriviaPiece &piece) { return piece.is_line_break(); });
    }

    void dropLeadingLineBreak(Trivia &trivia) {
        if (trivia.empty() || !trivia.front().is_line_break()) {
            return;
        }

        if (trivia.front().count > 1) {
            --trivia.front().count;
        } else {
            trivia.erase(trivia.begin());
        }
    }

    void dropTrailingIndentation(Trivia &trivia) {
        while (!trivia.empty()
               && (trivia.back().kind == TriviaKind::Spaces || trivia.back().kind == TriviaKind::Tabs))
        {
            trivia.pop_back();
        }
    }

} // namespace flagcleaner::syntax
