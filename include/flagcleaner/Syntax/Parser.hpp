/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <vector>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Error.h>

#include <flagcleaner/Syntax/SyntaxTree.hpp>
#include <flagcleaner/Syntax/Token.hpp>
#include <flagcleaner/Util/Error.hpp>

namespace flagcleaner::syntax {

    /**
     * @brief Builds the declaration tree of a Swift source file.
     *
     * The parser recovers statement boundaries and conditional compilation
     * structure only. Everything else stays as tokens, so printing the tree
     * gives back the exact input.
     */
    class Parser
    {
      public:
        explicit Parser(std::vector< Token > tokens) : tokens(std::move(tokens)) {}

        expected< SourceFile > parse_source_file();

      private:
        enum class Scope { TopLevel, Braces, Clause };

        const Token &peek() const { return tokens[index]; }

        Token take();

        expected< NodeList > parse_items(Scope scope);
        expected< Declaration > parse_declaration();
        expected< BraceGroup > parse_brace_group();
        expected< ConditionalBlock > parse_conditional_block();
        std::vector< Token > take_condition_tokens();

        llvm::Error error_at(const Token &token, const llvm::Twine &msg) const;

        std::vector< Token > tokens;
        std::size_t index = 0;
    };

    expected< SourceFile > parse(llvm::StringRef source);

    // Parses the tokens following `#if` / `#elseif`. Never fails: whatever
    // the grammar does not cover becomes an UnsupportedExpr.
    ConditionExpr parseCondition(llvm::ArrayRef< Token > tokens);

    DeclKind classifyDeclaration(const Declaration &decl);

} // namespace flagcleaner::syntax
