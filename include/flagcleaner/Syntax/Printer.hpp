/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/Support/raw_ostream.h>

#include <flagcleaner/Syntax/SyntaxTree.hpp>

namespace flagcleaner::syntax {

    /**
     * @brief Writes a tree back out as source text.
     *
     * Every token is printed with its leading and trailing trivia, so a tree
     * that was parsed and not modified prints byte for byte as its input.
     */
    class Printer
    {
      public:
        explicit Printer(llvm::raw_ostream &os) : os(os) {}

        void print(const SourceFile &file);
        void print(const NodeList &nodes);
        void print(const Node &node);

        void operator()(const Declaration &decl);
        void operator()(const ConditionalBlock &block);
        void operator()(const Placeholder &placeholder);
        void operator()(const Token &token);
        void operator()(const BraceGroup &group);

      private:
        llvm::raw_ostream &os;
    };

    std::string printSource(const SourceFile &file);
    std::string printNodes(const NodeList &nodes);

    // Prefix form of a condition, e.g. `or(not(A), and(B, 1))`.
    std::string dumpCondition(const ConditionExpr &expr);

} // namespace flagcleaner::syntax
