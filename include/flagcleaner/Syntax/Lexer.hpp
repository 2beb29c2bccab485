/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Error.h>

#include <flagcleaner/Syntax/Token.hpp>
#include <flagcleaner/Util/Error.hpp>

namespace flagcleaner::syntax {

    /**
     * @brief Splits Swift source into tokens with attached trivia.
     *
     * A token owns the trivia that follows it on its own line (trailing) and
     * everything between the previous line break and itself (leading). The
     * token list always ends with an EndOfFile token that carries whatever
     * trivia remains. Concatenating every token's leading trivia, text and
     * trailing trivia reproduces the input exactly.
     */
    class Lexer
    {
      public:
        explicit Lexer(llvm::StringRef source) : source(source) {}

        expected< std::vector< Token > > tokenize();

      private:
        char peek(std::size_t ahead = 0) const {
            return pos + ahead < source.size() ? source[pos + ahead] : '\0';
        }

        bool at_end() const { return pos >= source.size(); }

        void advance(std::size_t count = 1);

        llvm::Error lex_trivia(Trivia &trivia, bool trailing);
        llvm::Error lex_block_comment(Trivia &trivia);

        expected< Token > lex_token();

        void lex_identifier();
        bool lex_number();
        void lex_operator();
        llvm::Error lex_string_literal(unsigned hashes);
        llvm::Error lex_interpolation(unsigned start_line, unsigned start_column);
        llvm::Error lex_regex_literal(unsigned hashes);

        llvm::Error error_at(unsigned at_line, unsigned at_column, const llvm::Twine &msg) const;

        llvm::StringRef source;
        std::size_t pos = 0;
        unsigned line   = 1;
        unsigned column = 1;
    };

    expected< std::vector< Token > > tokenize(llvm::StringRef source);

} // namespace flagcleaner::syntax
