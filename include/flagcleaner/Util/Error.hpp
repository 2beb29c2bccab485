/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <system_error>

#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace flagcleaner {

    template< typename T >
    using expected = llvm::Expected< T >;

    enum class ErrorKind {
        FileNotFound,
        ReadFailure,
        ParseFailure,
        WriteFailure,
        DeleteFailure,
        InvalidArgument
    };

    llvm::StringRef kindName(ErrorKind kind);

    /**
     * @brief Error payload carried through llvm::Error. The kind is what
     * callers branch on; the message is for the report.
     */
    class CleanerError : public llvm::ErrorInfo< CleanerError >
    {
      public:
        static char ID;

        CleanerError(ErrorKind kind, std::string message)
            : error_kind(kind), text(std::move(message)) {}

        void log(llvm::raw_ostream &os) const override {
            os << kindName(error_kind) << ": " << text;
        }

        std::error_code convertToErrorCode() const override {
            return llvm::inconvertibleErrorCode();
        }

        ErrorKind kind() const { return error_kind; }
        std::string message() const override { return text; }

      private:
        ErrorKind error_kind;
        std::string text;
    };

    struct Failure
    {
        ErrorKind kind;
        std::string message;
    };

    llvm::Error error(ErrorKind kind, const llvm::Twine &msg);

    // Consumes `err`. Errors that are not CleanerError are reported with
    // `fallback` as their kind.
    Failure takeFailure(llvm::Error err, ErrorKind fallback);

} // namespace flagcleaner
