/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Util/Error.hpp>

#include <llvm/Support/ErrorHandling.h>

namespace flagcleaner {

    char CleanerError::ID = 0;

    llvm::StringRef kindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::FileNotFound:
                return "file not found";
            case ErrorKind::ReadFailure:
                return "read failure";
            case ErrorKind::ParseFailure:
                return "parse failure";
            case ErrorKind::WriteFailure:
                return "write failure";
            case ErrorKind::DeleteFailure:
                return "delete failure";
            case ErrorKind::InvalidArgument:
                return "invalid argument";
        }
        llvm_unreachable("unknown error kind");
    }

    llvm::Error error(ErrorKind kind, const llvm::Twine &msg) {
        return llvm::make_error< CleanerError >(kind, msg.str());
    }

    Failure takeFailure(llvm::Error err, ErrorKind fallback) {
        Failure failure{ fallback, {} };
        llvm::handleAllErrors(
            std::move(err),
            [&](const CleanerError &e) { failure = { e.kind(), e.message() }; },
            [&](const llvm::ErrorInfoBase &e) { failure = { fallback, e.message() }; }
        );
        return failure;
    }

} // namespace flagcleaner
