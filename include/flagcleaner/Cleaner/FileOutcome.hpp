/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Rewrite/BlockRewriter.hpp>
#include <flagcleaner/Util/Error.hpp>

namespace flagcleaner::cleaner {

    enum class FileStatus { Written, Deleted, Unchanged, Failed };

    llvm::StringRef fileStatusName(FileStatus status);

    // What happened to one file. Every processed file ends in exactly one
    // status; `failure` is set iff the status is Failed.
    struct FileOutcome
    {
        std::string path;
        FileStatus status = FileStatus::Unchanged;
        std::optional< Failure > failure;
        rewrite::RewriteStats stats;

        bool changed() const {
            return status == FileStatus::Written || status == FileStatus::Deleted;
        }

        static FileOutcome failed(llvm::StringRef path, Failure failure) {
            FileOutcome outcome;
            outcome.path    = path.str();
            outcome.status  = FileStatus::Failed;
            outcome.failure = std::move(failure);
            return outcome;
        }
    };

} // namespace flagcleaner::cleaner
