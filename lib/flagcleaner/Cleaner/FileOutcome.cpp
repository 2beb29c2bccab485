/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Cleaner/FileOutcome.hpp>

#include <llvm/Support/ErrorHandling.h>

namespace flagcleaner::cleaner {

    llvm::StringRef fileStatusName(FileStatus status) {
        switch (status) {
            case FileStatus::Written:
                return "written";
            case FileStatus::Deleted:
                return "deleted";
            case FileStatus::Unchanged:
                return "unchanged";
            case FileStatus::Failed:
                return "failed";
        }
        llvm_unreachable("unknown file status");
    }

} // namespace flagcleaner::cleaner
