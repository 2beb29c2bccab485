/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Cleaner/FileCleaner.hpp>

#include <llvm/Support/Path.h>

#include <flagcleaner/Rewrite/SourceRewriter.hpp>

namespace flagcleaner::cleaner {

    bool SwiftCleaner::handles(llvm::StringRef path) const {
        return llvm::sys::path::extension(path) == ".swift";
    }

    FileOutcome SwiftCleaner::process_file(llvm::StringRef path) const {
        if (!fs.exists(path)) {
            return FileOutcome::failed(
                path, { ErrorKind::FileNotFound, "file not found: " + path.str() }
            );
        }

        auto source = fs.read(path);
        if (!source) {
            return FileOutcome::failed(
                path, takeFailure(source.takeError(), ErrorKind::ReadFailure)
            );
        }

        auto rewrite = rewrite::processSource(*source, flag, strategy);
        if (!rewrite) {
            return FileOutcome::failed(
                path, takeFailure(rewrite.takeError(), ErrorKind::ParseFailure)
            );
        }

        FileOutcome outcome;
        outcome.path  = path.str();
        outcome.stats = rewrite->stats;

        if (!rewrite->edited) {
            outcome.status = FileStatus::Unchanged;
            return outcome;
        }

        if (rewrite->delete_requested) {
            if (auto err = fs.remove(path)) {
                auto failed  = FileOutcome::failed(path, takeFailure(std::move(err), ErrorKind::DeleteFailure));
                failed.stats = outcome.stats;
                return failed;
            }
            outcome.status = FileStatus::Deleted;
            return outcome;
        }

        if (auto err = fs.write_atomically(path, *rewrite->new_text)) {
            auto failed  = FileOutcome::failed(path, takeFailure(std::move(err), ErrorKind::WriteFailure));
            failed.stats = outcome.stats;
            return failed;
        }
        outcome.status = FileStatus::Written;
        return outcome;
    }

} // namespace flagcleaner::cleaner
