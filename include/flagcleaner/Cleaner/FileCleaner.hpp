/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Cleaner/FileOutcome.hpp>
#include <flagcleaner/Util/FileSystem.hpp>
#include <flagcleaner/Util/Options.hpp>

namespace flagcleaner::cleaner {

    // Removes the target flag from the files of one source dialect.
    class FileCleaner
    {
      public:
        virtual ~FileCleaner() = default;

        virtual const char *name(void) const = 0;

        virtual bool handles(llvm::StringRef path) const = 0;

        // Never throws and never logs; safe to call from worker threads for
        // distinct paths.
        virtual FileOutcome process_file(llvm::StringRef path) const = 0;
    };

    /**
     * @brief Structural cleaner for `.swift` sources.
     *
     * The file is parsed, rewritten, reparsed and then either replaced
     * atomically or deleted when nothing meaningful is left in it.
     */
    class SwiftCleaner final : public FileCleaner
    {
      public:
        SwiftCleaner(
            FileSystem &fs, std::string flag,
            EvaluationStrategy strategy = EvaluationStrategy::LeftToRight
        )
            : fs(fs), flag(std::move(flag)), strategy(strategy) {}

        const char *name(void) const override { return "swift"; }
        bool handles(llvm::StringRef path) const override;
        FileOutcome process_file(llvm::StringRef path) const override;

      private:
        FileSystem &fs;
        std::string flag;
        EvaluationStrategy strategy;
    };

} // namespace flagcleaner::cleaner
