/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Cleaner/FileCleaner.hpp>
#include <flagcleaner/Cleaner/FileOutcome.hpp>
#include <flagcleaner/Util/Error.hpp>
#include <flagcleaner/Util/FileSystem.hpp>
#include <flagcleaner/Util/Options.hpp>

namespace flagcleaner::cleaner {

    struct Summary
    {
        std::size_t scanned = 0; // source files found below the root
        std::vector< FileOutcome > outcomes;
        double elapsed_seconds = 0;

        std::size_t matched() const { return outcomes.size(); }
        std::size_t count(FileStatus status) const;
        std::size_t changed() const;

        std::vector< std::string > unchanged_files() const;
        std::vector< const FileOutcome * > failures() const;
    };

    /**
     * @brief Drives one run: search, pre-filter and per-file processing.
     *
     * Files are processed on a thread pool. Each task fills its own result
     * slot, so nothing is shared between workers and the outcomes keep the
     * order of the input paths.
     */
    class Cleaner
    {
      public:
        Cleaner(Options options, FileSystem &fs) : options(std::move(options)), fs(fs) {}

        void add_cleaner(std::unique_ptr< FileCleaner > cleaner);

        // Registers the Swift and Objective-C cleaners for the configured flag.
        void add_default_cleaners();

        // One outcome per path, in input order. A path no cleaner handles
        // fails with InvalidArgument.
        std::vector< FileOutcome > process_files(const std::vector< std::string > &paths) const;

        expected< Summary > run() const;

      private:
        FileOutcome process_file(llvm::StringRef path) const;

        Options options;
        FileSystem &fs;
        std::vector< std::unique_ptr< FileCleaner > > cleaners;
    };

} // namespace flagcleaner::cleaner
