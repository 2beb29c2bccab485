/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/GlobPattern.h>

#include <flagcleaner/Util/Error.hpp>
#include <flagcleaner/Util/FileSystem.hpp>

namespace flagcleaner::cleaner {

    // `.swift`, `.m`, `.mm` and `.h`.
    bool isSourceFile(llvm::StringRef path);

    /**
     * @brief Finds the candidate files of a run.
     *
     * Exclude patterns are globs matched against the full path, the path
     * relative to the search root and the file name.
     */
    class FileSearch
    {
      public:
        static expected< FileSearch > create(const std::vector< std::string > &excludes);

        // Sorted list of source files below `root`. `.git` and `*.bundle`
        // directories are not entered.
        expected< std::vector< std::string > > collect_source_files(llvm::StringRef root) const;

        // Files whose contents contain `flag` verbatim. Files that cannot be
        // read are kept so that processing reports them.
        std::vector< std::string > filter_files_containing(
            const std::vector< std::string > &paths, llvm::StringRef flag, const FileSystem &fs
        ) const;

      private:
        explicit FileSearch(std::vector< llvm::GlobPattern > excludes)
            : excludes(std::move(excludes)) {}

        bool is_excluded(llvm::StringRef path, llvm::StringRef root) const;

        std::vector< llvm::GlobPattern > excludes;
    };

} // namespace flagcleaner::cleaner
