/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Cleaner/FileSearch.hpp>

#include <algorithm>
#include <system_error>

#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

namespace flagcleaner::cleaner {

    bool isSourceFile(llvm::StringRef path) {
        auto ext = llvm::sys::path::extension(path);
        return ext == ".swift" || ext == ".m" || ext == ".mm" || ext == ".h";
    }

    expected< FileSearch > FileSearch::create(const std::vector< std::string > &excludes) {
        std::vector< llvm::GlobPattern > patterns;
        for (const auto &exclude : excludes) {
            auto pattern = llvm::GlobPattern::create(exclude);
            if (!pattern) {
                auto failure = takeFailure(pattern.takeError(), ErrorKind::InvalidArgument);
                return error(
                    ErrorKind::InvalidArgument,
                    "invalid exclude pattern '" + exclude + "': " + failure.message
                );
            }
            patterns.push_back(std::move(*pattern));
        }
        return FileSearch(std::move(patterns));
    }

    bool FileSearch::is_excluded(llvm::StringRef path, llvm::StringRef root) const {
        auto relative = path;
        if (relative.consume_front(root)) {
            relative = relative.ltrim(llvm::sys::path::get_separator());
        }
        auto name = llvm::sys::path::filename(path);

        return llvm::any_of(excludes, [&](const llvm::GlobPattern &pattern) {
            return pattern.match(path) || pattern.match(relative) || pattern.match(name);
        });
    }

    expected< std::vector< std::string > >
    FileSearch::collect_source_files(llvm::StringRef root) const {
        namespace fs = llvm::sys::fs;

        if (!fs::is_directory(root)) {
            return error(
                ErrorKind::InvalidArgument,
                "path does not exist or is not a directory: " + root
            );
        }

        std::vector< std::string > files;
        std::error_code ec;
        for (fs::recursive_directory_iterator it(root, ec), end; it != end; it.increment(ec)) {
            if (ec) {
                return error(
                    ErrorKind::ReadFailure, "cannot scan " + root + ": " + ec.message()
                );
            }

            auto path = it->path();
            auto name = llvm::sys::path::filename(path);
            auto type = it->type();

            if (type == fs::file_type::directory_file) {
                if (name == ".git" || name.endswith(".bundle") || is_excluded(path, root)) {
                    it.no_push();
                }
                continue;
            }

            if (type != fs::file_type::regular_file || !isSourceFile(path)) {
                continue;
            }
            if (is_excluded(path, root)) {
                continue;
            }
            files.push_back(path);
        }

        if (ec) {
            return error(ErrorKind::ReadFailure, "cannot scan " + root + ": " + ec.message());
        }

        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector< std::string > FileSearch::filter_files_containing(
        const std::vector< std::string > &paths, llvm::StringRef flag, const FileSystem &fs
    ) const {
        std::vector< std::string > matching;
        for (const auto &path : paths) {
            auto contents = fs.read(path);
            if (!contents) {
                llvm::consumeError(contents.takeError());
                matching.push_back(path);
                continue;
            }
            if (llvm::StringRef(*contents).contains(flag)) {
                matching.push_back(path);
            }
        }
        return matching;
    }

} // namespace flagcleaner::cleaner
