/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Cleaner/Cleaner.hpp>

#include <chrono>

#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>

#include <flagcleaner/Cleaner/FileSearch.hpp>
#include <flagcleaner/Cleaner/ObjcCleaner.hpp>
#include <flagcleaner/Util/Log.hpp>

namespace flagcleaner::cleaner {

    std::size_t Summary::count(FileStatus status) const {
        return static_cast< std::size_t >(llvm::count_if(outcomes, [&](const FileOutcome &outcome) {
            return outcome.status == status;
        }));
    }

    std::size_t Summary::changed() const {
        return count(FileStatus::Written) + count(FileStatus::Deleted);
    }

    std::vector< std::string > Summary::unchanged_files() const {
        std::vector< std::string > files;
        for (const auto &outcome : outcomes) {
            if (outcome.status == FileStatus::Unchanged) {
                files.push_back(outcome.path);
            }
        }
        return files;
    }

    std::vector< const FileOutcome * > Summary::failures() const {
        std::vector< const FileOutcome * > failed;
        for (const auto &outcome : outcomes) {
            if (outcome.status == FileStatus::Failed) {
                failed.push_back(&outcome);
            }
        }
        return failed;
    }

    void Cleaner::add_cleaner(std::unique_ptr< FileCleaner > cleaner) {
        cleaners.emplace_back(std::move(cleaner));
    }

    void Cleaner::add_default_cleaners() {
        add_cleaner(std::make_unique< SwiftCleaner >(fs, options.flag, options.evaluator));
        add_cleaner(std::make_unique< ObjcCleaner >(fs, options.flag));
    }

    FileOutcome Cleaner::process_file(llvm::StringRef path) const {
        for (const auto &cleaner : cleaners) {
            if (cleaner->handles(path)) {
                return cleaner->process_file(path);
            }
        }
        return FileOutcome::failed(
            path, { ErrorKind::InvalidArgument, "no cleaner handles " + path.str() }
        );
    }

    std::vector< FileOutcome > Cleaner::process_files(const std::vector< std::string > &paths
    ) const {
        std::vector< FileOutcome > outcomes(paths.size());
        if (paths.empty()) {
            return outcomes;
        }

        llvm::ThreadPool pool(llvm::hardware_concurrency(options.jobs));
        for (std::size_t i = 0; i < paths.size(); ++i) {
            pool.async([this, &paths, &outcomes, i] { outcomes[i] = process_file(paths[i]); });
        }
        pool.wait();

        return outcomes;
    }

    expected< Summary > Cleaner::run() const {
        auto start = std::chrono::steady_clock::now();

        auto search = FileSearch::create(options.exclude);
        if (!search) {
            return search.takeError();
        }

        auto files = search->collect_source_files(options.path);
        if (!files) {
            return files.takeError();
        }

        auto matching = search->filter_files_containing(*files, options.flag, fs);
        LOG(INFO) << "Found " << matching.size() << " matching source files out of "
                  << files->size() << " total\n";

        Summary summary;
        summary.scanned  = files->size();
        summary.outcomes = process_files(matching);

        if (options.verbose) {
            for (const auto &outcome : summary.outcomes) {
                LOG(DEBUG) << fileStatusName(outcome.status) << " " << outcome.path << " ["
                           << outcome.stats << "]\n";
            }
        }

        std::chrono::duration< double > elapsed = std::chrono::steady_clock::now() - start;
        summary.elapsed_seconds                 = elapsed.count();
        return summary;
    }

} // namespace flagcleaner::cleaner
