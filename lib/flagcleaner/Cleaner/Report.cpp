/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Cleaner/Report.hpp>

#include <algorithm>
#include <map>

#include <llvm/Support/Format.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/WithColor.h>

namespace flagcleaner::cleaner {

    namespace {
        constexpr std::size_t kMaxListedFiles   = 15;
        constexpr std::size_t kTruncatedListing = 10;
    } // namespace

    std::vector< ExtensionGroup > groupByExtension(const std::vector< std::string > &paths) {
        std::map< std::string, std::vector< std::string > > groups;
        for (const auto &path : paths) {
            auto ext = llvm::sys::path::extension(path);
            groups[ext.empty() ? "Unknown" : ext.str()].push_back(path);
        }

        std::vector< ExtensionGroup > result;
        for (auto &[extension, files] : groups) {
            std::sort(files.begin(), files.end());
            result.push_back({ extension, std::move(files) });
        }
        return result;
    }

    void printBanner(llvm::raw_ostream &os, const Options &options) {
        llvm::WithColor(os, llvm::raw_ostream::BLUE, /*Bold=*/true) << "Welcome to FlagCleaner!\n";
        llvm::WithColor(os, llvm::raw_ostream::CYAN) << "Scanning directory: " << options.path
                                                     << "\n";
        llvm::WithColor(os, llvm::raw_ostream::CYAN)
            << "Searching for files containing: \"" << options.flag << "\"\n";
    }

    void printSummary(llvm::raw_ostream &os, const Summary &summary) {
        llvm::WithColor(os, llvm::raw_ostream::GREEN, /*Bold=*/true)
            << "Successfully processed " << summary.changed() << " out of " << summary.matched()
            << " files.\n";
        llvm::WithColor(os, llvm::raw_ostream::GREEN)
            << "Total processing time: " << llvm::format("%.2f", summary.elapsed_seconds)
            << " seconds\n";

        auto failures = summary.failures();
        if (!failures.empty()) {
            llvm::WithColor(os, llvm::raw_ostream::RED, /*Bold=*/true)
                << "\nThe following " << failures.size() << " files could not be processed:\n";
            for (const auto *outcome : failures) {
                llvm::WithColor(os, llvm::raw_ostream::RED)
                    << " - " << outcome->path << ": " << kindName(outcome->failure->kind) << ": "
                    << outcome->failure->message << "\n";
            }
        }

        auto unchanged = summary.unchanged_files();
        if (unchanged.empty()) {
            return;
        }

        llvm::WithColor(os, llvm::raw_ostream::YELLOW, /*Bold=*/true)
            << "\nThe following " << unchanged.size()
            << " files were matched but had no changes:\n";
        llvm::WithColor(os, llvm::raw_ostream::YELLOW)
            << "These files may need manual review as they might contain the flag in a "
               "different format:\n";

        for (const auto &group : groupByExtension(unchanged)) {
            llvm::WithColor(os, llvm::raw_ostream::SAVEDCOLOR, /*Bold=*/true)
                << "\n" << group.extension << " files (" << group.files.size() << "):\n";

            auto listed = group.files.size() > kMaxListedFiles ? kTruncatedListing
                                                                : group.files.size();
            for (std::size_t i = 0; i < listed; ++i) {
                llvm::WithColor(os, llvm::raw_ostream::YELLOW) << " - " << group.files[i] << "\n";
            }
            if (listed < group.files.size()) {
                os << "   ... and " << group.files.size() - listed << " more files\n";
            }
        }
    }

} // namespace flagcleaner::cleaner
