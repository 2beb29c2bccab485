/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include <flagcleaner/Cleaner/Cleaner.hpp>
#include <flagcleaner/Util/Options.hpp>

namespace flagcleaner::cleaner {

    struct ExtensionGroup
    {
        std::string extension; // ".swift", ..., or "Unknown"
        std::vector< std::string > files;
    };

    // Groups sorted by extension, files sorted within each group.
    std::vector< ExtensionGroup > groupByExtension(const std::vector< std::string > &paths);

    void printBanner(llvm::raw_ostream &os, const Options &options);

    void printSummary(llvm::raw_ostream &os, const Summary &summary);

} // namespace flagcleaner::cleaner
