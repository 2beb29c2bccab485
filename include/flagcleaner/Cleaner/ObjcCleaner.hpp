/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/ADT/StringRef.h>

#include <flagcleaner/Cleaner/FileCleaner.hpp>
#include <flagcleaner/Rewrite/BlockRewriter.hpp>
#include <flagcleaner/Util/Error.hpp>

namespace flagcleaner::cleaner {

    struct ObjcRewrite
    {
        bool edited = false;
        std::string text;
        rewrite::RewriteStats stats;
    };

    /**
     * @brief Line-oriented removal of `flag` from Objective-C sources.
     *
     * Recognized openers are `#if FLAG`, `#if defined(FLAG)` and `#ifdef FLAG`,
     * which keep their first branch, and `#if !FLAG`, `#if !defined(FLAG)`
     * and `#ifndef FLAG`, which keep their `#else` branch. The directive lines
     * of a resolved region are dropped. Nested directives are tracked so that
     * each region ends at its own `#endif`.
     *
     * Fails with ParseFailure when a resolved region is never closed.
     */
    expected< ObjcRewrite > transformObjcSource(llvm::StringRef source, llvm::StringRef flag);

    // Cleaner for `.m`, `.mm` and `.h` files. Files are rewritten in place,
    // never deleted.
    class ObjcCleaner final : public FileCleaner
    {
      public:
        ObjcCleaner(FileSystem &fs, std::string flag) : fs(fs), flag(std::move(flag)) {}

        const char *name(void) const override { return "objc"; }
        bool handles(llvm::StringRef path) const override;
        FileOutcome process_file(llvm::StringRef path) const override;

      private:
        FileSystem &fs;
        std::string flag;
    };

} // namespace flagcleaner::cleaner
