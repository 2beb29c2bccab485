/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <flagcleaner/Util/Error.hpp>

namespace flagcleaner {

    /**
     * @brief File operations used by the cleaners.
     *
     * Implementations must be safe to call from several worker threads at
     * once as long as each call names a different path.
     */
    class FileSystem
    {
      public:
        virtual ~FileSystem() = default;

        virtual bool exists(llvm::StringRef path) const = 0;

        virtual expected< std::string > read(llvm::StringRef path) const = 0;

        // Replaces the contents of `path` in one step; readers observe either
        // the old or the new contents.
        virtual llvm::Error write_atomically(llvm::StringRef path, llvm::StringRef contents) = 0;

        virtual llvm::Error remove(llvm::StringRef path) = 0;
    };

    class RealFileSystem final : public FileSystem
    {
      public:
        bool exists(llvm::StringRef path) const override;
        expected< std::string > read(llvm::StringRef path) const override;
        llvm::Error write_atomically(llvm::StringRef path, llvm::StringRef contents) override;
        llvm::Error remove(llvm::StringRef path) override;
    };

} // namespace flagcleaner
