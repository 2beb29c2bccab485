/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Util/FileSystem.hpp>

#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/MemoryBuffer.h>

namespace flagcleaner {

    bool RealFileSystem::exists(llvm::StringRef path) const {
        return llvm::sys::fs::exists(path);
    }

    expected< std::string > RealFileSystem::read(llvm::StringRef path) const {
        auto buffer_or_err = llvm::MemoryBuffer::getFile(path);
        if (!buffer_or_err) {
            return error(
                ErrorKind::ReadFailure,
                "failed to read " + path + ": " + buffer_or_err.getError().message()
            );
        }
        return buffer_or_err.get()->getBuffer().str();
    }

    llvm::Error RealFileSystem::write_atomically(llvm::StringRef path, llvm::StringRef contents) {
        auto temp_model = (path + "-%%%%%%%%.tmp").str();
        if (auto err = llvm::writeFileAtomically(temp_model, path, contents)) {
            return error(
                ErrorKind::WriteFailure,
                "failed to write " + path + ": " + llvm::toString(std::move(err))
            );
        }
        return llvm::Error::success();
    }

    llvm::Error RealFileSystem::remove(llvm::StringRef path) {
        if (auto ec = llvm::sys::fs::remove(path, /*IgnoreNonExisting=*/false)) {
            return error(ErrorKind::DeleteFailure, "failed to remove " + path + ": " + ec.message());
        }
        return llvm::Error::success();
    }

} // namespace flagcleaner
