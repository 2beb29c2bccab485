/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/YAML/Configuration.hpp>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/SourceMgr.h>

#include <flagcleaner/Util/Log.hpp>

namespace flagcleaner::config {

    namespace {
        std::string resolvePath(const std::string &base, const std::string &path) {
            if (base.empty() || llvm::sys::path::is_absolute(path)) {
                return path;
            }

            llvm::SmallString< 256 > resolved(base);
            llvm::sys::path::append(resolved, path);
            llvm::sys::path::remove_dots(resolved, /*remove_dot_dot=*/true);
            return resolved.str().str();
        }

        void reportYAMLDiagnostic(const llvm::SMDiagnostic &diag, void *context) {
            const auto *name = static_cast< const std::string * >(context);
            LOG(ERROR) << *name << ":" << diag.getLineNo() << ":" << diag.getColumnNo() + 1
                       << ": " << diag.getMessage() << "\n";
        }

        std::optional< Configuration >
        readConfiguration(llvm::StringRef yaml_content, const std::string &name) {
            Configuration config;
            llvm::yaml::Input input(
                yaml_content, nullptr, reportYAMLDiagnostic,
                const_cast< std::string * >(&name)
            );
            input >> config;
            if (input.error()) {
                return std::nullopt;
            }
            return config;
        }
    } // namespace

    std::optional< Configuration > loadConfiguration(const std::string &file_path) {
        auto buffer = llvm::MemoryBuffer::getFile(file_path);
        if (!buffer) {
            LOG(ERROR) << "Failed to read configuration " << file_path << ": "
                       << buffer.getError().message() << "\n";
            return std::nullopt;
        }

        auto result = readConfiguration((*buffer)->getBuffer(), file_path);
        if (!result) {
            LOG(ERROR) << "Invalid configuration: " << file_path << "\n";
            return std::nullopt;
        }

        auto directory = llvm::sys::path::parent_path(file_path).str();
        if (!result->path.empty()) {
            result->path = resolvePath(directory, result->path);
        }
        return result;
    }

    std::optional< Configuration > parseConfiguration(const std::string &yaml_content) {
        return readConfiguration(yaml_content, "<config>");
    }

    llvm::Error applyConfiguration(const Configuration &config, Options &options) {
        if (!config.flag.empty()) {
            options.flag = config.flag;
        }
        if (!config.path.empty()) {
            options.path = config.path;
        }
        if (config.jobs != 0) {
            options.jobs = config.jobs;
        }
        options.verbose = options.verbose || config.verbose;

        if (!config.evaluator.empty()) {
            auto strategy = parseEvaluationStrategy(config.evaluator);
            if (!strategy) {
                return strategy.takeError();
            }
            options.evaluator = *strategy;
        }

        options.exclude.insert(options.exclude.end(), config.exclude.begin(), config.exclude.end());
        return llvm::Error::success();
    }

} // namespace flagcleaner::config
