/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <optional>
#include <string>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>

#include <flagcleaner/Cleaner/Cleaner.hpp>
#include <flagcleaner/Cleaner/Report.hpp>
#include <flagcleaner/Util/FileSystem.hpp>
#include <flagcleaner/Util/Log.hpp>
#include <flagcleaner/Util/Options.hpp>
#include <flagcleaner/YAML/Configuration.hpp>

namespace {

    constexpr int kExitFailures = 1;
    constexpr int kExitUsage    = 2;

    llvm::cl::opt< std::string > path_option(
        "path", llvm::cl::desc("Directory containing Swift and Objective-C sources"),
        llvm::cl::value_desc("directory")
    );
    const llvm::cl::alias path_alias(
        "p", llvm::cl::desc("Alias for --path"), llvm::cl::aliasopt(path_option)
    );

    llvm::cl::opt< std::string > flag_option(
        "flag", llvm::cl::desc("Flag to remove, assumed enabled"), llvm::cl::value_desc("name")
    );
    const llvm::cl::alias flag_alias(
        "f", llvm::cl::desc("Alias for --flag"), llvm::cl::aliasopt(flag_option)
    );

    llvm::cl::opt< bool > verbose_option(
        "verbose", llvm::cl::desc("Enable debug logs"), llvm::cl::init(false)
    );
    const llvm::cl::alias verbose_alias(
        "v", llvm::cl::desc("Alias for --verbose"), llvm::cl::aliasopt(verbose_option)
    );

    llvm::cl::opt< unsigned > jobs_option(
        "jobs", llvm::cl::desc("Number of worker threads (0 = all cores)"), llvm::cl::init(0)
    );
    const llvm::cl::alias jobs_alias(
        "j", llvm::cl::desc("Alias for --jobs"), llvm::cl::aliasopt(jobs_option)
    );

    const llvm::cl::opt< std::string > config_option(
        "config", llvm::cl::desc("YAML configuration file"), llvm::cl::value_desc("filename")
    );

    const llvm::cl::opt< flagcleaner::EvaluationStrategy > evaluator_option(
        "evaluator", llvm::cl::desc("How #if conditions are evaluated"),
        llvm::cl::values(
            clEnumValN(
                flagcleaner::EvaluationStrategy::LeftToRight, "left-to-right",
                "Operators collapse left to right (default)"
            ),
            clEnumValN(
                flagcleaner::EvaluationStrategy::Structural, "structural",
                "Precedence-correct evaluation"
            )
        ),
        llvm::cl::init(flagcleaner::EvaluationStrategy::LeftToRight)
    );

    const llvm::cl::list< std::string > exclude_option(
        "exclude", llvm::cl::desc("Glob of paths to skip (repeatable)"),
        llvm::cl::value_desc("glob")
    );

    std::string currentDirectory() {
        llvm::SmallString< 256 > cwd;
        if (auto ec = llvm::sys::fs::current_path(cwd)) {
            LOG(WARNING) << "Cannot determine the current directory: " << ec.message() << "\n";
            return ".";
        }
        return cwd.str().str();
    }

    std::optional< flagcleaner::Options > parse_command_line_options(int argc, char **argv) {
        llvm::cl::ParseCommandLineOptions(
            argc, argv, "flagcleaner removes a feature flag from Swift and Objective-C sources\n"
        );

        flagcleaner::Options opts;

        if (!config_option.empty()) {
            opts.config_file = config_option.getValue();
            auto config      = flagcleaner::config::loadConfiguration(opts.config_file);
            if (!config) {
                return std::nullopt;
            }
            if (auto err = flagcleaner::config::applyConfiguration(*config, opts)) {
                LOG(ERROR) << llvm::toString(std::move(err)) << "\n";
                return std::nullopt;
            }
        }

        if (path_option.getNumOccurrences() > 0) {
            opts.path = path_option.getValue();
        }
        if (flag_option.getNumOccurrences() > 0) {
            opts.flag = flag_option.getValue();
        }
        if (jobs_option.getNumOccurrences() > 0) {
            opts.jobs = jobs_option.getValue();
        }
        if (evaluator_option.getNumOccurrences() > 0) {
            opts.evaluator = evaluator_option.getValue();
        }
        opts.verbose = opts.verbose || verbose_option.getValue();
        opts.exclude.insert(opts.exclude.end(), exclude_option.begin(), exclude_option.end());

        if (opts.path.empty()) {
            opts.path = currentDirectory();
        }

        if (opts.flag.empty()) {
            LOG(ERROR) << "No flag given; use --flag or the 'flag' key of --config\n";
            return std::nullopt;
        }
        if (auto err = flagcleaner::validateFlagName(opts.flag)) {
            LOG(ERROR) << llvm::toString(std::move(err)) << "\n";
            return std::nullopt;
        }

        return opts;
    }

} // namespace

int main(int argc, char **argv) {
    llvm::InitLLVM init(argc, argv);

    auto options = parse_command_line_options(argc, argv);
    if (!options) {
        return kExitUsage;
    }

    flagcleaner::cleaner::printBanner(llvm::outs(), *options);
    if (options->verbose) {
        LOG(DEBUG) << "Evaluator: " << flagcleaner::evaluationStrategyName(options->evaluator)
                   << ", jobs: " << options->jobs << "\n";
    }

    flagcleaner::RealFileSystem fs;
    flagcleaner::cleaner::Cleaner cleaner(*options, fs);
    cleaner.add_default_cleaners();

    auto summary = cleaner.run();
    if (!summary) {
        auto failure = flagcleaner::takeFailure(
            summary.takeError(), flagcleaner::ErrorKind::InvalidArgument
        );
        LOG(ERROR) << flagcleaner::kindName(failure.kind) << ": " << failure.message << "\n";
        return failure.kind == flagcleaner::ErrorKind::InvalidArgument ? kExitUsage
                                                                       : kExitFailures;
    }

    flagcleaner::cleaner::printSummary(llvm::outs(), *summary);
    return summary->count(flagcleaner::cleaner::FileStatus::Failed) == 0 ? 0 : kExitFailures;
}
