/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

#include <flagcleaner/Util/FileSystem.hpp>
#include <flagcleaner/Util/Options.hpp>
#include <flagcleaner/YAML/Configuration.hpp>

using namespace flagcleaner;
using namespace flagcleaner::config;

TEST(ConfigurationTest, ParsesAllKeys) {
    auto config = parseConfiguration(
        "flag: FEATURE_FLAG\n"
        "path: Sources\n"
        "jobs: 8\n"
        "verbose: true\n"
        "evaluator: structural\n"
        "exclude:\n"
        "  - \"*/Generated/*\"\n"
        "  - Pods\n"
    );
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->flag, "FEATURE_FLAG");
    EXPECT_EQ(config->path, "Sources");
    EXPECT_EQ(config->jobs, 8u);
    EXPECT_TRUE(config->verbose);
    EXPECT_EQ(config->evaluator, "structural");
    EXPECT_EQ(config->exclude, (std::vector< std::string >{ "*/Generated/*", "Pods" }));
}

TEST(ConfigurationTest, MissingKeysKeepDefaults) {
    auto config = parseConfiguration("flag: NEW_CHECKOUT\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->flag, "NEW_CHECKOUT");
    EXPECT_TRUE(config->path.empty());
    EXPECT_EQ(config->jobs, 0u);
    EXPECT_FALSE(config->verbose);
    EXPECT_TRUE(config->exclude.empty());
}

TEST(ConfigurationTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(parseConfiguration("jobs: many\n").has_value());
    EXPECT_FALSE(parseConfiguration("unknown_key: 1\n").has_value());
}

TEST(ConfigurationTest, ApplyOverridesPresentValues) {
    Options options;
    options.flag    = "CLI_FLAG";
    options.path    = "/cli/path";
    options.jobs    = 2;
    options.exclude = { "Vendor" };

    Configuration config;
    config.flag      = "FILE_FLAG";
    config.verbose   = true;
    config.evaluator = "structural";
    config.exclude   = { "Pods" };

    auto err = applyConfiguration(config, options);
    ASSERT_FALSE(static_cast< bool >(err)) << llvm::toString(std::move(err));
    EXPECT_EQ(options.flag, "FILE_FLAG");
    EXPECT_EQ(options.path, "/cli/path");
    EXPECT_EQ(options.jobs, 2u);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.evaluator, EvaluationStrategy::Structural);
    EXPECT_EQ(options.exclude, (std::vector< std::string >{ "Vendor", "Pods" }));
}

TEST(ConfigurationTest, ApplyRejectsUnknownEvaluator) {
    Options options;
    Configuration config;
    config.evaluator = "fastest";

    auto failure = takeFailure(applyConfiguration(config, options), ErrorKind::ReadFailure);
    EXPECT_EQ(failure.kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(failure.message, "unknown evaluator 'fastest', expected 'left-to-right' or 'structural'");
    EXPECT_EQ(options.evaluator, EvaluationStrategy::LeftToRight);
}

TEST(ConfigurationTest, LoadResolvesPathAgainstConfigDirectory) {
    llvm::SmallString< 128 > prefix;
    llvm::sys::path::system_temp_directory(/*erasedOnReboot=*/true, prefix);
    llvm::sys::path::append(prefix, "flagcleaner-config");
    llvm::SmallString< 128 > dir;
    ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory(prefix, dir));

    llvm::SmallString< 128 > file(dir);
    llvm::sys::path::append(file, "flagcleaner.yaml");

    RealFileSystem fs;
    auto err = fs.write_atomically(file.str().str(), "flag: FEATURE_FLAG\npath: ./App/../Sources\n");
    ASSERT_FALSE(static_cast< bool >(err)) << llvm::toString(std::move(err));

    auto config = loadConfiguration(file.str().str());
    ASSERT_TRUE(config.has_value());

    llvm::SmallString< 128 > expected(dir);
    llvm::sys::path::append(expected, "Sources");
    EXPECT_EQ(config->path, expected.str().str());

    EXPECT_FALSE(loadConfiguration((dir.str() + "/missing.yaml").str()).has_value());
    EXPECT_FALSE(llvm::sys::fs::remove_directories(dir));
}

TEST(OptionsTest, EvaluationStrategyNames) {
    for (auto strategy : { EvaluationStrategy::LeftToRight, EvaluationStrategy::Structural }) {
        auto parsed = parseEvaluationStrategy(evaluationStrategyName(strategy));
        ASSERT_TRUE(static_cast< bool >(parsed)) << llvm::toString(parsed.takeError());
        EXPECT_EQ(*parsed, strategy);
    }

    auto unknown = parseEvaluationStrategy("Structural");
    ASSERT_FALSE(static_cast< bool >(unknown));
    EXPECT_EQ(takeFailure(unknown.takeError(), ErrorKind::ReadFailure).kind, ErrorKind::InvalidArgument);
}

TEST(OptionsTest, ValidatesFlagNames) {
    for (const char *name : { "FEATURE_FLAG", "_private", "flag2", "a" }) {
        auto err = validateFlagName(name);
        EXPECT_FALSE(static_cast< bool >(err)) << name << ": " << llvm::toString(std::move(err));
    }

    for (const char *name : { "", "2FLAG", "FEATURE-FLAG", "A B", "!FLAG" }) {
        auto failure = takeFailure(validateFlagName(name), ErrorKind::ReadFailure);
        EXPECT_EQ(failure.kind, ErrorKind::InvalidArgument) << name;
        EXPECT_EQ(failure.message, "invalid flag name '" + std::string(name) + "'");
    }
}
