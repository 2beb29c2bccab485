/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <flagcleaner/Cleaner/ObjcCleaner.hpp>

#include "InMemoryFileSystem.hpp"

using namespace flagcleaner;
using namespace flagcleaner::cleaner;

namespace {

    constexpr const char *kFlag = "FEATURE_FLAG";

    std::string transform(llvm::StringRef source) {
        auto result = transformObjcSource(source, kFlag);
        if (!result) {
            ADD_FAILURE() << llvm::toString(result.takeError());
            return {};
        }
        return result->text;
    }

    bool edits(llvm::StringRef source) {
        auto result = transformObjcSource(source, kFlag);
        if (!result) {
            ADD_FAILURE() << llvm::toString(result.takeError());
            return false;
        }
        return result->edited;
    }

} // namespace

TEST(ObjcCleanerTest, IfKeepsFirstBranch) {
    EXPECT_EQ(
        transform(
            "#import <Foundation/Foundation.h>\n"
            "#if FEATURE_FLAG\n"
            "- (void)enabled;\n"
            "#else\n"
            "- (void)disabled;\n"
            "#endif\n"
            "@end\n"
        ),
        "#import <Foundation/Foundation.h>\n- (void)enabled;\n@end\n"
    );
}

TEST(ObjcCleanerTest, NegatedOpenersKeepElseBranch) {
    const char *expected = "new();\n";
    EXPECT_EQ(transform("#ifndef FEATURE_FLAG\nold();\n#else\nnew();\n#endif\n"), expected);
    EXPECT_EQ(transform("#if !FEATURE_FLAG\nold();\n#else\nnew();\n#endif\n"), expected);
    EXPECT_EQ(transform("#if !defined(FEATURE_FLAG)\nold();\n#else\nnew();\n#endif\n"), expected);
}

TEST(ObjcCleanerTest, DefinedForms) {
    EXPECT_EQ(transform("#ifdef FEATURE_FLAG // on\nx();\n#endif // FEATURE_FLAG\n"), "x();\n");
    EXPECT_EQ(transform("#if defined(FEATURE_FLAG)\nx();\n#endif\n"), "x();\n");
    EXPECT_EQ(transform("  #  if defined FEATURE_FLAG\nx();\n#endif\n"), "x();\n");
}

TEST(ObjcCleanerTest, RemovedRegionIsCounted) {
    auto result = transformObjcSource("a();\n#if !FEATURE_FLAG\nold();\n#endif\nb();\n", kFlag);
    ASSERT_TRUE(static_cast< bool >(result)) << llvm::toString(result.takeError());
    EXPECT_TRUE(result->edited);
    EXPECT_EQ(result->text, "a();\nb();\n");
    EXPECT_EQ(result->stats.blocks_resolved, 1u);
    EXPECT_EQ(result->stats.blocks_removed, 1u);
}

TEST(ObjcCleanerTest, KeepsUnrelatedNestedDirectives) {
    EXPECT_EQ(
        transform("#if FEATURE_FLAG\n#if DEBUG\nlog();\n#endif\nrun();\n#endif\n"),
        "#if DEBUG\nlog();\n#endif\nrun();\n"
    );
    EXPECT_EQ(
        transform("#if DEBUG\n#ifdef FEATURE_FLAG\nnew();\n#else\nold();\n#endif\n#endif\n"),
        "#if DEBUG\nnew();\n#endif\n"
    );
}

TEST(ObjcCleanerTest, DropsNestedDirectivesInsideRemovedBranch) {
    EXPECT_EQ(
        transform("#ifndef FEATURE_FLAG\n#if DEBUG\nlog();\n#endif\n#endif\nrun();\n"), "run();\n"
    );
}

TEST(ObjcCleanerTest, ElifAfterNegatedOpenerBecomesIf) {
    EXPECT_EQ(
        transform("#if !FEATURE_FLAG\na();\n#elif DEBUG\nb();\n#else\nc();\n#endif\n"),
        "#if DEBUG\nb();\n#else\nc();\n#endif\n"
    );
}

TEST(ObjcCleanerTest, ElifAfterPositiveOpenerIsDropped) {
    EXPECT_EQ(transform("#if FEATURE_FLAG\na();\n#elif DEBUG\nb();\n#else\nc();\n#endif\n"), "a();\n");
}

TEST(ObjcCleanerTest, IgnoresOtherConditions) {
    for (const char *source : {
             "#if FEATURE_FLAG_2\nx();\n#endif\n",
             "#if FEATURE_FLAG && DEBUG\nx();\n#endif\n",
             "#ifdef MY_FEATURE_FLAG\nx();\n#endif\n",
             "// #if FEATURE_FLAG\nx();\n",
         })
    {
        EXPECT_FALSE(edits(source)) << source;
        EXPECT_EQ(transform(source), source);
    }
}

TEST(ObjcCleanerTest, PreservesLineEndings) {
    EXPECT_EQ(transform("#if FEATURE_FLAG\r\nx();\r\n#endif\r\ny();"), "x();\r\ny();");
}

TEST(ObjcCleanerTest, UnterminatedRegionFails) {
    auto result = transformObjcSource("a();\n#if FEATURE_FLAG\nx();\n", kFlag);
    ASSERT_FALSE(static_cast< bool >(result));
    auto failure = takeFailure(result.takeError(), ErrorKind::ReadFailure);
    EXPECT_EQ(failure.kind, ErrorKind::ParseFailure);
    EXPECT_EQ(failure.message, "unterminated conditional for 'FEATURE_FLAG' opened at line 2");
}

TEST(ObjcCleanerTest, CleanerWritesInPlace) {
    test::InMemoryFileSystem fs;
    ObjcCleaner cleaner(fs, kFlag);
    EXPECT_TRUE(cleaner.handles("A.m"));
    EXPECT_TRUE(cleaner.handles("A.mm"));
    EXPECT_TRUE(cleaner.handles("A.h"));
    EXPECT_FALSE(cleaner.handles("A.swift"));

    fs.add_file("/p/A.m", "#ifndef FEATURE_FLAG\nold();\n#endif\n");
    auto outcome = cleaner.process_file("/p/A.m");
    EXPECT_EQ(outcome.status, FileStatus::Written);
    EXPECT_EQ(fs.contents("/p/A.m"), "");
    EXPECT_EQ(fs.removes(), 0u);

    fs.add_file("/p/B.h", "#if OTHER\nx();\n#endif\n");
    EXPECT_EQ(cleaner.process_file("/p/B.h").status, FileStatus::Unchanged);
    EXPECT_EQ(fs.writes(), 1u);
}

TEST(ObjcCleanerTest, CleanerReportsFailures) {
    test::InMemoryFileSystem fs;
    ObjcCleaner cleaner(fs, kFlag);

    auto missing = cleaner.process_file("/p/Missing.m");
    ASSERT_TRUE(missing.failure.has_value());
    EXPECT_EQ(missing.failure->kind, ErrorKind::FileNotFound);

    fs.add_file("/p/Open.m", "#if FEATURE_FLAG\nx();\n");
    auto open = cleaner.process_file("/p/Open.m");
    ASSERT_TRUE(open.failure.has_value());
    EXPECT_EQ(open.failure->kind, ErrorKind::ParseFailure);

    fs.add_file("/p/Locked.m", "#if FEATURE_FLAG\nx();\n#endif\n");
    fs.fail_write("/p/Locked.m");
    auto locked = cleaner.process_file("/p/Locked.m");
    ASSERT_TRUE(locked.failure.has_value());
    EXPECT_EQ(locked.failure->kind, ErrorKind::WriteFailure);
}
