/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <flagcleaner/Rewrite/FlagReferences.hpp>
#include <flagcleaner/Syntax/Lexer.hpp>
#include <flagcleaner/Syntax/Parser.hpp>

using namespace flagcleaner;
using namespace flagcleaner::rewrite;
using namespace flagcleaner::syntax;

namespace {

    FlagSet referencesOf(llvm::StringRef condition) {
        auto tokens = tokenize(condition);
        if (!tokens) {
            ADD_FAILURE() << llvm::toString(tokens.takeError());
            return {};
        }
        tokens->pop_back();
        return collectFlagReferences(parseCondition(*tokens));
    }

    FlagSet blockReferences(llvm::StringRef source) {
        auto file = parse(source);
        if (!file) {
            ADD_FAILURE() << llvm::toString(file.takeError());
            return {};
        }
        const auto *block = std::get_if< ConditionalBlock >(&file->items.front().value);
        if (block == nullptr) {
            ADD_FAILURE() << "no conditional block";
            return {};
        }
        return collectFlagReferences(*block);
    }

} // namespace

TEST(FlagReferencesTest, SingleFlag) {
    auto flags = referencesOf("FEATURE_FLAG");
    EXPECT_EQ(flags.names, std::set< std::string >{ "FEATURE_FLAG" });
    EXPECT_TRUE(flags.matches_only("FEATURE_FLAG"));
    EXPECT_FALSE(flags.matches_only("OTHER"));
}

TEST(FlagReferencesTest, RepeatedFlagCountsOnce) {
    auto flags = referencesOf("!(F || F) && F");
    EXPECT_EQ(flags.names.size(), 1u);
    EXPECT_TRUE(flags.matches_only("F"));
}

TEST(FlagReferencesTest, LiteralsAreNotReferences) {
    auto flags = referencesOf("F && true || 0");
    EXPECT_TRUE(flags.matches_only("F"));
}

TEST(FlagReferencesTest, MixedFlagsFailTheGuard) {
    auto flags = referencesOf("F && G");
    EXPECT_EQ(flags.names, (std::set< std::string >{ "F", "G" }));
    EXPECT_FALSE(flags.matches_only("F"));
}

TEST(FlagReferencesTest, UnsupportedConstructFailsTheGuard) {
    auto flags = referencesOf("F && os(iOS)");
    EXPECT_TRUE(flags.has_unsupported);
    EXPECT_EQ(flags.names, std::set< std::string >{ "F" });
    EXPECT_FALSE(flags.matches_only("F"));
}

TEST(FlagReferencesTest, LiteralOnlyConditionFailsTheGuard) {
    EXPECT_FALSE(referencesOf("0").matches_only("F"));
}

TEST(FlagReferencesTest, CollectsAcrossClauses) {
    auto flags = blockReferences("#if F\nlet a = 1\n#elseif !F\nlet b = 2\n#else\n#endif\n");
    EXPECT_TRUE(flags.matches_only("F"));

    flags = blockReferences("#if F\nlet a = 1\n#elseif G\nlet b = 2\n#endif\n");
    EXPECT_EQ(flags.names, (std::set< std::string >{ "F", "G" }));
}

TEST(FlagReferencesTest, IgnoresNestedBlocks) {
    auto flags = blockReferences("#if F\n#if G\nlet a = 1\n#endif\n#endif\n");
    EXPECT_TRUE(flags.matches_only("F"));
}
