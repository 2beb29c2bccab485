/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <flagcleaner/Syntax/SyntaxTree.hpp>

namespace flagcleaner::rewrite {

    // Types, type aliases, functions, variables, macros and macro expansions.
    // Imports, comments and bare statements are not.
    bool isMeaningfulDeclaration(syntax::DeclKind kind);

    // True when no meaningful declaration is left anywhere in `file`,
    // including inside conditional blocks and brace bodies.
    bool isContentFree(const syntax::SourceFile &file);

} // namespace flagcleaner::rewrite
