/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <flagcleaner/Cleaner/ObjcCleaner.hpp>

#include <regex>
#include <vector>

#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/Path.h>

namespace flagcleaner::cleaner {

    namespace {

        enum class Directive { None, If, Ifdef, Ifndef, Elif, Else, Endif };

        struct Region
        {
            bool handled  = false; // opener tests the target flag
            bool positive = false; // the first branch survives
            bool keeping  = false; // lines of the current branch survive
            unsigned line = 0;
            unsigned kept = 0;
        };

        std::string escapeRegex(llvm::StringRef text) {
            static const llvm::StringRef special = R"(\^$.|?*+()[]{})";
            std::string escaped;
            for (char c : text) {
                if (special.contains(c)) {
                    escaped += '\\';
                }
                escaped += c;
            }
            return escaped;
        }

        class DirectiveMatcher
        {
          public:
            explicit DirectiveMatcher(llvm::StringRef flag) {
                auto name     = escapeRegex(flag);
                auto trailing = std::string(R"(\s*(?://.*|/\*.*)?$)");
                if_condition  = std::regex(
                    R"(^\s+(!\s*)?(?:defined\s*\(\s*)" + name + R"(\s*\)|defined\s+)" + name
                    + "|" + name + ")" + trailing
                );
                ifdef_condition = std::regex(R"(^\s+)" + name + trailing);
            }

            // Splits a preprocessor line into its directive and the rest.
            Directive classify(const std::string &line, std::string &rest) const {
                std::smatch match;
                if (!std::regex_match(line, match, directive)) {
                    return Directive::None;
                }
                rest = match[2].str();
                return llvm::StringSwitch< Directive >(match[1].str())
                    .Case("if", Directive::If)
                    .Case("ifdef", Directive::Ifdef)
                    .Case("ifndef", Directive::Ifndef)
                    .Case("elif", Directive::Elif)
                    .Case("else", Directive::Else)
                    .Case("endif", Directive::Endif)
                    .Default(Directive::None);
            }

            // Whether an opener tests the target flag, and if so whether the
            // flag being enabled selects its first branch.
            bool matches(Directive kind, const std::string &rest, bool &positive) const {
                std::smatch match;
                switch (kind) {
                    case Directive::If:
                        if (!std::regex_match(rest, match, if_condition)) {
                            return false;
                        }
                        positive = !match[1].matched;
                        return true;
                    case Directive::Ifdef:
                    case Directive::Ifndef:
                        if (!std::regex_match(rest, ifdef_condition)) {
                            return false;
                        }
                        positive = kind == Directive::Ifdef;
                        return true;
                    default:
                        return false;
                }
            }

          private:
            std::regex directive{ R"(^\s*#\s*(ifndef|ifdef|if|elif|else|endif)\b(.*)$)" };
            std::regex if_condition;
            std::regex ifdef_condition;
        };

    } // namespace

    expected< ObjcRewrite > transformObjcSource(llvm::StringRef source, llvm::StringRef flag) {
        DirectiveMatcher matcher(flag);

        ObjcRewrite result;
        std::vector< Region > regions;

        auto emitting = [&regions] {
            for (const auto &region : regions) {
                if (region.handled && !region.keeping) {
                    return false;
                }
            }
            return true;
        };

        unsigned number = 0;
        while (!source.empty()) {
            auto split = source.split('\n');
            auto line  = split.first;
            bool has_newline = source.size() != line.size();
            source = split.second;
            ++number;

            std::string rest;
            auto body = line.endswith("\r") ? line.drop_back() : line;
            auto kind = matcher.classify(body.str(), rest);

            bool drop = false;
            switch (kind) {
                case Directive::If:
                case Directive::Ifdef:
                case Directive::Ifndef: {
                    ++result.stats.blocks_visited;
                    Region region;
                    region.line = number;
                    if (matcher.matches(kind, rest, region.positive)) {
                        region.handled = true;
                        region.keeping = region.positive;
                        ++result.stats.blocks_resolved;
                        drop = true;
                    } else {
                        ++result.stats.blocks_skipped;
                    }
                    regions.push_back(region);
                    break;
                }
                case Directive::Elif:
                    if (!regions.empty() && regions.back().handled) {
                        auto &region = regions.back();
                        if (region.positive) {
                            region.keeping = false;
                            drop           = true;
                        } else {
                            // With the first branch gone, the chain continues
                            // as a plain #if.
                            region.handled = false;
                            if (emitting()) {
                                auto at = line.find("elif");
                                result.text += line.substr(0, at).str() + "if"
                                    + line.substr(at + 4).str();
                                if (has_newline) {
                                    result.text += '\n';
                                }
                            }
                            continue;
                        }
                    }
                    break;
                case Directive::Else:
                    if (!regions.empty() && regions.back().handled) {
                        regions.back().keeping = !regions.back().positive;
                        drop                   = true;
                    }
                    break;
                case Directive::Endif:
                    if (!regions.empty()) {
                        auto region = regions.back();
                        regions.pop_back();
                        if (region.handled) {
                            if (region.kept == 0) {
                                ++result.stats.blocks_removed;
                            }
                            drop = true;
                        }
                    }
                    break;
                case Directive::None:
                    break;
            }

            if (drop || !emitting()) {
                continue;
            }

            for (auto &region : regions) {
                if (region.handled) {
                    ++region.kept;
                }
            }
            result.text += line.str();
            if (has_newline) {
                result.text += '\n';
            }
        }

        for (const auto &region : regions) {
            if (region.handled) {
                return error(
                    ErrorKind::ParseFailure,
                    "unterminated conditional for '" + flag + "' opened at line "
                        + llvm::Twine(region.line)
                );
            }
        }

        result.edited = result.stats.blocks_resolved > 0;
        return result;
    }

    bool ObjcCleaner::handles(llvm::StringRef path) const {
        auto ext = llvm::sys::path::extension(path);
        return ext == ".m" || ext == ".mm" || ext == ".h";
    }

    FileOutcome ObjcCleaner::process_file(llvm::StringRef path) const {
        if (!fs.exists(path)) {
            return FileOutcome::failed(
                path, { ErrorKind::FileNotFound, "file not found: " + path.str() }
            );
        }

        auto source = fs.read(path);
        if (!source) {
            return FileOutcome::failed(
                path, takeFailure(source.takeError(), ErrorKind::ReadFailure)
            );
        }

        auto rewrite = transformObjcSource(*source, flag);
        if (!rewrite) {
            return FileOutcome::failed(
                path, takeFailure(rewrite.takeError(), ErrorKind::ParseFailure)
            );
        }

        FileOutcome outcome;
        outcome.path  = path.str();
        outcome.stats = rewrite->stats;
        if (!rewrite->edited) {
            outcome.status = FileStatus::Unchanged;
            return outcome;
        }

        if (auto err = fs.write_atomically(path, rewrite->text)) {
            auto failed  = FileOutcome::failed(path, takeFailure(std::move(err), ErrorKind::WriteFailure));
            failed.stats = outcome.stats;
            return failed;
        }
        outcome.status = FileStatus::Written;
        return outcome;
    }

} // namespace flagcleaner::cleaner
