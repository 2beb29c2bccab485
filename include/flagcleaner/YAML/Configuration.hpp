/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <llvm/Support/Error.h>
#include <llvm/Support/YAMLTraits.h>

#include <flagcleaner/Util/Options.hpp>

namespace flagcleaner::config {

    // Contents of a `--config` file. Absent keys keep their defaults.
    //
    //   flag: FEATURE_FLAG
    //   path: Sources
    //   jobs: 8
    //   verbose: true
    //   evaluator: structural
    //   exclude:
    //     - "*/Generated/*"
    struct Configuration
    {
        std::string flag;
        std::string path;
        unsigned jobs = 0;
        bool verbose  = false;
        std::string evaluator;
        std::vector< std::string > exclude;
    };

    std::optional< Configuration > loadConfiguration(const std::string &file_path);

    std::optional< Configuration > parseConfiguration(const std::string &yaml_content);

    // Copies the values present in `config` into `options`. Relative paths
    // are resolved against the directory holding the configuration file.
    llvm::Error applyConfiguration(const Configuration &config, Options &options);

} // namespace flagcleaner::config

namespace llvm::yaml {

    template<>
    struct MappingTraits< flagcleaner::config::Configuration >
    {
        static void mapping(IO &io, flagcleaner::config::Configuration &config) {
            io.mapOptional("flag", config.flag);
            io.mapOptional("path", config.path);
            io.mapOptional("jobs", config.jobs);
            io.mapOptional("verbose", config.verbose);
            io.mapOptional("evaluator", config.evaluator);
            io.mapOptional("exclude", config.exclude);
        }
    };

} // namespace llvm::yaml
