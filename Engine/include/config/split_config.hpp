/**
 * @file split_config.hpp
 * @brief Run configuration from environment, command line and mapping files
 *
 * Environment (read first, overridden by the command line):
 *   TERRASPLIT_TOOL            terraform | terragrunt | auto
 *   TERRASPLIT_TERRAFORM_BIN   terraform executable (default "terraform")
 *   TERRASPLIT_TERRAGRUNT_BIN  terragrunt executable (default "terragrunt")
 *   TERRASPLIT_VERBOSE         1/true/yes enables debug logging
 */

#pragma once

#include <backend/command_backend.hpp>
#include <transfer/split_orchestrator.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Terrasplit {

struct SplitConfig {
    std::string source;
    std::vector<SplitMapping> mappings;

    bool dry_run = false;
    bool overwrite = false;
    bool json_output = false;
    bool verbose = false;
    bool show_help = false;

    std::optional<ToolKind> tool;
    std::string terraform_bin = "terraform";
    std::string terragrunt_bin = "terragrunt";

    /**
     * @brief Defaults overlaid with TERRASPLIT_* variables.
     * @throws ConfigError on an unknown tool name
     */
    static SplitConfig load_from_env();

    /**
     * @brief load_from_env() overlaid with the command line.
     * @throws ConfigError on unknown options, malformed mappings or a missing source
     */
    static SplitConfig parse(int argc, const char* const* argv);

    /**
     * @brief Read a JSON array of {"module", "destination", "prefix"} objects.
     *
     * A missing "prefix" keeps the module path; an empty one flattens into the root.
     */
    static std::vector<SplitMapping> load_mappings_file(const std::string& path);

    /**
     * @brief Parse "MODULE=DIR". The first '=' outside an index key separates the two.
     */
    static SplitMapping parse_split_argument(const std::string& argument);

    static std::string usage(const std::string& program);

    SplitOptions split_options() const;
    CommandBackendConfig backend_config() const;
};

} // namespace Terrasplit
