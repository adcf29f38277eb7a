/**
 * @file command_backend.hpp
 * @brief Backend that shells out to terraform / terragrunt
 *
 * pull: `<tool> state pull` in the directory, stdout is the state text
 * push: `<tool> state push -` in the directory, state text on stdin
 */

#pragma once

#include <backend/state_backend.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Terrasplit {

struct CommandBackendConfig {
    std::optional<ToolKind> forced_tool;   // nullopt = detect per directory
    std::string terraform_bin = "terraform";
    std::string terragrunt_bin = "terragrunt";
};

class CommandBackend : public StateBackend {
public:
    explicit CommandBackend(CommandBackendConfig config = CommandBackendConfig());

    std::string pull(const std::string& directory) override;
    void push(const std::string& directory, const std::string& state_text) override;

    /**
     * @brief Terragrunt if the directory holds terragrunt.hcl, else Terraform, unless forced.
     */
    ToolKind detect_tool(const std::string& directory) const override;

private:
    std::string run(const std::string& directory, const std::vector<std::string>& args,
                    const std::string& input, const char* action);

    const std::string& executable(ToolKind tool) const;

    CommandBackendConfig config_;
};

} // namespace Terrasplit
