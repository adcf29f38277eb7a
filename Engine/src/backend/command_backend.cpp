/**
 * @file command_backend.cpp
 * @brief terraform / terragrunt state pull and push
 */

#include <backend/command_backend.hpp>
#include <backend/process.hpp>
#include <state/errors.hpp>
#include <utils/logger.hpp>
#include <filesystem>
#include <system_error>

namespace Terrasplit {

namespace fs = std::filesystem;

CommandBackend::CommandBackend(CommandBackendConfig config) : config_(std::move(config)) {}

ToolKind CommandBackend::detect_tool(const std::string& directory) const {
    if (config_.forced_tool) return *config_.forced_tool;

    std::error_code ec;
    if (fs::exists(fs::path(directory) / "terragrunt.hcl", ec)) {
        return ToolKind::Terragrunt;
    }
    return ToolKind::Terraform;
}

const std::string& CommandBackend::executable(ToolKind tool) const {
    return tool == ToolKind::Terragrunt ? config_.terragrunt_bin : config_.terraform_bin;
}

std::string CommandBackend::pull(const std::string& directory) {
    Logger::debug("Pulling state from " + directory);
    std::string text = run(directory, {"state", "pull"}, "", "pull");
    Logger::debug("Pulled " + std::to_string(text.size()) + " bytes from " + directory);
    return text;
}

void CommandBackend::push(const std::string& directory, const std::string& state_text) {
    Logger::debug("Pushing " + std::to_string(state_text.size()) + " bytes to " + directory);
    run(directory, {"state", "push", "-"}, state_text, "push");
}

std::string CommandBackend::run(const std::string& directory, const std::vector<std::string>& args,
                                const std::string& input, const char* action) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw BackendError(directory, "not a directory");
    }

    ToolKind tool = detect_tool(directory);
    const std::string& exe = executable(tool);
    Logger::debug(std::string("Running ") + exe + " state " + action + " in " + directory);

    ProcessResult result;
    try {
        result = run_process(exe, args, directory, input);
    } catch (const std::system_error& e) {
        throw BackendError(directory, std::string(action) + " could not start " + exe + ": " + e.what());
    }

    if (result.signal != 0) {
        throw BackendError(directory, exe + " state " + action + " killed by signal " +
                           std::to_string(result.signal), -1, result.stderr_text);
    }
    if (!result.succeeded()) {
        throw BackendError(directory, exe + " state " + action + " exited with status " +
                           std::to_string(result.exit_code) +
                           (result.stderr_text.empty() ? "" : ": " + result.stderr_text),
                           result.exit_code, result.stderr_text);
    }
    return result.stdout_text;
}

} // namespace Terrasplit
