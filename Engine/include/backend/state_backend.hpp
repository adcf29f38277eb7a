/**
 * @file state_backend.hpp
 * @brief Interface to wherever a directory's state actually lives
 */

#pragma once

#include <optional>
#include <string>

namespace Terrasplit {

enum class ToolKind {
    Terraform,
    Terragrunt
};

const char* tool_name(ToolKind tool);

/**
 * @brief Parse "terraform" / "terragrunt". Returns nullopt for anything else (including "auto").
 */
std::optional<ToolKind> parse_tool(const std::string& name);

/**
 * @brief Lexically normalized directory used as the identity of a backend path.
 *
 * "./net/" and "net" name the same directory; no filesystem access is made.
 */
std::string normalize_directory(const std::string& directory);

/**
 * @brief Pull/push access to the state of a working directory
 *
 * Every call names its directory explicitly. Implementations serialize
 * access per directory themselves (Terraform state locking); the engine
 * performs no locking of its own.
 */
class StateBackend {
public:
    virtual ~StateBackend() = default;

    /**
     * @brief Current state text. Empty text means no state exists yet.
     * @throws BackendError
     */
    virtual std::string pull(const std::string& directory) = 0;

    /**
     * @brief Replace the directory's state with state_text.
     * @throws BackendError
     */
    virtual void push(const std::string& directory, const std::string& state_text) = 0;

    /**
     * @brief Which executable manages this directory.
     */
    virtual ToolKind detect_tool(const std::string& directory) const = 0;
};

} // namespace Terrasplit
