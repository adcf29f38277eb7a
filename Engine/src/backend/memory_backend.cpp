#include <backend/memory_backend.hpp>
#include <state/errors.hpp>

namespace Terrasplit {

std::string MemoryBackend::pull(const std::string& directory) {
    std::string key = normalize_directory(directory);
    pulls_[key]++;

    if (failing_pulls_.count(key)) {
        throw BackendError(directory, "injected pull failure", 1, "lock held by another process");
    }

    auto it = states_.find(key);
    return it == states_.end() ? std::string() : it->second;
}

void MemoryBackend::push(const std::string& directory, const std::string& state_text) {
    std::string key = normalize_directory(directory);

    if (failing_pushes_.count(key)) {
        throw BackendError(directory, "injected push failure", 1, "Error acquiring the state lock");
    }

    states_[key] = state_text;
    push_log_.push_back(key);
}

ToolKind MemoryBackend::detect_tool(const std::string& directory) const {
    auto it = tools_.find(normalize_directory(directory));
    return it == tools_.end() ? ToolKind::Terraform : it->second;
}

void MemoryBackend::set_state(const std::string& directory, const std::string& state_text) {
    states_[normalize_directory(directory)] = state_text;
}

std::optional<std::string> MemoryBackend::state(const std::string& directory) const {
    auto it = states_.find(normalize_directory(directory));
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

void MemoryBackend::set_tool(const std::string& directory, ToolKind tool) {
    tools_[normalize_directory(directory)] = tool;
}

size_t MemoryBackend::pull_count(const std::string& directory) const {
    auto it = pulls_.find(normalize_directory(directory));
    return it == pulls_.end() ? 0 : it->second;
}

} // namespace Terrasplit
