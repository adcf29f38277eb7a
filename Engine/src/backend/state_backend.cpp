#include <backend/state_backend.hpp>
#include <filesystem>

namespace Terrasplit {

const char* tool_name(ToolKind tool) {
    return tool == ToolKind::Terragrunt ? "terragrunt" : "terraform";
}

std::optional<ToolKind> parse_tool(const std::string& name) {
    if (name == "terraform") return ToolKind::Terraform;
    if (name == "terragrunt") return ToolKind::Terragrunt;
    return std::nullopt;
}

std::string normalize_directory(const std::string& directory) {
    if (directory.empty()) return directory;

    std::string out = std::filesystem::path(directory).lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

} // namespace Terrasplit
