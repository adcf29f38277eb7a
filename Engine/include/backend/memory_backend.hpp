/**
 * @file memory_backend.hpp
 * @brief In-memory backend with failure injection, for tests and rehearsals
 */

#pragma once

#include <backend/state_backend.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Terrasplit {

class MemoryBackend : public StateBackend {
public:
    std::string pull(const std::string& directory) override;
    void push(const std::string& directory, const std::string& state_text) override;
    ToolKind detect_tool(const std::string& directory) const override;

    /**
     * @brief Seed (or replace) the state of a directory.
     */
    void set_state(const std::string& directory, const std::string& state_text);

    /**
     * @brief Current state text, nullopt if the directory was never written.
     */
    std::optional<std::string> state(const std::string& directory) const;

    void set_tool(const std::string& directory, ToolKind tool);

    void fail_pull(const std::string& directory) { failing_pulls_.insert(normalize_directory(directory)); }
    void fail_push(const std::string& directory) { failing_pushes_.insert(normalize_directory(directory)); }

    void clear_failures() {
        failing_pulls_.clear();
        failing_pushes_.clear();
    }

    /**
     * @brief Directories successfully pushed, in push order.
     */
    const std::vector<std::string>& push_log() const { return push_log_; }

    size_t pull_count(const std::string& directory) const;

private:
    std::map<std::string, std::string> states_;
    std::map<std::string, ToolKind> tools_;
    std::map<std::string, size_t> pulls_;
    std::set<std::string> failing_pulls_;
    std::set<std::string> failing_pushes_;
    std::vector<std::string> push_log_;
};

} // namespace Terrasplit
