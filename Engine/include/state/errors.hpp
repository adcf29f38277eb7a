/**
 * @file errors.hpp
 * @brief Exception taxonomy for state transfer runs
 *
 * Every fatal condition is an exception derived from std::runtime_error.
 * Merge conflicts are not errors; see transfer/merge_engine.hpp.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Terrasplit {

/**
 * @brief Malformed or structurally unexpected state text or address.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error("parse error: " + message) {}
};

/**
 * @brief A requested module path selects zero resources in the source.
 */
class ModuleNotFoundError : public std::runtime_error {
public:
    ModuleNotFoundError(const std::string& module_path, const std::string& source)
        : std::runtime_error("module " + module_path + " selects no resources in " + source),
          module_path_(module_path) {}

    const std::string& module_path() const { return module_path_; }

private:
    std::string module_path_;
};

/**
 * @brief A pull or push against a directory's backend failed.
 */
class BackendError : public std::runtime_error {
public:
    BackendError(const std::string& directory, const std::string& message,
                 int exit_code = -1, const std::string& stderr_text = "")
        : std::runtime_error("backend error in " + directory + ": " + message),
          directory_(directory), exit_code_(exit_code), stderr_text_(stderr_text) {}

    const std::string& directory() const { return directory_; }
    int exit_code() const { return exit_code_; }
    const std::string& stderr_text() const { return stderr_text_; }

private:
    std::string directory_;
    int exit_code_;
    std::string stderr_text_;
};

/**
 * @brief Invalid command line, environment or mapping set.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("configuration error: " + message) {}
};

/**
 * @brief A document about to be pushed no longer carries the lineage pulled for its directory.
 */
class LineageError : public std::runtime_error {
public:
    LineageError(const std::string& directory, const std::string& expected, const std::string& actual)
        : std::runtime_error("lineage mismatch for " + directory + ": pulled " + expected +
                             ", about to push " + actual) {}
};

} // namespace Terrasplit
