/**
 * @file module_matcher.hpp
 * @brief Module subtree selection
 */

#pragma once

#include <state/state_document.hpp>
#include <vector>

namespace Terrasplit {

class ModuleMatcher {
public:
    /**
     * @brief True if resource_path equals target_path or lies below it (component-wise prefix).
     */
    static bool matches(const ModulePath& resource_path, const ModulePath& target_path);

    /**
     * @brief Positions of every resource in doc that belongs to the target subtree, in document order.
     * @param source_name Used only in the error message
     * @throws ModuleNotFoundError when nothing matches
     */
    static std::vector<size_t> select(const StateDocument& doc, const ModulePath& target_path,
                                      const std::string& source_name);
};

} // namespace Terrasplit
