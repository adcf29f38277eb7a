#include <transfer/module_matcher.hpp>
#include <state/module_path.hpp>
#include <state/errors.hpp>
#include <algorithm>

namespace Terrasplit {

bool ModuleMatcher::matches(const ModulePath& resource_path, const ModulePath& target_path) {
    if (target_path.size() > resource_path.size()) return false;
    return std::equal(target_path.begin(), target_path.end(), resource_path.begin());
}

std::vector<size_t> ModuleMatcher::select(const StateDocument& doc, const ModulePath& target_path,
                                          const std::string& source_name) {
    std::vector<size_t> selected;
    for (size_t i = 0; i < doc.resources.size(); ++i) {
        if (matches(doc.resources[i].module, target_path)) {
            selected.push_back(i);
        }
    }
    if (selected.empty()) {
        throw ModuleNotFoundError(display_module_path(target_path), source_name);
    }
    return selected;
}

} // namespace Terrasplit
