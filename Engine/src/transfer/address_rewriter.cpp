/**
 * @file address_rewriter.cpp
 * @brief Module prefix substitution and dependency repair
 */

#include <transfer/address_rewriter.hpp>
#include <transfer/module_matcher.hpp>
#include <state/module_path.hpp>
#include <state/errors.hpp>

namespace Terrasplit {

AddressRewriter::AddressRewriter(ModulePath target_path, ModulePath new_prefix)
    : target_(std::move(target_path)), prefix_(std::move(new_prefix)) {}

ModulePath AddressRewriter::relocate(const ModulePath& path) const {
    if (!ModuleMatcher::matches(path, target_)) {
        throw std::invalid_argument("module path " + display_module_path(path) +
                                    " is not under " + display_module_path(target_));
    }
    ModulePath out = prefix_;
    out.insert(out.end(), path.begin() + static_cast<std::ptrdiff_t>(target_.size()), path.end());
    return out;
}

bool AddressRewriter::rewrite_dependency(std::string& address) const {
    ResourceAddress parsed = parse_resource_address(address);
    if (!ModuleMatcher::matches(parsed.module, target_)) return false;

    parsed.module = relocate(parsed.module);
    address = parsed.to_string();
    return true;
}

ResourceEntry AddressRewriter::rewrite(const ResourceEntry& entry,
                                       std::vector<DanglingReference>& dangling) const {
    ResourceEntry out = entry;
    out.module = relocate(entry.module);

    for (auto& instance : out.instances) {
        if (!instance.dependencies) continue;

        for (auto& dep : *instance.dependencies) {
            try {
                if (!rewrite_dependency(dep)) {
                    dangling.push_back({out.instance_address(instance), dep,
                                        "refers to a resource outside " + display_module_path(target_)});
                }
            } catch (const ParseError& e) {
                dangling.push_back({out.instance_address(instance), dep,
                                    std::string("unparseable address: ") + e.what()});
            }
        }
    }

    return out;
}

} // namespace Terrasplit
