/**
 * @file address_rewriter.hpp
 * @brief Module path relocation for moved resources
 *
 * Replaces the matched target prefix of a module path with a new prefix and
 * keeps the suffix below it:
 *
 *   target   module.net
 *   prefix   module.network
 *   module.net.module.vpc.aws_vpc.main -> module.network.module.vpc.aws_vpc.main
 *
 * Only the `dependencies` list of each instance is rewritten. References to
 * resources outside the target subtree are left as they are and reported as
 * dangling, since they now cross a document boundary. Addresses embedded in
 * attribute values are never inspected.
 */

#pragma once

#include <state/state_document.hpp>
#include <string>
#include <vector>

namespace Terrasplit {

/**
 * @brief A dependency that no longer resolves inside the document it will live in.
 */
struct DanglingReference {
    std::string instance_address;  // rewritten address of the depending instance
    std::string dependency;        // dependency text, unchanged
    std::string reason;
};

class AddressRewriter {
public:
    AddressRewriter(ModulePath target_path, ModulePath new_prefix);

    /**
     * @brief new_prefix + path[len(target):]. path must match the target.
     */
    ModulePath relocate(const ModulePath& path) const;

    /**
     * @brief Copy of entry under its new module path with dependencies repaired.
     * @param dangling Receives every dependency left pointing outside the moved subtree
     */
    ResourceEntry rewrite(const ResourceEntry& entry, std::vector<DanglingReference>& dangling) const;

    /**
     * @brief Rewrite one dependency address if it lies inside the moved subtree.
     * @return true if the address was inside the subtree (and rewritten)
     */
    bool rewrite_dependency(std::string& address) const;

    /**
     * @brief True when the new prefix equals the target, i.e. addresses are kept.
     */
    bool is_identity() const { return target_ == prefix_; }

    const ModulePath& target_path() const { return target_; }
    const ModulePath& new_prefix() const { return prefix_; }

private:
    ModulePath target_;
    ModulePath prefix_;
};

} // namespace Terrasplit
