/**
 * @file state_document.hpp
 * @brief In-memory model of a Terraform state document (format version 4+)
 *
 * Only the fields the transfer engine reasons about are modeled. Attribute
 * bags stay opaque order-preserving JSON trees, and every field the model
 * does not name is kept in an `extra` object so it is re-emitted unchanged.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Terrasplit {

using Json = nlohmann::ordered_json;

/**
 * @brief Module path as a sequence of module calls, e.g. {"module.a", "module.b[\"k\"]"}.
 *
 * Empty means the root module.
 */
using ModulePath = std::vector<std::string>;

enum class ResourceMode {
    Managed,
    Data
};

enum class EachMode {
    None,
    List,
    Map
};

const char* mode_name(ResourceMode mode);
const char* each_name(EachMode each);

/**
 * @brief One instance of a resource (one count/for_each element, or the single instance).
 */
struct ResourceInstance {
    std::optional<Json> index_key;                        // number or string; absent without count/for_each
    std::optional<Json> attributes;                       // provider-owned, never inspected
    std::optional<Json> sensitive_attributes;
    std::optional<std::vector<std::string>> dependencies; // resource addresses
    std::optional<std::string> private_data;              // "private" blob, base64 text
    Json extra = Json::object();                          // schema_version, status, deposed, ...

    /**
     * @brief Identity of the instance within its resource: index key plus deposed object key.
     */
    std::string instance_key() const;
};

bool operator==(const ResourceInstance& a, const ResourceInstance& b);
bool operator!=(const ResourceInstance& a, const ResourceInstance& b);

/**
 * @brief A resource block in a given module, with all of its instances.
 */
struct ResourceEntry {
    ResourceMode mode = ResourceMode::Managed;
    std::string type;
    std::string name;
    std::string provider;
    ModulePath module;
    EachMode each = EachMode::None;
    std::vector<ResourceInstance> instances;
    Json extra = Json::object();

    /**
     * @brief Deduplication key: (module path, mode, type, name).
     */
    std::string entry_key() const;

    /**
     * @brief Resource address without an index, e.g. module.a.aws_vpc.main
     */
    std::string address() const;

    /**
     * @brief Address of one instance, e.g. module.a.aws_subnet.a[0]
     */
    std::string instance_address(const ResourceInstance& instance) const;
};

bool operator==(const ResourceEntry& a, const ResourceEntry& b);

/**
 * @brief A whole state document.
 */
struct StateDocument {
    int64_t format_version = 4;
    std::string tool_version;
    uint64_t serial = 0;
    std::string lineage;
    Json outputs = Json::object();
    std::vector<ResourceEntry> resources;
    Json extra = Json::object();

    /**
     * @brief Total number of instances across all resources.
     */
    size_t instance_count() const;

    /**
     * @brief Find an entry by its deduplication key, or nullptr.
     */
    const ResourceEntry* find(const std::string& entry_key) const;
};

bool operator==(const StateDocument& a, const StateDocument& b);

} // namespace Terrasplit
