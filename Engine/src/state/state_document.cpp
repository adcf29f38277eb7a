/**
 * @file state_document.cpp
 * @brief State document model helpers
 */

#include <state/state_document.hpp>
#include <state/module_path.hpp>

namespace Terrasplit {

const char* mode_name(ResourceMode mode) {
    return mode == ResourceMode::Data ? "data" : "managed";
}

const char* each_name(EachMode each) {
    switch (each) {
        case EachMode::List: return "list";
        case EachMode::Map:  return "map";
        case EachMode::None: break;
    }
    return "";
}

std::string ResourceInstance::instance_key() const {
    std::string key = index_key ? index_key->dump() : "-";
    auto deposed = extra.find("deposed");
    if (deposed != extra.end()) {
        key += "|deposed:" + deposed->dump();
    }
    return key;
}

bool operator==(const ResourceInstance& a, const ResourceInstance& b) {
    return a.index_key == b.index_key &&
           a.attributes == b.attributes &&
           a.sensitive_attributes == b.sensitive_attributes &&
           a.dependencies == b.dependencies &&
           a.private_data == b.private_data &&
           a.extra == b.extra;
}

bool operator!=(const ResourceInstance& a, const ResourceInstance& b) {
    return !(a == b);
}

std::string ResourceEntry::entry_key() const {
    return format_module_path(module) + "|" + mode_name(mode) + "|" + type + "|" + name;
}

std::string ResourceEntry::address() const {
    ResourceAddress addr;
    addr.module = module;
    addr.mode = mode;
    addr.type = type;
    addr.name = name;
    return addr.to_string();
}

std::string ResourceEntry::instance_address(const ResourceInstance& instance) const {
    std::string out = address();
    if (instance.index_key) out += format_index_key(*instance.index_key);
    auto deposed = instance.extra.find("deposed");
    if (deposed != instance.extra.end() && deposed->is_string()) {
        out += " (deposed " + deposed->get<std::string>() + ")";
    }
    return out;
}

bool operator==(const ResourceEntry& a, const ResourceEntry& b) {
    return a.mode == b.mode &&
           a.type == b.type &&
           a.name == b.name &&
           a.provider == b.provider &&
           a.module == b.module &&
           a.each == b.each &&
           a.instances == b.instances &&
           a.extra == b.extra;
}

size_t StateDocument::instance_count() const {
    size_t total = 0;
    for (const auto& entry : resources) total += entry.instances.size();
    return total;
}

const ResourceEntry* StateDocument::find(const std::string& entry_key) const {
    for (const auto& entry : resources) {
        if (entry.entry_key() == entry_key) return &entry;
    }
    return nullptr;
}

bool operator==(const StateDocument& a, const StateDocument& b) {
    return a.format_version == b.format_version &&
           a.tool_version == b.tool_version &&
           a.serial == b.serial &&
           a.lineage == b.lineage &&
           a.outputs == b.outputs &&
           a.resources == b.resources &&
           a.extra == b.extra;
}

} // namespace Terrasplit
