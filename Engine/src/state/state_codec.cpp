/**
 * @file state_codec.cpp
 * @brief State document JSON decoding and encoding
 */

#include <state/state_codec.hpp>
#include <state/module_path.hpp>
#include <state/errors.hpp>

namespace Terrasplit {

namespace {

const Json& require(const Json& node, const char* key, const std::string& where) {
    auto it = node.find(key);
    if (it == node.end()) {
        throw ParseError(where + " is missing required field \"" + key + "\"");
    }
    return *it;
}

std::string require_string(const Json& node, const char* key, const std::string& where) {
    const Json& value = require(node, key, where);
    if (!value.is_string()) {
        throw ParseError(where + " field \"" + key + "\" must be a string");
    }
    return value.get<std::string>();
}

// Everything in `node` whose key is not in `known`, in encounter order.
Json collect_extra(const Json& node, std::initializer_list<const char*> known) {
    Json extra = Json::object();
    for (auto it = node.begin(); it != node.end(); ++it) {
        bool modeled = false;
        for (const char* k : known) {
            if (it.key() == k) { modeled = true; break; }
        }
        if (!modeled) extra[it.key()] = it.value();
    }
    return extra;
}

} // namespace

StateDocument StateCodec::decode(const std::string& text) {
    Json root;
    try {
        root = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw ParseError(std::string("invalid JSON: ") + e.what());
    }
    return from_json(root);
}

std::string StateCodec::encode(const StateDocument& doc) {
    return to_json(doc).dump(2) + "\n";
}

StateDocument StateCodec::from_json(const Json& root) {
    if (!root.is_object()) {
        throw ParseError("state document must be a JSON object");
    }

    StateDocument doc;
    const std::string where = "state document";

    const Json& version = require(root, "version", where);
    if (!version.is_number_integer()) {
        throw ParseError("state document field \"version\" must be an integer");
    }
    doc.format_version = version.get<int64_t>();
    if (doc.format_version < kMinFormatVersion) {
        throw ParseError("unsupported state format version " + std::to_string(doc.format_version) +
                         " (need " + std::to_string(kMinFormatVersion) + " or later)");
    }

    doc.tool_version = require_string(root, "terraform_version", where);

    const Json& serial = require(root, "serial", where);
    if (!serial.is_number_unsigned()) {
        throw ParseError("state document field \"serial\" must be a non-negative integer");
    }
    doc.serial = serial.get<uint64_t>();

    doc.lineage = require_string(root, "lineage", where);

    auto outputs = root.find("outputs");
    if (outputs != root.end()) {
        if (!outputs->is_object()) {
            throw ParseError("state document field \"outputs\" must be an object");
        }
        doc.outputs = *outputs;
    }

    auto resources = root.find("resources");
    if (resources != root.end()) {
        if (!resources->is_array()) {
            throw ParseError("state document field \"resources\" must be an array");
        }
        doc.resources.reserve(resources->size());
        for (size_t i = 0; i < resources->size(); ++i) {
            doc.resources.push_back(decode_resource((*resources)[i], i));
        }
    }

    doc.extra = collect_extra(root, {"version", "terraform_version", "serial", "lineage",
                                     "outputs", "resources"});
    return doc;
}

ResourceEntry StateCodec::decode_resource(const Json& node, size_t position) {
    const std::string where = "resource #" + std::to_string(position);
    if (!node.is_object()) {
        throw ParseError(where + " must be an object");
    }

    ResourceEntry entry;

    std::string mode = require_string(node, "mode", where);
    if (mode == "managed") {
        entry.mode = ResourceMode::Managed;
    } else if (mode == "data") {
        entry.mode = ResourceMode::Data;
    } else {
        throw ParseError(where + " has unknown mode \"" + mode + "\"");
    }

    entry.type = require_string(node, "type", where);
    entry.name = require_string(node, "name", where);
    entry.provider = require_string(node, "provider", where);

    auto module = node.find("module");
    if (module != node.end()) {
        if (!module->is_string()) {
            throw ParseError(where + " field \"module\" must be a string");
        }
        entry.module = parse_module_path(module->get<std::string>());
    }

    auto each = node.find("each");
    if (each != node.end()) {
        if (*each == "list") {
            entry.each = EachMode::List;
        } else if (*each == "map") {
            entry.each = EachMode::Map;
        } else {
            throw ParseError(where + " has unknown \"each\" value " + each->dump());
        }
    }

    const Json& instances = require(node, "instances", where);
    if (!instances.is_array()) {
        throw ParseError(where + " field \"instances\" must be an array");
    }
    const std::string owner = entry.address();
    for (const auto& inst : instances) {
        entry.instances.push_back(decode_instance(inst, owner));
    }

    entry.extra = collect_extra(node, {"module", "mode", "type", "name", "each", "provider", "instances"});
    return entry;
}

ResourceInstance StateCodec::decode_instance(const Json& node, const std::string& owner) {
    const std::string where = "instance of " + owner;
    if (!node.is_object()) {
        throw ParseError(where + " must be an object");
    }

    ResourceInstance instance;

    auto index_key = node.find("index_key");
    if (index_key != node.end()) {
        if (!index_key->is_number_integer() && !index_key->is_string()) {
            throw ParseError(where + " has an index_key that is neither integer nor string");
        }
        instance.index_key = *index_key;
    }

    auto attributes = node.find("attributes");
    if (attributes != node.end()) instance.attributes = *attributes;

    auto sensitive = node.find("sensitive_attributes");
    if (sensitive != node.end()) instance.sensitive_attributes = *sensitive;

    auto priv = node.find("private");
    if (priv != node.end()) {
        if (!priv->is_string()) {
            throw ParseError(where + " field \"private\" must be a string");
        }
        instance.private_data = priv->get<std::string>();
    }

    auto deps = node.find("dependencies");
    if (deps != node.end()) {
        if (!deps->is_array()) {
            throw ParseError(where + " field \"dependencies\" must be an array");
        }
        std::vector<std::string> addresses;
        for (const auto& dep : *deps) {
            if (!dep.is_string()) {
                throw ParseError(where + " has a non-string dependency " + dep.dump());
            }
            addresses.push_back(dep.get<std::string>());
        }
        instance.dependencies = std::move(addresses);
    }

    instance.extra = collect_extra(node, {"index_key", "attributes", "sensitive_attributes",
                                          "private", "dependencies"});
    return instance;
}

Json StateCodec::to_json(const StateDocument& doc) {
    Json root = Json::object();
    root["version"] = doc.format_version;
    root["terraform_version"] = doc.tool_version;
    root["serial"] = doc.serial;
    root["lineage"] = doc.lineage;
    root["outputs"] = doc.outputs;

    Json resources = Json::array();
    for (const auto& entry : doc.resources) {
        resources.push_back(encode_resource(entry));
    }
    root["resources"] = std::move(resources);

    for (auto it = doc.extra.begin(); it != doc.extra.end(); ++it) {
        root[it.key()] = it.value();
    }
    return root;
}

Json StateCodec::encode_resource(const ResourceEntry& entry) {
    Json node = Json::object();
    if (!entry.module.empty()) {
        node["module"] = format_module_path(entry.module);
    }
    node["mode"] = mode_name(entry.mode);
    node["type"] = entry.type;
    node["name"] = entry.name;
    if (entry.each != EachMode::None) {
        node["each"] = each_name(entry.each);
    }
    node["provider"] = entry.provider;

    Json instances = Json::array();
    for (const auto& instance : entry.instances) {
        instances.push_back(encode_instance(instance));
    }
    node["instances"] = std::move(instances);

    for (auto it = entry.extra.begin(); it != entry.extra.end(); ++it) {
        node[it.key()] = it.value();
    }
    return node;
}

Json StateCodec::encode_instance(const ResourceInstance& instance) {
    Json node = Json::object();
    if (instance.index_key) node["index_key"] = *instance.index_key;

    // schema_version, status and deposed sit ahead of the attribute bag in Terraform's own output
    for (auto it = instance.extra.begin(); it != instance.extra.end(); ++it) {
        node[it.key()] = it.value();
    }

    if (instance.attributes) node["attributes"] = *instance.attributes;
    if (instance.sensitive_attributes) node["sensitive_attributes"] = *instance.sensitive_attributes;
    if (instance.private_data) node["private"] = *instance.private_data;
    if (instance.dependencies) node["dependencies"] = *instance.dependencies;
    return node;
}

} // namespace Terrasplit
