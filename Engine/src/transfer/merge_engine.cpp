/**
 * @file merge_engine.cpp
 * @brief Deduplicating merge at entry and instance granularity
 */

#include <transfer/merge_engine.hpp>
#include <unordered_map>

namespace Terrasplit {

const char* resolution_name(ConflictResolution resolution) {
    switch (resolution) {
        case ConflictResolution::KeptDestination: return "kept_destination";
        case ConflictResolution::Overwritten:     return "overwritten";
        case ConflictResolution::ShapeMismatch:   return "shape_mismatch";
    }
    return "unknown";
}

bool MergeResult::rejected(size_t entry_index, size_t instance_index) const {
    for (const auto& conflict : conflicts) {
        if (conflict.entry_index == entry_index &&
            conflict.instance_index == instance_index &&
            conflict.resolution != ConflictResolution::Overwritten) {
            return true;
        }
    }
    return false;
}

MergeResult MergeEngine::merge(StateDocument& destination,
                               const std::vector<ResourceEntry>& incoming,
                               bool overwrite) {
    MergeResult result;

    std::unordered_map<std::string, size_t> by_key;
    by_key.reserve(destination.resources.size() + incoming.size());
    for (size_t i = 0; i < destination.resources.size(); ++i) {
        by_key.emplace(destination.resources[i].entry_key(), i);
    }

    for (size_t e = 0; e < incoming.size(); ++e) {
        const ResourceEntry& entry = incoming[e];
        auto found = by_key.find(entry.entry_key());

        if (found == by_key.end()) {
            by_key.emplace(entry.entry_key(), destination.resources.size());
            destination.resources.push_back(entry);
            result.entries_added++;
            result.instances_added += entry.instances.size();
            continue;
        }

        ResourceEntry& existing = destination.resources[found->second];

        // Mixing keyed and unkeyed instances under one entry is not a valid state.
        if (existing.each != entry.each) {
            for (size_t i = 0; i < entry.instances.size(); ++i) {
                MergeConflict conflict;
                conflict.address = entry.instance_address(entry.instances[i]);
                conflict.entry_index = e;
                conflict.instance_index = i;
                conflict.resolution = ConflictResolution::ShapeMismatch;
                result.conflicts.push_back(std::move(conflict));
            }
            continue;
        }

        std::unordered_map<std::string, size_t> instance_pos;
        for (size_t i = 0; i < existing.instances.size(); ++i) {
            instance_pos.emplace(existing.instances[i].instance_key(), i);
        }

        for (size_t i = 0; i < entry.instances.size(); ++i) {
            const ResourceInstance& instance = entry.instances[i];
            auto hit = instance_pos.find(instance.instance_key());

            if (hit == instance_pos.end()) {
                instance_pos.emplace(instance.instance_key(), existing.instances.size());
                existing.instances.push_back(instance);
                result.instances_added++;
                continue;
            }

            ResourceInstance& current = existing.instances[hit->second];

            MergeConflict conflict;
            conflict.address = existing.instance_address(current);
            conflict.entry_index = e;
            conflict.instance_index = i;
            conflict.identical = (current == instance);

            if (overwrite) {
                conflict.resolution = ConflictResolution::Overwritten;
                if (!conflict.identical) {
                    current = instance;
                    result.instances_replaced++;
                }
            } else {
                conflict.resolution = ConflictResolution::KeptDestination;
            }
            result.conflicts.push_back(std::move(conflict));
        }
    }

    return result;
}

} // namespace Terrasplit
