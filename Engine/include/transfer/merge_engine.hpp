/**
 * @file merge_engine.hpp
 * @brief Merge of relocated resources into a destination document
 *
 * Entries are deduplicated by (module path, mode, type, name). A new entry is
 * appended whole; an existing entry is merged instance by instance:
 * - new instance keys are appended to the existing entry
 * - colliding keys keep the destination's instance unless overwrite is set,
 *   in which case the incoming instance replaces it
 * An existing entry with a different `each` shape (count vs for_each vs none)
 * takes no incoming instance at all; each one is recorded as a ShapeMismatch
 * conflict, overwrite or not.
 * Every collision is recorded as a MergeConflict. Appends follow incoming
 * order, so the same inputs always produce the same destination ordering.
 */

#pragma once

#include <state/state_document.hpp>
#include <string>
#include <vector>

namespace Terrasplit {

enum class ConflictResolution {
    KeptDestination,
    Overwritten,
    ShapeMismatch
};

const char* resolution_name(ConflictResolution resolution);

/**
 * @brief An instance-level key collision.
 */
struct MergeConflict {
    std::string address;          // instance address in the destination
    size_t entry_index = 0;       // position of the incoming entry
    size_t instance_index = 0;    // position of the instance inside that entry
    ConflictResolution resolution = ConflictResolution::KeptDestination;
    bool identical = false;       // incoming and existing instances were equal
};

struct MergeResult {
    std::vector<MergeConflict> conflicts;
    size_t entries_added = 0;
    size_t instances_added = 0;
    size_t instances_replaced = 0;

    bool changed() const { return entries_added + instances_added + instances_replaced > 0; }

    /**
     * @brief True if the given incoming instance did not land in the destination (KeptDestination or ShapeMismatch).
     */
    bool rejected(size_t entry_index, size_t instance_index) const;
};

class MergeEngine {
public:
    /**
     * @brief Merge incoming entries into destination in place
     * @param destination Modified in place; serial and lineage are not touched
     * @param incoming Entries already relocated to their destination addresses
     * @param overwrite Replace colliding destination instances instead of keeping them
     */
    static MergeResult merge(StateDocument& destination,
                             const std::vector<ResourceEntry>& incoming,
                             bool overwrite);
};

} // namespace Terrasplit
