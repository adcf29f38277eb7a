/**
 * @file serial_policy.hpp
 * @brief Serial and lineage rules for documents about to be pushed
 *
 * Each backend directory keeps its own history line: a pushed document gets
 * the serial pulled for that directory plus one and the lineage pulled for
 * that directory, unchanged. Lineages are never copied between directories.
 */

#pragma once

#include <state/state_document.hpp>
#include <string>

namespace Terrasplit {

/**
 * @brief What was observed for a directory at pull time.
 */
struct PulledState {
    std::string directory;
    uint64_t serial = 0;
    std::string lineage;
    bool initialized = true;  // false when the backend held no state yet
};

class SerialPolicy {
public:
    /**
     * @brief Snapshot serial and lineage of a freshly pulled document.
     */
    static PulledState snapshot(const std::string& directory, const StateDocument& doc, bool initialized = true);

    /**
     * @brief Stamp doc for a push: serial = pulled.serial + 1, lineage verified unchanged.
     * @throws LineageError if the document's lineage drifted from what was pulled
     */
    static void finalize(StateDocument& doc, const PulledState& pulled);

    /**
     * @brief Empty document for a directory whose backend holds no state yet.
     *
     * Gets a fresh random lineage of its own; tool_version is taken from the source.
     */
    static StateDocument initial_document(const std::string& tool_version);

    /**
     * @brief Random version 4 UUID, the lineage format Terraform itself uses.
     */
    static std::string generate_lineage();
};

} // namespace Terrasplit
