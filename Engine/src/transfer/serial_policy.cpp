#include <transfer/serial_policy.hpp>
#include <state/errors.hpp>
#include <random>

namespace Terrasplit {

PulledState SerialPolicy::snapshot(const std::string& directory, const StateDocument& doc, bool initialized) {
    PulledState pulled;
    pulled.directory = directory;
    pulled.serial = doc.serial;
    pulled.lineage = doc.lineage;
    pulled.initialized = initialized;
    return pulled;
}

void SerialPolicy::finalize(StateDocument& doc, const PulledState& pulled) {
    if (doc.lineage != pulled.lineage) {
        throw LineageError(pulled.directory, pulled.lineage, doc.lineage);
    }
    doc.serial = pulled.serial + 1;
}

StateDocument SerialPolicy::initial_document(const std::string& tool_version) {
    StateDocument doc;
    doc.format_version = 4;
    doc.tool_version = tool_version;
    doc.serial = 0;
    doc.lineage = generate_lineage();
    return doc;
}

std::string SerialPolicy::generate_lineage() {
    static const char hex_chars[] = "0123456789abcdef";

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string uuid;
    uuid.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) uuid += '-';
        int value = nibble(gen);
        if (i == 12) value = 4;                    // version
        if (i == 16) value = 8 | (value & 0x3);    // variant 10xx
        uuid += hex_chars[value];
    }
    return uuid;
}

} // namespace Terrasplit
