/**
 * @file test_serial_policy.cpp
 * @brief Unit tests for serial increments and lineage preservation
 */

#include <gtest/gtest.h>
#include <transfer/serial_policy.hpp>
#include <state/state_codec.hpp>
#include <state/errors.hpp>
#include "state_fixtures.hpp"
#include <regex>
#include <set>

using namespace Terrasplit;

TEST(SerialPolicyTest, FinalizeIncrementsPulledSerialByOne) {
    StateDocument doc = StateCodec::decode(Fixtures::monolith_state().dump());
    PulledState pulled = SerialPolicy::snapshot("live/mono", doc);

    SerialPolicy::finalize(doc, pulled);

    EXPECT_EQ(doc.serial, 8u);
    EXPECT_EQ(doc.lineage, "lineage-source");
}

TEST(SerialPolicyTest, FinalizeIsRelativeToPulledNotCurrentSerial) {
    StateDocument doc = StateCodec::decode(Fixtures::monolith_state().dump());
    PulledState pulled = SerialPolicy::snapshot("live/mono", doc);

    SerialPolicy::finalize(doc, pulled);
    SerialPolicy::finalize(doc, pulled);

    EXPECT_EQ(doc.serial, 8u);
}

TEST(SerialPolicyTest, LineageDriftIsRejected) {
    StateDocument doc = StateCodec::decode(Fixtures::monolith_state().dump());
    PulledState pulled = SerialPolicy::snapshot("live/mono", doc);

    doc.lineage = "lineage-destination";
    EXPECT_THROW(SerialPolicy::finalize(doc, pulled), LineageError);
    EXPECT_EQ(doc.serial, 7u);
}

TEST(SerialPolicyTest, InitialDocumentStartsNewHistory) {
    StateDocument doc = SerialPolicy::initial_document("1.5.7");
    EXPECT_EQ(doc.format_version, 4);
    EXPECT_EQ(doc.tool_version, "1.5.7");
    EXPECT_EQ(doc.serial, 0u);
    EXPECT_TRUE(doc.resources.empty());
    EXPECT_FALSE(doc.lineage.empty());

    PulledState pulled = SerialPolicy::snapshot("live/new", doc, false);
    EXPECT_FALSE(pulled.initialized);
    SerialPolicy::finalize(doc, pulled);
    EXPECT_EQ(doc.serial, 1u);
}

TEST(SerialPolicyTest, GeneratedLineagesAreUuidV4AndDistinct) {
    const std::regex uuid_v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        std::string lineage = SerialPolicy::generate_lineage();
        EXPECT_TRUE(std::regex_match(lineage, uuid_v4)) << lineage;
        seen.insert(lineage);
    }
    EXPECT_EQ(seen.size(), 64u);
}
