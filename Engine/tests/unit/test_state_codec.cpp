/**
 * @file test_state_codec.cpp
 * @brief Unit tests for state document decoding and encoding
 *
 * Covers structural validation, the unknown-field passthrough that keeps
 * newer format versions intact, and round-trip stability.
 */

#include <gtest/gtest.h>
#include <state/state_codec.hpp>
#include <state/module_path.hpp>
#include <state/errors.hpp>
#include "state_fixtures.hpp"

using namespace Terrasplit;

// ============================================================================
// Decoding
// ============================================================================

TEST(StateCodecTest, DecodesDocumentScalars) {
    StateDocument doc = StateCodec::decode(Fixtures::monolith_state().dump());
    EXPECT_EQ(doc.format_version, 4);
    EXPECT_EQ(doc.tool_version, "1.5.7");
    EXPECT_EQ(doc.serial, 7u);
    EXPECT_EQ(doc.lineage, "lineage-source");
    ASSERT_EQ(doc.resources.size(), 3u);
}

TEST(StateCodecTest, DecodesResourceStructure) {
    StateDocument doc = StateCodec::decode(Fixtures::monolith_state().dump());

    const ResourceEntry& subnet = doc.resources[1];
    EXPECT_EQ(format_module_path(subnet.module), "module.networking");
    EXPECT_EQ(subnet.mode, ResourceMode::Managed);
    EXPECT_EQ(subnet.type, "aws_subnet");
    EXPECT_EQ(subnet.name, "a");
    EXPECT_EQ(subnet.each, EachMode::List);
    ASSERT_EQ(subnet.instances.size(), 1u);

    const ResourceInstance& inst = subnet.instances[0];
    ASSERT_TRUE(inst.index_key.has_value());
    EXPECT_EQ(inst.index_key->get<int>(), 0);
    ASSERT_TRUE(inst.dependencies.has_value());
    ASSERT_EQ(inst.dependencies->size(), 1u);
    EXPECT_EQ((*inst.dependencies)[0], "module.networking.aws_vpc.main");
    EXPECT_EQ(subnet.instance_address(inst), "module.networking.aws_subnet.a[0]");
}

TEST(StateCodecTest, RootModuleHasEmptyPath) {
    Json root = Fixtures::state(1, "l", {
        Fixtures::resource("", "aws_s3_bucket", "logs", {Fixtures::instance({{"bucket", "logs"}})})
    });
    StateDocument doc = StateCodec::decode(root.dump());
    ASSERT_EQ(doc.resources.size(), 1u);
    EXPECT_TRUE(doc.resources[0].module.empty());
    EXPECT_EQ(doc.resources[0].address(), "aws_s3_bucket.logs");
}

TEST(StateCodecTest, RejectsNonObjects) {
    EXPECT_THROW(StateCodec::decode("[]"), ParseError);
    EXPECT_THROW(StateCodec::decode("\"state\""), ParseError);
    EXPECT_THROW(StateCodec::decode("{not json"), ParseError);
}

TEST(StateCodecTest, RejectsMissingRequiredScalars) {
    for (const char* field : {"version", "terraform_version", "serial", "lineage"}) {
        Json root = Fixtures::monolith_state();
        root.erase(field);
        EXPECT_THROW(StateCodec::decode(root.dump()), ParseError) << "missing " << field;
    }
}

TEST(StateCodecTest, RejectsWrongScalarTypes) {
    Json root = Fixtures::monolith_state();
    root["serial"] = "7";
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);

    root = Fixtures::monolith_state();
    root["serial"] = -1;
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);

    root = Fixtures::monolith_state();
    root["lineage"] = 42;
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);
}

TEST(StateCodecTest, RejectsLegacyFormatVersion) {
    Json root = Fixtures::monolith_state();
    root["version"] = 3;
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);
}

TEST(StateCodecTest, RejectsMalformedResources) {
    Json root = Fixtures::monolith_state();
    root["resources"][0]["mode"] = "ephemeral";
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);

    root = Fixtures::monolith_state();
    root["resources"][0].erase("instances");
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);

    root = Fixtures::monolith_state();
    root["resources"][0]["module"] = "networking";
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);

    root = Fixtures::monolith_state();
    root["resources"][1]["instances"][0]["index_key"] = Json::array();
    EXPECT_THROW(StateCodec::decode(root.dump()), ParseError);
}

// ============================================================================
// Forward compatibility
// ============================================================================

TEST(StateCodecTest, UnknownFieldsSurviveEncode) {
    Json root = Fixtures::monolith_state();
    root["version"] = 5;
    root["future_top_level"] = {{"enabled", true}};
    root["resources"][0]["future_resource_field"] = "keep-me";
    root["resources"][0]["instances"][0]["identity"] = {{"arn", "arn:aws:ec2:vpc/vpc-1"}};
    root["resources"][0]["instances"][0]["create_before_destroy"] = true;

    Json encoded = Json::parse(StateCodec::encode(StateCodec::decode(root.dump())));

    EXPECT_EQ(encoded["version"].get<int>(), 5);
    EXPECT_TRUE(encoded["future_top_level"]["enabled"].get<bool>());
    EXPECT_TRUE(encoded["check_results"].is_null());
    EXPECT_EQ(encoded["resources"][0]["future_resource_field"].get<std::string>(), "keep-me");
    EXPECT_EQ(encoded["resources"][0]["instances"][0]["identity"]["arn"].get<std::string>(),
              "arn:aws:ec2:vpc/vpc-1");
    EXPECT_TRUE(encoded["resources"][0]["instances"][0]["create_before_destroy"].get<bool>());
    EXPECT_EQ(encoded["resources"][0]["instances"][0]["schema_version"].get<int>(), 0);
}

TEST(StateCodecTest, OpaqueBlobsPassThroughVerbatim) {
    Json root = Fixtures::monolith_state();
    Json& inst = root["resources"][0]["instances"][0];
    inst["private"] = "eyJzY2hlbWFfdmVyc2lvbiI6IjEifQ==";
    inst["sensitive_attributes"] = Json::parse(R"([[{"type":"get_attr","value":"password"}]])");
    inst["attributes"]["tags"] = {{"Name", "main"}, {"Env", "prod"}};

    Json encoded = Json::parse(StateCodec::encode(StateCodec::decode(root.dump())));
    const Json& out = encoded["resources"][0]["instances"][0];

    EXPECT_EQ(out["private"].get<std::string>(), "eyJzY2hlbWFfdmVyc2lvbiI6IjEifQ==");
    EXPECT_TRUE(out["sensitive_attributes"] == inst["sensitive_attributes"]);
    EXPECT_TRUE(out["attributes"] == inst["attributes"]);
}

// ============================================================================
// Round trip
// ============================================================================

TEST(StateCodecTest, RoundTripIsStable) {
    Json root = Fixtures::monolith_state();
    root["outputs"]["vpc_id"] = {{"value", "vpc-1"}, {"type", "string"}};
    root["outputs"]["db_endpoint"] = {{"value", "db.internal"}, {"type", "string"}, {"sensitive", true}};

    StateDocument first = StateCodec::decode(root.dump());
    std::string once = StateCodec::encode(first);
    StateDocument second = StateCodec::decode(once);
    std::string twice = StateCodec::encode(second);

    EXPECT_TRUE(first == second);
    EXPECT_EQ(once, twice);
}

TEST(StateCodecTest, OutputsAndResourcesKeepEncounterOrder) {
    Json root = Fixtures::monolith_state();
    root["outputs"]["zeta"] = {{"value", 1}, {"type", "number"}};
    root["outputs"]["alpha"] = {{"value", 2}, {"type", "number"}};

    Json encoded = Json::parse(StateCodec::encode(StateCodec::decode(root.dump())));

    auto it = encoded["outputs"].begin();
    EXPECT_EQ(it.key(), "zeta");
    ++it;
    EXPECT_EQ(it.key(), "alpha");

    EXPECT_EQ(encoded["resources"][0]["type"].get<std::string>(), "aws_vpc");
    EXPECT_EQ(encoded["resources"][1]["type"].get<std::string>(), "aws_subnet");
    EXPECT_EQ(encoded["resources"][2]["type"].get<std::string>(), "aws_db_instance");
}

TEST(StateCodecTest, EncodeEndsWithNewline) {
    std::string text = StateCodec::encode(StateCodec::decode(Fixtures::empty_state(0, "l").dump()));
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
}
