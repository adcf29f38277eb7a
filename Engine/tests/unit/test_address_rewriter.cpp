/**
 * @file test_address_rewriter.cpp
 * @brief Unit tests for module prefix relocation and dependency repair
 */

#include <gtest/gtest.h>
#include <transfer/address_rewriter.hpp>
#include <state/module_path.hpp>
#include <state/state_codec.hpp>
#include "state_fixtures.hpp"

using namespace Terrasplit;

static ModulePath P(const std::string& text) {
    return parse_module_path(text);
}

// ============================================================================
// Path relocation
// ============================================================================

TEST(AddressRewriterTest, FlattenIntoRoot) {
    AddressRewriter rewriter(P("module.networking"), {});
    EXPECT_TRUE(rewriter.relocate(P("module.networking")).empty());
    EXPECT_EQ(format_module_path(rewriter.relocate(P("module.networking.module.vpc"))), "module.vpc");
}

TEST(AddressRewriterTest, RenamePrefixKeepsSuffix) {
    AddressRewriter rewriter(P("module.networking"), P("module.network[\"prod\"]"));
    EXPECT_EQ(format_module_path(rewriter.relocate(P("module.networking.module.vpc.module.nat[0]"))),
              "module.network[\"prod\"].module.vpc.module.nat[0]");
}

TEST(AddressRewriterTest, IdentityPrefixKeepsAddresses) {
    AddressRewriter rewriter(P("module.networking"), P("module.networking"));
    EXPECT_TRUE(rewriter.is_identity());
    EXPECT_EQ(format_module_path(rewriter.relocate(P("module.networking.module.vpc"))),
              "module.networking.module.vpc");
}

TEST(AddressRewriterTest, RelocatingOutsideTargetIsRejected) {
    AddressRewriter rewriter(P("module.networking"), {});
    EXPECT_THROW(rewriter.relocate(P("module.database")), std::invalid_argument);
}

// ============================================================================
// Dependency repair
// ============================================================================

TEST(AddressRewriterTest, DependencyInsideSubtreeIsRewritten) {
    AddressRewriter rewriter(P("module.networking"), {});
    std::string dep = "module.networking.module.vpc.aws_vpc.main";
    EXPECT_TRUE(rewriter.rewrite_dependency(dep));
    EXPECT_EQ(dep, "module.vpc.aws_vpc.main");

    std::string data_dep = "module.networking.data.aws_availability_zones.all";
    EXPECT_TRUE(rewriter.rewrite_dependency(data_dep));
    EXPECT_EQ(data_dep, "data.aws_availability_zones.all");
}

TEST(AddressRewriterTest, DependencyOutsideSubtreeIsUntouched) {
    AddressRewriter rewriter(P("module.networking"), {});
    std::string dep = "module.database.aws_db_instance.main";
    EXPECT_FALSE(rewriter.rewrite_dependency(dep));
    EXPECT_EQ(dep, "module.database.aws_db_instance.main");
}

TEST(AddressRewriterTest, RewriteEntryRelocatesAndFlagsDanglingReferences) {
    Json root = Fixtures::state(1, "l", {
        Fixtures::resource("module.networking", "aws_subnet", "a",
                           {Fixtures::instance({{"id", "subnet-1"}}, Json(0),
                                               {"module.networking.aws_vpc.main",
                                                "aws_iam_role.ci",
                                                "not an address"})},
                           "managed", "list"),
    });
    StateDocument doc = StateCodec::decode(root.dump());

    AddressRewriter rewriter(P("module.networking"), {});
    std::vector<DanglingReference> dangling;
    ResourceEntry out = rewriter.rewrite(doc.resources[0], dangling);

    EXPECT_TRUE(out.module.empty());
    EXPECT_EQ(out.address(), "aws_subnet.a");
    ASSERT_TRUE(out.instances[0].dependencies.has_value());
    const auto& deps = *out.instances[0].dependencies;
    ASSERT_EQ(deps.size(), 3u);
    EXPECT_EQ(deps[0], "aws_vpc.main");
    EXPECT_EQ(deps[1], "aws_iam_role.ci");
    EXPECT_EQ(deps[2], "not an address");

    ASSERT_EQ(dangling.size(), 2u);
    EXPECT_EQ(dangling[0].instance_address, "aws_subnet.a[0]");
    EXPECT_EQ(dangling[0].dependency, "aws_iam_role.ci");
    EXPECT_EQ(dangling[1].dependency, "not an address");
}

TEST(AddressRewriterTest, RewriteLeavesSourceEntryIntact) {
    StateDocument doc = StateCodec::decode(Fixtures::monolith_state().dump());
    const ResourceEntry before = doc.resources[1];

    AddressRewriter rewriter(P("module.networking"), P("module.core"));
    std::vector<DanglingReference> dangling;
    ResourceEntry out = rewriter.rewrite(doc.resources[1], dangling);

    EXPECT_TRUE(doc.resources[1] == before);
    EXPECT_EQ(out.address(), "module.core.aws_subnet.a");
    EXPECT_EQ((*out.instances[0].dependencies)[0], "module.core.aws_vpc.main");
    EXPECT_TRUE(out.instances[0].attributes == before.instances[0].attributes);
    EXPECT_TRUE(dangling.empty());
}
