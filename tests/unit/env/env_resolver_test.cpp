#include <gtest/gtest.h>
#include <upsync/env/env_resolver.h>

#include <algorithm>
#include <string>
#include <vector>

#include "../../common/test_helpers.h"

using namespace upsync;
using namespace upsync::env;

namespace {

EnvironmentSource makeSource(EnvMap vars, std::optional<std::string> home = std::nullopt) {
    EnvironmentSource source;
    source.variables = std::move(vars);
    source.homeDir = std::move(home);
    return source;
}

std::vector<std::string> sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
}

} // namespace

TEST(EnvResolverTest, ChainResolvesInAnyOrder) {
    const EnvMap expected{{"A", "1"}, {"B", "1"}, {"C", "1"}};

    std::vector<RawEnv> orders = {
        {{"A", "1"}, {"B", "$A"}, {"C", "$B"}},
        {{"C", "$B"}, {"B", "$A"}, {"A", "1"}},
        {{"B", "$A"}, {"C", "$B"}, {"A", "1"}},
    };
    for (const auto& raw : orders) {
        EnvResolver resolver(makeSource({}));
        auto r = resolver.resolve({}, raw);
        ASSERT_TRUE(r) << r.error().message;
        EXPECT_EQ(r.value(), expected);
    }
}

TEST(EnvResolverTest, MutualCycleIsReported) {
    EnvResolver resolver(makeSource({}));
    auto r = resolver.resolve({}, {{"A", "$B"}, {"B", "$A"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::UnresolvedCycle);
    EXPECT_EQ(sorted(r.error().keys), (std::vector<std::string>{"A", "B"}));
}

TEST(EnvResolverTest, SelfReferenceWithoutInheritedValueIsACycle) {
    EnvResolver resolver(makeSource({}));
    auto r = resolver.resolve({}, {{"A", "x$A"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::UnresolvedCycle);
    EXPECT_EQ(r.error().keys, (std::vector<std::string>{"A"}));
}

TEST(EnvResolverTest, CycleOnlyListsStuckKeys) {
    EnvResolver resolver(makeSource({}));
    auto r = resolver.resolve({}, {{"OK", "fine"}, {"D", "$OK"}, {"X", "$Y"}, {"Y", "$X"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(sorted(r.error().keys), (std::vector<std::string>{"X", "Y"}));
}

TEST(EnvResolverTest, MissingVariableFailsWithEnvLookup) {
    EnvResolver resolver(makeSource({}));
    auto r = resolver.resolve({}, {{"A", "$NOPE"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::EnvLookup);
    EXPECT_EQ(r.error().variable, "NOPE");
}

TEST(EnvResolverTest, OnlyInheritedNamesAreVisible) {
    // USER is in the process snapshot but not asked for
    EnvResolver resolver(makeSource({{"USER", "me"}, {"SHELL", "/bin/zsh"}}));
    auto r = resolver.resolve({"SHELL"}, {{"A", "$USER"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().variable, "USER");
}

TEST(EnvResolverTest, InheritedValuesAreIncludedAndAbsentOnesSkipped) {
    EnvResolver resolver(makeSource({{"SHELL", "/bin/zsh"}}));
    auto r = resolver.resolve({"SHELL", "NOT_SET_ANYWHERE"}, {{"MY_SHELL", "$SHELL"}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().at("SHELL"), "/bin/zsh");
    EXPECT_EQ(r.value().at("MY_SHELL"), "/bin/zsh");
    EXPECT_EQ(r.value().count("NOT_SET_ANYWHERE"), 0u);
}

TEST(EnvResolverTest, ConfigKeyExtendsInheritedValueOfSameName) {
    EnvResolver resolver(makeSource({{"PATH", "/usr/bin"}}));
    auto r = resolver.resolve({"PATH"}, {{"PATH", "$HOME_BIN:$PATH"}, {"HOME_BIN", "/opt/bin"}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().at("PATH"), "/opt/bin:/usr/bin");
}

TEST(EnvResolverTest, HomeShorthandIsExpanded) {
    EnvResolver resolver(makeSource({}, "/home/me"));
    auto r = resolver.resolve({}, {{"DOTFILES", "~/code/dotfiles"}, {"LINKS", "$DOTFILES/links"}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().at("DOTFILES"), "/home/me/code/dotfiles");
    EXPECT_EQ(r.value().at("LINKS"), "/home/me/code/dotfiles/links");
}

TEST(EnvResolverTest, DiamondDependencyResolves) {
    EnvResolver resolver(makeSource({}));
    auto r = resolver.resolve({}, {{"TOP", "$LEFT+$RIGHT"},
                                   {"LEFT", "l$BASE"},
                                   {"RIGHT", "r$BASE"},
                                   {"BASE", "0"}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().at("TOP"), "l0+r0");
}

TEST(EnvResolverTest, DollarInResolvedValueIsNotReexpanded) {
    EnvResolver resolver(makeSource({}));
    auto r = resolver.resolve({}, {{"PRICE", "$$5"}, {"LABEL", "cost $PRICE"}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().at("PRICE"), "$5");
    EXPECT_EQ(r.value().at("LABEL"), "cost $5");
}

TEST(EnvResolverTest, DuplicateKeysAreRejected) {
    EnvResolver resolver(makeSource({}));
    auto r = resolver.resolve({}, {{"A", "1"}, {"A", "2"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(EnvResolverTest, FromProcessSnapshotsRequestedNames) {
    upsync::test::ScopedEnvVar set("UPSYNC_TEST_INHERITED", std::string("value"));
    upsync::test::ScopedEnvVar unset("UPSYNC_TEST_ABSENT", std::nullopt);
    upsync::test::ScopedEnvVar home("HOME", std::string("/tmp/upsync-home"));

    auto source = EnvironmentSource::fromProcess({"UPSYNC_TEST_INHERITED", "UPSYNC_TEST_ABSENT"});
    EXPECT_EQ(source.variables.size(), 1u);
    EXPECT_EQ(source.variables.at("UPSYNC_TEST_INHERITED"), "value");
    ASSERT_TRUE(source.homeDir.has_value());
    EXPECT_EQ(*source.homeDir, "/tmp/upsync-home");
}
