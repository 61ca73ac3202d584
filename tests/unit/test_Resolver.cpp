#include <gtest/gtest.h>
#include "policy/Resolver.hpp"
#include "catalog/Registry.hpp"

using namespace ss::policy;

class ResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<const ss::catalog::Registry> registry;
    std::unique_ptr<Resolver> resolver;

    void SetUp() override {
        registry = ss::catalog::Registry::loadFile(STITCHSYNC_TEST_CATALOG);
        resolver = std::make_unique<Resolver>(registry);
    }

    static Settings settings(std::optional<std::string> machine, std::optional<std::string> format) {
        return {"/tmp", std::move(machine), std::move(format)};
    }
};

TEST_F(ResolverTest, NothingGivenFallsBackToDst) {
    const auto p = resolver->resolve(settings(std::nullopt, std::nullopt));
    EXPECT_EQ(p.accepted, (std::vector<std::string>{"dst"}));
    EXPECT_EQ(p.preferred, "dst");
    EXPECT_FALSE(p.machine.has_value());
    EXPECT_TRUE(p.sanitizeNames());
    EXPECT_FALSE(p.destinationSubpath().has_value());
}

TEST_F(ResolverTest, FormatOnly) {
    const auto p = resolver->resolve(settings(std::nullopt, "PES"));
    EXPECT_EQ(p.accepted, (std::vector<std::string>{"pes"}));
    EXPECT_EQ(p.preferred, "pes");
}

TEST_F(ResolverTest, MachineOnlyUsesItsOrderedFormats) {
    const auto p = resolver->resolve(settings("Janome MC9900", std::nullopt));
    EXPECT_EQ(p.accepted, (std::vector<std::string>{"jef", "dst"}));
    EXPECT_EQ(p.preferred, "jef");
    ASSERT_TRUE(p.machine.has_value());
    EXPECT_EQ(p.destinationSubpath().value_or(""), "EMB/Embf");
}

TEST_F(ResolverTest, MachineAndFormatPrefersExplicitFormat) {
    const auto p = resolver->resolve(settings("Janome MC9900", "dst"));
    EXPECT_EQ(p.accepted, (std::vector<std::string>{"jef", "dst"}));
    EXPECT_EQ(p.preferred, "dst");
}

TEST_F(ResolverTest, ExplicitFormatOutsideMachineListStillPreferred) {
    const auto p = resolver->resolve(settings("Brother PE800", "exp"));
    EXPECT_EQ(p.accepted, (std::vector<std::string>{"pes", "dst"}));
    EXPECT_EQ(p.preferred, "exp");
    EXPECT_FALSE(p.accepts("exp"));
}

TEST_F(ResolverTest, MachineWithoutFormatsFallsBackToDst) {
    const auto bare = std::make_shared<const ss::catalog::Registry>(
        std::vector<ss::catalog::Format>{{"dst", "Tajima", "Tajima", std::nullopt}},
        std::vector<ss::catalog::MachineProfile>{{"Bare Machine", {}, {}}});
    const auto p = Resolver(bare).resolve(settings("bare machine", std::nullopt));
    EXPECT_EQ(p.accepted, (std::vector<std::string>{"dst"}));
    EXPECT_EQ(p.preferred, "dst");
}

TEST_F(ResolverTest, NoSanitizeMachine) {
    const auto p = resolver->resolve(settings("tajima sai", std::nullopt));
    EXPECT_FALSE(p.sanitizeNames());
}

TEST_F(ResolverTest, UnknownFormatThrows) {
    try {
        (void)resolver->resolve(settings(std::nullopt, "docx"));
        FAIL() << "expected UnknownFormatError";
    } catch (const UnknownFormatError& e) {
        EXPECT_EQ(e.requested(), "docx");
    }
}

TEST_F(ResolverTest, FuzzyMatchToleratesTypos) {
    const auto match = resolver->matchMachine("janome mc990");
    ASSERT_NE(match.profile, nullptr);
    EXPECT_EQ(match.profile->name, "Janome MC9900");
    EXPECT_GE(match.score, Resolver::MATCH_THRESHOLD);
    EXPECT_LT(match.score, 1.0);
}

TEST_F(ResolverTest, ExactMatchScoresOne) {
    const auto match = resolver->matchMachine("PE800");
    ASSERT_NE(match.profile, nullptr);
    EXPECT_EQ(match.profile->name, "Brother PE800");
    EXPECT_DOUBLE_EQ(match.score, 1.0);
}

TEST_F(ResolverTest, NearMissOffersSuggestions) {
    const auto match = resolver->matchMachine("Pfaff Icon");
    EXPECT_EQ(match.profile, nullptr);
    ASSERT_FALSE(match.suggestions.empty());
    EXPECT_LE(match.suggestions.size(), Resolver::MAX_SUGGESTIONS);
    EXPECT_EQ(match.suggestions.front(), "Pfaff Creative Icon");
}

TEST_F(ResolverTest, UnknownMachineErrorCarriesSuggestions) {
    try {
        (void)resolver->resolve(settings("Pfaff Icon", std::nullopt));
        FAIL() << "expected UnknownMachineError";
    } catch (const UnknownMachineError& e) {
        EXPECT_EQ(e.requested(), "Pfaff Icon");
        ASSERT_FALSE(e.suggestions().empty());
        EXPECT_NE(std::string(e.what()).find("Did you mean: Pfaff Creative Icon"), std::string::npos) << e.what();
    }
}

TEST_F(ResolverTest, GibberishHasNoSuggestions) {
    const auto match = resolver->matchMachine("zzqqxx");
    EXPECT_EQ(match.profile, nullptr);
    EXPECT_TRUE(match.suggestions.empty());
    EXPECT_STREQ(UnknownMachineError("zzqqxx", {}).what(), "Machine 'zzqqxx' not found");
}
