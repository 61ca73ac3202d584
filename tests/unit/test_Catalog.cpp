#include <gtest/gtest.h>
#include "catalog/Registry.hpp"

#include <algorithm>

using namespace ss::catalog;

class CatalogTest : public ::testing::Test {
protected:
    std::shared_ptr<const Registry> registry;

    void SetUp() override {
        registry = Registry::loadFile(STITCHSYNC_TEST_CATALOG);
    }
};

TEST_F(CatalogTest, ShippedCatalogLoads) {
    EXPECT_GE(registry->formats().size(), 20u);
    EXPECT_GE(registry->machines().size(), 15u);
    EXPECT_TRUE(registry->hasFormat(DEFAULT_FORMAT));
}

TEST_F(CatalogTest, FormatLookupIgnoresCaseAndDot) {
    ASSERT_NE(registry->findFormat("PES"), nullptr);
    ASSERT_NE(registry->findFormat(".jef"), nullptr);
    EXPECT_EQ(registry->findFormat(" Dst ")->code, "dst");
    EXPECT_EQ(registry->findFormat("svg"), nullptr);
}

TEST_F(CatalogTest, MachineLookupBySynonym) {
    const auto* m = registry->findMachine("memory craft 9900");
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->name, "Janome MC9900");
    ASSERT_TRUE(m->destination_subpath.has_value());
    EXPECT_EQ(*m->destination_subpath, "EMB/Embf");
    EXPECT_EQ(m->formats, (std::vector<std::string>{"jef", "dst"}));
}

TEST_F(CatalogTest, MachineLookupIgnoresPunctuation) {
    EXPECT_NE(registry->findMachine("brother-pe800"), nullptr);
    EXPECT_NE(registry->findMachine("BROTHER PE 800"), nullptr);
    EXPECT_EQ(registry->findMachine("brother pe"), nullptr);
}

TEST_F(CatalogTest, SanitizeFlagDefaultsOn) {
    EXPECT_TRUE(registry->findMachine("Brother PE800")->sanitize_names);
    EXPECT_FALSE(registry->findMachine("Tajima SAI")->sanitize_names);
}

TEST_F(CatalogTest, MachinesSupportingFormat) {
    const auto jefMachines = registry->machinesSupporting("JEF");
    ASSERT_FALSE(jefMachines.empty());
    EXPECT_TRUE(std::ranges::all_of(jefMachines, [](const auto* m) { return m->supports("jef"); }));

    EXPECT_TRUE(registry->machinesSupporting("zsk").empty());
}

TEST_F(CatalogTest, EveryMachineFormatIsCatalogued) {
    for (const auto& m : registry->machines()) {
        EXPECT_FALSE(m.formats.empty()) << m.name;
        for (const auto& code : m.formats) EXPECT_TRUE(registry->hasFormat(code)) << m.name << ": " << code;
    }
}

TEST_F(CatalogTest, ParseRejectsUnknownFormatReference) {
    const std::string yaml = R"(
formats:
  - { code: dst, label: Tajima }
machines:
  - name: Test Machine
    formats: [pes]
)";
    EXPECT_THROW(Registry::parse(yaml), std::runtime_error);
}

TEST_F(CatalogTest, ParseRejectsCollidingNames) {
    const std::string yaml = R"(
formats:
  - { code: dst, label: Tajima }
machines:
  - name: Alpha 100
    formats: [dst]
  - name: Beta
    synonyms: [alpha-100]
    formats: [dst]
)";
    EXPECT_THROW(Registry::parse(yaml), std::runtime_error);
}

TEST_F(CatalogTest, ParseReadsOptionalFields) {
    const auto r = Registry::parse(R"(
formats:
  - { code: DST, label: Tajima, manufacturer: Tajima, note: Universal }
machines:
  - name: Shop Machine
    formats: [dst]
    usb_path: designs
    sanitize_names: false
    design_size: 200x200mm
)");
    ASSERT_EQ(r->formats().size(), 1u);
    EXPECT_EQ(r->formats().front().code, "dst");
    EXPECT_EQ(r->formats().front().note.value_or(""), "Universal");

    const auto* m = r->findMachine("shop machine");
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->destination_subpath.value_or(""), "designs");
    EXPECT_FALSE(m->sanitize_names);
    EXPECT_EQ(m->design_size.value_or(""), "200x200mm");
    EXPECT_FALSE(m->notes.has_value());
}

TEST_F(CatalogTest, MissingFileThrows) {
    EXPECT_THROW(Registry::loadFile("/nonexistent/stitch-sync/catalog.yaml"), std::runtime_error);
}

TEST_F(CatalogTest, FormatToStringIncludesManufacturer) {
    const auto s = to_string(*registry->findFormat("pes"));
    EXPECT_EQ(s.rfind("pes: Brother", 0), 0u) << s;
}
