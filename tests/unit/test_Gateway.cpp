#include <gtest/gtest.h>
#include "convert/Gateway.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace ss::convert;
namespace config = ss::config;

class GatewayTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path extension_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("stitchsync_gateway_test_" + std::to_string(::getpid()));
        extension_dir = test_dir / "extensions" / "inkstitch";
        fs::create_directories(extension_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    // Stand-in for inkscape: argv is <input> --export-filename=<output>
    fs::path writeConverter(const std::string& name, const std::string& body) const {
        const auto script = test_dir / name;
        std::ofstream(script) << "#!/bin/sh\n"
                                 "in=\"$1\"\n"
                                 "out=\"${2#--export-filename=}\"\n"
                              << body << "\n";
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
        return script;
    }

    fs::path writeDesign(const std::string& name, const std::string& content = "stitches") const {
        const auto p = test_dir / name;
        std::ofstream(p) << content;
        return p;
    }

    Gateway gatewayFor(const fs::path& converter, config::ConverterConfig cfg = {}) const {
        return Gateway(ConverterInfo{converter, extension_dir}, cfg);
    }

    static std::string slurp(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }
};

TEST_F(GatewayTest, NotAvailableWithoutConverter) {
    const Gateway gw(ConverterInfo{std::nullopt, extension_dir}, {});
    EXPECT_FALSE(gw.available().usable());

    const auto res = gw.convert(writeDesign("rose.pes"), "jef");
    EXPECT_EQ(res.status, ConversionResult::Status::NotAvailable);
    EXPECT_FALSE(res.output.has_value());
}

TEST_F(GatewayTest, NotAvailableWithoutExtension) {
    const Gateway gw(ConverterInfo{writeConverter("inkscape", "cp \"$in\" \"$out\""), std::nullopt}, {});
    const auto a = gw.available();
    EXPECT_TRUE(a.has_converter);
    EXPECT_FALSE(a.has_extension);
    EXPECT_EQ(gw.convert(writeDesign("rose.pes"), "jef").status, ConversionResult::Status::NotAvailable);
}

TEST_F(GatewayTest, ConvertsNextToInput) {
    const auto gw = gatewayFor(writeConverter("inkscape", "cp \"$in\" \"$out\""));
    const auto input = writeDesign("rose.pes", "pes-bytes");

    const auto res = gw.convert(input, "jef");
    ASSERT_TRUE(res.converted()) << res.diagnostic;
    ASSERT_TRUE(res.output.has_value());
    EXPECT_EQ(*res.output, test_dir / "rose.jef");
    EXPECT_EQ(slurp(*res.output), "pes-bytes");
}

TEST_F(GatewayTest, ReplacesStaleOutput) {
    const auto gw = gatewayFor(writeConverter("inkscape", "[ -e \"$out\" ] && exit 9\ncp \"$in\" \"$out\""));
    const auto input = writeDesign("rose.pes", "fresh");
    writeDesign("rose.jef", "stale");

    const auto res = gw.convert(input, "jef");
    ASSERT_TRUE(res.converted()) << res.diagnostic;
    EXPECT_EQ(slurp(*res.output), "fresh");
}

TEST_F(GatewayTest, SameFormatIsNotSpawned) {
    const auto gw = gatewayFor(test_dir / "never-run");
    const auto input = writeDesign("rose.dst");

    const auto res = gw.convert(input, "dst");
    ASSERT_TRUE(res.converted());
    EXPECT_EQ(*res.output, input);
}

TEST_F(GatewayTest, UnsupportedPairFailsWithoutSpawning) {
    const auto gw = gatewayFor(test_dir / "never-run");

    const auto unreadable = gw.convert(writeDesign("logo.art"), "dst");
    EXPECT_EQ(unreadable.status, ConversionResult::Status::Failed);
    EXPECT_NE(unreadable.diagnostic.find(".art"), std::string::npos);

    const auto unwritable = gw.convert(writeDesign("logo.pes"), "hus");
    EXPECT_EQ(unwritable.status, ConversionResult::Status::Failed);
    EXPECT_NE(unwritable.diagnostic.find(".hus"), std::string::npos);
}

TEST_F(GatewayTest, NonZeroExitReportsStderrTail) {
    const auto gw = gatewayFor(writeConverter("inkscape", "echo 'boom: bad stitch block' >&2\nexit 4"));
    const auto res = gw.convert(writeDesign("rose.pes"), "jef");
    EXPECT_EQ(res.status, ConversionResult::Status::Failed);
    EXPECT_NE(res.diagnostic.find("code 4"), std::string::npos) << res.diagnostic;
    EXPECT_NE(res.diagnostic.find("boom: bad stitch block"), std::string::npos) << res.diagnostic;
}

TEST_F(GatewayTest, MissingExtensionPointsAtInstallDocs) {
    const auto gw = gatewayFor(writeConverter("inkscape", "echo 'unknown extension: org.inkstitch.output' >&2\nexit 1"));
    const auto res = gw.convert(writeDesign("rose.pes"), "jef");
    EXPECT_EQ(res.status, ConversionResult::Status::Failed);
    EXPECT_NE(res.diagnostic.find("inkstitch.org"), std::string::npos) << res.diagnostic;
}

TEST_F(GatewayTest, SuccessWithoutOutputIsFailure) {
    const auto gw = gatewayFor(writeConverter("inkscape", "exit 0"));
    const auto res = gw.convert(writeDesign("rose.pes"), "jef");
    EXPECT_EQ(res.status, ConversionResult::Status::Failed);
    EXPECT_FALSE(fs::exists(test_dir / "rose.jef"));
}

TEST_F(GatewayTest, TimeoutIsFailure) {
    config::ConverterConfig cfg;
    cfg.timeout = std::chrono::seconds(1);
    cfg.shutdown_grace = std::chrono::seconds(1);
    const auto gw = gatewayFor(writeConverter("inkscape", "sleep 30"), cfg);

    const auto res = gw.convert(writeDesign("rose.pes"), "jef");
    EXPECT_EQ(res.status, ConversionResult::Status::Failed);
    EXPECT_NE(res.diagnostic.find("timed out"), std::string::npos) << res.diagnostic;
}

TEST_F(GatewayTest, RaisedCancelFlagSkipsConversion) {
    const auto gw = gatewayFor(writeConverter("inkscape", "cp \"$in\" \"$out\""));
    const auto cancel = std::make_shared<std::atomic<bool>>(true);

    const auto res = gw.convert(writeDesign("rose.pes"), "jef", cancel);
    EXPECT_EQ(res.status, ConversionResult::Status::Failed);
    EXPECT_EQ(res.diagnostic, "cancelled");
    EXPECT_FALSE(fs::exists(test_dir / "rose.jef"));
}

TEST_F(GatewayTest, ConfiguredPathWinsDiscovery) {
    config::ConverterConfig cfg;
    cfg.path = writeConverter("my-inkscape", "exit 0");
    const auto info = Gateway::discover(cfg);
    ASSERT_TRUE(info.executable.has_value());
    EXPECT_EQ(*info.executable, *cfg.path);
}

TEST_F(GatewayTest, ConversionTargetAndCapabilities) {
    EXPECT_EQ(Gateway::conversionTarget("jef+"), "jef");
    EXPECT_EQ(Gateway::conversionTarget("pes"), "pes");

    EXPECT_TRUE(Gateway::canRead("pes"));
    EXPECT_TRUE(Gateway::canWrite("dst"));
    EXPECT_FALSE(Gateway::canWrite("hus"));
    EXPECT_FALSE(Gateway::canRead("art"));
}
