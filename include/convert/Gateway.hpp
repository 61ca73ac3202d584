#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ss::convert {

struct Availability {
    bool has_converter = false;
    bool has_extension = false;

    [[nodiscard]] bool usable() const { return has_converter && has_extension; }
};

struct ConverterInfo {
    std::optional<std::filesystem::path> executable;       // inkscape
    std::optional<std::filesystem::path> extension_dir;    // ink/stitch
};

struct ConversionResult {
    enum class Status { Converted, NotAvailable, Failed };

    Status status = Status::Failed;
    std::optional<std::filesystem::path> output;
    std::string diagnostic;

    [[nodiscard]] bool converted() const { return status == Status::Converted; }
};

std::string to_string(ConversionResult::Status status);

class Gateway {
public:
    static constexpr size_t DIAGNOSTIC_TAIL = 200;

    Gateway(ConverterInfo info, config::ConverterConfig config);

    // Locates the converter and its extension once; the result is kept for the session.
    static std::shared_ptr<Gateway> probe(const config::ConverterConfig& config);
    static ConverterInfo discover(const config::ConverterConfig& config);

    [[nodiscard]] Availability available() const;
    [[nodiscard]] const ConverterInfo& info() const { return info_; }

    // Writes <input dir>/<input stem>.<target>, replacing any earlier output.
    ConversionResult convert(const std::filesystem::path& input,
                             const std::string& target,
                             const std::shared_ptr<std::atomic<bool>>& cancel = nullptr) const;

    // Code handed to the converter for a preferred output format.
    static std::string conversionTarget(const std::string& preferred);

    static bool canRead(const std::string& code);
    static bool canWrite(const std::string& code);

    static const std::vector<std::string>& readableFormats();
    static const std::vector<std::string>& writableFormats();

    static std::vector<std::filesystem::path> converterSearchPaths();
    static std::vector<std::filesystem::path> extensionSearchPaths(const std::optional<std::filesystem::path>& executable);

private:
    ConverterInfo info_;
    config::ConverterConfig config_;
};

}
