#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ss::pipeline {

struct CopyOutcome {
    enum class Kind { Ignored, CopiedLocal, CopiedRemote, Failed };

    Kind kind = Kind::Ignored;
    std::filesystem::path source;
    std::filesystem::path output;                      // file that was (or would be) copied
    std::optional<std::filesystem::path> destination;  // set for CopiedRemote
    std::string reason;
    bool converted = false;
};

std::string to_string(CopyOutcome::Kind kind);

}
