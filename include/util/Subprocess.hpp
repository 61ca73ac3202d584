#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ss::util {

struct ProcessOptions {
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds grace{std::chrono::seconds(5)};   // SIGTERM (Ctrl-Break on Windows) -> kill
    std::shared_ptr<std::atomic<bool>> cancel;
};

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool cancelled = false;
    std::optional<std::string> spawn_error;

    [[nodiscard]] bool ok() const { return exit_code == 0 && !timed_out && !cancelled && !spawn_error; }
};

class Subprocess {
public:
    // argv[0] is resolved through PATH. Never throws for child-side failures;
    // they are reported through ProcessResult.
    static ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options = {});

    // Absolute path to an executable named `name` on PATH, if any.
    static std::optional<std::string> which(const std::string& name);
};

}
