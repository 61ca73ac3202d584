#include "util/Subprocess.hpp"
#include "util/commandLine.hpp"

#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <thread>
#include <windows.h>
#include <fmt/core.h>

using namespace ss::util;
using namespace std::chrono;

namespace {

constexpr int EXEC_FAILED = 127;
constexpr DWORD WAIT_SLICE_MS = 50;

std::wstring widen(const std::string& s) {
    if (s.empty()) return {};
    const int n = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<size_t>(n), L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
    return out;
}

std::string errorMessage(const DWORD code) {
    LPSTR buf = nullptr;
    const DWORD len = ::FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                                       nullptr, code, 0, reinterpret_cast<LPSTR>(&buf), 0, nullptr);
    std::string msg = len > 0 ? std::string(buf, len) : fmt::format("error {}", code);
    if (buf) ::LocalFree(buf);
    while (!msg.empty() && (msg.back() == '\r' || msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
    return msg;
}

struct Handle {
    HANDLE h = nullptr;

    Handle() = default;
    explicit Handle(const HANDLE handle) : h(handle) {}
    ~Handle() { reset(); }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    [[nodiscard]] bool valid() const { return h && h != INVALID_HANDLE_VALUE; }
    void reset() {
        if (valid()) ::CloseHandle(h);
        h = nullptr;
    }
};

void drain(const HANDLE pipe, std::string& into) {
    char buf[4096];
    DWORD n = 0;
    while (::ReadFile(pipe, buf, sizeof(buf), &n, nullptr) && n > 0) into.append(buf, n);
}

// Ctrl-Break is the console's polite stop; the job object takes down the whole tree after the grace period.
void terminate(const PROCESS_INFORMATION& pi, const HANDLE job, const milliseconds grace) {
    ::GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, pi.dwProcessId);
    if (::WaitForSingleObject(pi.hProcess, static_cast<DWORD>(grace.count())) == WAIT_OBJECT_0) return;

    if (job) ::TerminateJobObject(job, 1);
    else ::TerminateProcess(pi.hProcess, 1);
    ::WaitForSingleObject(pi.hProcess, INFINITE);
}

}

ProcessResult Subprocess::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;

    if (argv.empty()) {
        result.spawn_error = "empty command line";
        return result;
    }

    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    Handle outRead, outWrite, errRead, errWrite;
    if (!::CreatePipe(&outRead.h, &outWrite.h, &sa, 0) || !::CreatePipe(&errRead.h, &errWrite.h, &sa, 0)) {
        result.spawn_error = fmt::format("CreatePipe failed: {}", errorMessage(::GetLastError()));
        return result;
    }
    // Only the write ends belong to the child
    ::SetHandleInformation(outRead.h, HANDLE_FLAG_INHERIT, 0);
    ::SetHandleInformation(errRead.h, HANDLE_FLAG_INHERIT, 0);

    Handle nul(::CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, nullptr));

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nul.valid() ? nul.h : nullptr;
    si.hStdOutput = outWrite.h;
    si.hStdError = errWrite.h;

    auto cmdline = widen(buildWindowsCommandLine(argv));
    PROCESS_INFORMATION pi{};
    if (!::CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, TRUE,
                          CREATE_NEW_PROCESS_GROUP | CREATE_SUSPENDED, nullptr, nullptr, &si, &pi)) {
        result.spawn_error = fmt::format("failed to execute '{}': {}", argv.front(), errorMessage(::GetLastError()));
        result.exit_code = EXEC_FAILED;
        return result;
    }
    Handle process(pi.hProcess), mainThread(pi.hThread);

    // Assigned before the first instruction runs, so anything inkscape spawns lands in the job too
    Handle job(::CreateJobObjectW(nullptr, nullptr));
    if (job.valid() && !::AssignProcessToJobObject(job.h, pi.hProcess)) job.reset();
    ::ResumeThread(pi.hThread);

    outWrite.reset();
    errWrite.reset();
    nul.reset();

    std::thread outReader([&] { drain(outRead.h, result.stdout_text); });
    std::thread errReader([&] { drain(errRead.h, result.stderr_text); });

    const auto start = steady_clock::now();
    while (::WaitForSingleObject(pi.hProcess, WAIT_SLICE_MS) == WAIT_TIMEOUT) {
        if (options.cancel && options.cancel->load()) {
            result.cancelled = true;
            terminate(pi, job.h, options.grace);
            break;
        }

        if (options.timeout && steady_clock::now() - start >= *options.timeout) {
            result.timed_out = true;
            terminate(pi, job.h, options.grace);
            break;
        }
    }

    // Leftover helpers would hold the pipes open and block the readers
    if (job.valid()) ::TerminateJobObject(job.h, 0);
    outReader.join();
    errReader.join();

    DWORD code = 0;
    if (::GetExitCodeProcess(pi.hProcess, &code)) result.exit_code = static_cast<int>(code);
    return result;
}

std::optional<std::string> Subprocess::which(const std::string& name) {
    namespace fs = std::filesystem;

    std::vector<std::string> extensions{""};
    if (fs::path(name).extension().empty()) {
        extensions.clear();
        const char* pathext = std::getenv("PATHEXT");
        std::string_view rest(pathext ? pathext : ".COM;.EXE;.BAT;.CMD");
        while (!rest.empty()) {
            const auto semi = rest.find(';');
            if (const auto ext = rest.substr(0, semi); !ext.empty()) extensions.emplace_back(ext);
            if (semi == std::string_view::npos) break;
            rest.remove_prefix(semi + 1);
        }
    }

    const auto tryDir = [&](const fs::path& base) -> std::optional<std::string> {
        for (const auto& ext : extensions) {
            auto candidate = base;
            candidate += ext;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) return candidate.string();
        }
        return std::nullopt;
    };

    if (name.find_first_of("/\\") != std::string::npos) return tryDir(name);

    const char* path = std::getenv("PATH");
    if (!path) return std::nullopt;

    std::string_view rest(path);
    while (!rest.empty()) {
        const auto semi = rest.find(';');
        if (const auto dir = rest.substr(0, semi); !dir.empty())
            if (auto found = tryDir(fs::path(dir) / name)) return found;
        if (semi == std::string_view::npos) break;
        rest.remove_prefix(semi + 1);
    }
    return std::nullopt;
}
