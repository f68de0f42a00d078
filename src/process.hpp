#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ProcessOptions {
    // Uncaptured streams are inherited from the calling process.
    bool capture_stdout = true;
    bool capture_stderr = true;
    std::optional<std::filesystem::path> cwd;
    std::optional<std::chrono::milliseconds> timeout;
};

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool timed_out = false;

    bool ok() const { return exit_code == 0 && !timed_out; }
};

// Runs external programs. Backends only talk to the system through this
// interface so tests can script the output of pacman, makepkg and friends.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] (looked up in PATH) with the remaining arguments. Throws
    // BorealisException when the process cannot be started at all.
    virtual ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options = {}) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options = {}) override;
};

// Prefixes `argv` so that it runs as root: unchanged when already root,
// through sudo when available, through `su -c` otherwise.
std::vector<std::string> elevate(const std::vector<std::string>& argv);

std::optional<std::filesystem::path> find_executable(std::string_view name);
std::string shell_quote(std::string_view arg);
