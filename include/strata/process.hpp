#pragma once

#include <strata/result.hpp>
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

// Cooperative cancellation flag shared between a caller and a running plan
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

// Result of running an external command
struct CommandResult {
    int exit_code = 0;
    std::string stdout_str;
    std::string stderr_str;
};

struct CommandOptions {
    std::string working_dir;
    int timeout_seconds = 0;                 // 0 = no limit
    const CancelToken* cancel = nullptr;
    std::filesystem::path log_file;          // appended with both streams when set
};

// Run an external command, capturing stdout and stderr.
// Fails on fork/exec failure, timeout (IO) or cancellation (Cancelled).
// A non-zero exit is not an error; inspect exit_code.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& opts = {});

} // namespace strata
