#pragma once

#include <folio/result.hpp>
#include <functional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace folio {

// Result of running an external command
struct CommandResult {
    int exit_code = 0;          // 127 when the binary could not be executed
    bool signaled = false;      // terminated by a signal (exit_code = 128 + signo)
    bool timed_out = false;     // only set when CommandOptions::timeout_is_error is false
    std::string stdout_str;
    std::string stderr_str;
};

struct CommandOptions {
    std::string working_dir;
    int timeout_seconds = 60;
    // When false, a timeout kills the group and returns a result with
    // timed_out set instead of an ExternalTool error
    bool timeout_is_error = true;
    // Called in the parent right after fork() with the child's pid, which is
    // also its process group id. Lets callers terminate the whole group later.
    std::function<void(pid_t)> on_spawn;
};

// Run an external command in its own process group, capturing stdout and
// stderr. stdin is /dev/null. Returns error on pipe/fork failure or timeout;
// on timeout the entire process group is killed.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options);

// SIGTERM the process group, wait up to grace_ms, then SIGKILL.
// Returns false if the group no longer exists.
bool terminate_process_group(pid_t pgid, int grace_ms = 2000);

} // namespace folio
