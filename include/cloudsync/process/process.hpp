#pragma once

/**
 * @file process.hpp
 * @brief Contract between the engine and the external transfer tool
 *
 * The engine never builds a shell command line. A request is a program
 * name plus an argument vector; output arrives as raw chunks while the
 * process runs, and a single completion reports how it ended.
 *
 * COMPLETION OUTCOMES:
 * - Ok(ProcessResult)      exit code is in allowed_exit_codes
 * - Err(ProcessFailed)     any other exit code or a fatal signal
 * - Err(SpawnFailed)       the program could not be started
 * - Err(Timeout)           request.timeout elapsed; the process was killed
 * - Err(Cancelled)         terminate()/kill() was requested on the handle
 */

#include "cloudsync/core/result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cloudsync::process {

struct ProcessRequest {
    std::string program;
    std::vector<std::string> args;
    std::set<int> allowed_exit_codes{0};
    std::optional<std::chrono::milliseconds> timeout;
};

struct ProcessResult {
    int exit_code = 0;
    std::string stdout_text;   ///< Truncated to kMaxCapturedOutput
    std::string stderr_text;   ///< Truncated to kMaxCapturedOutput
};

constexpr std::size_t kMaxCapturedOutput = 100000;

/**
 * @brief Live handle on a spawned process
 */
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int pid() const noexcept = 0;

    /// Graceful stop (SIGTERM). The completion reports Cancelled.
    virtual void terminate() = 0;

    /// Forced stop (SIGKILL). The completion reports Cancelled.
    virtual void kill() = 0;

    virtual bool terminate_requested() const noexcept = 0;
};

struct ProcessCallbacks {
    /// Invoked once, before any output callback
    std::function<void(std::shared_ptr<ProcessHandle>)> on_spawn;
    std::function<void(std::string_view)> on_stdout;
    std::function<void(std::string_view)> on_stderr;
};

using CompletionHandler = std::function<void(Result<ProcessResult>)>;

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /**
     * @brief Start @p request; @p on_complete is invoked exactly once
     */
    virtual void launch(ProcessRequest request,
                        ProcessCallbacks callbacks,
                        CompletionHandler on_complete) = 0;
};

/**
 * @brief "<program> exited with code N: <stderr|stdout|...>"
 */
std::string describe_exit(const std::string& program, int exit_code,
                          const std::string& stdout_text, const std::string& stderr_text);

} // namespace cloudsync::process
