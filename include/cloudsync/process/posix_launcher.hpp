#pragma once

#include "cloudsync/process/process.hpp"

#include <boost/asio/io_context.hpp>
#include <spdlog/logger.h>

#include <memory>

namespace cloudsync::process {

namespace asio = boost::asio;

/**
 * @brief fork/execvp launcher streaming output through Boost.Asio
 *
 * Lifecycle of one launch:
 * 1. Pipes for stdout/stderr (and a close-on-exec status pipe) are created
 * 2. fork(); the child redirects stdin from /dev/null and execvp()s
 * 3. The parent learns about exec failure through the status pipe
 * 4. on_spawn fires, then both pipes are read asynchronously
 * 5. After both pipes reach EOF the child is reaped with WNOHANG polling
 * 6. The completion handler runs on the io_context
 *
 * Handlers of one process are serialised on a strand, so output chunks
 * and the completion for a given process never run concurrently.
 */
class PosixProcessLauncher : public ProcessLauncher {
public:
    explicit PosixProcessLauncher(asio::io_context& io_context,
                                  std::shared_ptr<spdlog::logger> logger = nullptr);

    void launch(ProcessRequest request,
                ProcessCallbacks callbacks,
                CompletionHandler on_complete) override;

private:
    asio::io_context& io_context_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cloudsync::process
