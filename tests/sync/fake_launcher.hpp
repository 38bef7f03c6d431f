#pragma once

#include "cloudsync/process/process.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace cloudsync::test {

/**
 * @brief Scripted launcher for orchestrator tests
 *
 * Probes (lsd), mkdir, listremotes and about complete inline from the
 * scripted state. sync and check are held until the test finishes them.
 * terminate()/kill() on a held process completes it inline as Cancelled.
 */
class FakeLauncher : public process::ProcessLauncher {
public:
    struct Launch;

    class Handle : public process::ProcessHandle {
    public:
        Handle(int pid, FakeLauncher& owner, std::weak_ptr<Launch> launch)
            : pid_(pid), owner_(owner), launch_(std::move(launch)) {}

        int pid() const noexcept override { return pid_; }
        void terminate() override { stop(); }
        void kill() override { stop(); }
        bool terminate_requested() const noexcept override { return requested_; }

    private:
        void stop() {
            requested_ = true;
            if (auto launch = launch_.lock()) {
                owner_.complete(launch, Err<process::ProcessResult>(ErrorCode::Cancelled, launch->request.program + " was terminated"));
            }
        }

        int pid_;
        FakeLauncher& owner_;
        std::weak_ptr<Launch> launch_;
        bool requested_ = false;
    };

    struct Launch {
        process::ProcessRequest request;
        process::ProcessCallbacks callbacks;
        process::CompletionHandler on_complete;
        std::shared_ptr<Handle> handle;
        bool completed = false;

        const std::string& verb() const {
            static const std::string empty;
            return request.args.empty() ? empty : request.args.front();
        }
    };

    void launch(process::ProcessRequest request,
                process::ProcessCallbacks callbacks,
                process::CompletionHandler on_complete) override {
        auto launch = std::make_shared<Launch>();
        launch->request = std::move(request);
        launch->callbacks = std::move(callbacks);
        launch->on_complete = std::move(on_complete);
        {
            std::lock_guard lock(mutex_);
            launches_.push_back(launch);
        }

        const auto& verb = launch->verb();
        if (verb == "lsd") {
            std::string remote = launch->request.args.size() > 1 ? launch->request.args[1] : "";
            if (!remote.empty() && remote.back() == ':') {
                remote.pop_back();
            }
            if (reachable.count(remote) != 0) {
                finish(launch, 0);
            } else {
                finish(launch, 3, "directory not found");
            }
            return;
        }
        if (verb == "mkdir") {
            finish(launch, 0);
            return;
        }
        if (verb == "listremotes") {
            if (launch->request.args.size() > 1 && fail_long_listing) {
                finish(launch, 1, "unknown flag: --long");
            } else {
                finish(launch, 0, "", remotes_output);
            }
            return;
        }
        if (verb == "about") {
            finish(launch, 0, "", about_output);
            return;
        }

        launch->handle = std::make_shared<Handle>(next_pid_++, *this, launch);
        if (launch->callbacks.on_spawn) {
            launch->callbacks.on_spawn(launch->handle);
        }
    }

    /// Most recent still-running launch of @p verb, or null
    std::shared_ptr<Launch> pending(const std::string& verb) const {
        std::lock_guard lock(mutex_);
        for (auto it = launches_.rbegin(); it != launches_.rend(); ++it) {
            if ((*it)->verb() == verb && !(*it)->completed) {
                return *it;
            }
        }
        return nullptr;
    }

    std::size_t count(const std::string& verb) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& launch : launches_) {
            if (launch->verb() == verb) {
                ++n;
            }
        }
        return n;
    }

    std::shared_ptr<Launch> last(const std::string& verb) const {
        std::lock_guard lock(mutex_);
        for (auto it = launches_.rbegin(); it != launches_.rend(); ++it) {
            if ((*it)->verb() == verb) {
                return *it;
            }
        }
        return nullptr;
    }

    void emit_stderr(const std::shared_ptr<Launch>& launch, const std::string& text) {
        if (launch->callbacks.on_stderr) {
            launch->callbacks.on_stderr(text);
        }
    }

    void finish(const std::shared_ptr<Launch>& launch, int exit_code,
                const std::string& stderr_text = "", const std::string& stdout_text = "") {
        if (launch->request.allowed_exit_codes.count(exit_code) == 0) {
            complete(launch, Err<process::ProcessResult>(ErrorCode::ProcessFailed,
                process::describe_exit(launch->request.program, exit_code, stdout_text, stderr_text)));
            return;
        }
        process::ProcessResult result;
        result.exit_code = exit_code;
        result.stdout_text = stdout_text;
        result.stderr_text = stderr_text;
        complete(launch, Ok(std::move(result)));
    }

    void complete(const std::shared_ptr<Launch>& launch, Result<process::ProcessResult> outcome) {
        if (launch->completed) {
            return;
        }
        launch->completed = true;
        auto handler = std::move(launch->on_complete);
        if (handler) {
            handler(std::move(outcome));
        }
    }

    std::set<std::string> reachable;
    std::string remotes_output;
    std::string about_output;
    bool fail_long_listing = false;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Launch>> launches_;
    int next_pid_ = 1000;
};

} // namespace cloudsync::test
