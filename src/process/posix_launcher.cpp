#include "cloudsync/process/posix_launcher.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cloudsync::process {

std::string describe_exit(const std::string& program, int exit_code,
                          const std::string& stdout_text, const std::string& stderr_text) {
    std::string detail = !stderr_text.empty() ? stderr_text
                       : !stdout_text.empty() ? stdout_text
                       : "no output";
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    return program + " exited with code " + std::to_string(exit_code) + ": " + detail;
}

namespace {

constexpr std::size_t kReadBufferSize = 8192;
constexpr std::chrono::milliseconds kReapPollInterval{20};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int read_end = -1;
    int write_end = -1;

    ~Pipe() {
        close_fd(read_end);
        close_fd(write_end);
    }

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    int release_read() {
        int fd = read_end;
        read_end = -1;
        return fd;
    }
};

class PosixProcess : public ProcessHandle,
                     public std::enable_shared_from_this<PosixProcess> {
public:
    PosixProcess(asio::io_context& io_context, pid_t pid, int stdout_fd, int stderr_fd,
                 ProcessRequest request, ProcessCallbacks callbacks,
                 CompletionHandler on_complete, std::shared_ptr<spdlog::logger> logger)
        : strand_(asio::make_strand(io_context)),
          stdout_(strand_, stdout_fd),
          stderr_(strand_, stderr_fd),
          timeout_timer_(strand_),
          reap_timer_(strand_),
          pid_(pid),
          request_(std::move(request)),
          callbacks_(std::move(callbacks)),
          on_complete_(std::move(on_complete)),
          logger_(std::move(logger)) {}

    int pid() const noexcept override { return static_cast<int>(pid_); }

    void terminate() override {
        terminate_requested_ = true;
        send_signal(SIGTERM);
    }

    void kill() override {
        terminate_requested_ = true;
        send_signal(SIGKILL);
    }

    bool terminate_requested() const noexcept override { return terminate_requested_; }

    void start() {
        auto self = shared_from_this();
        asio::dispatch(strand_, [this, self]() {
            if (request_.timeout) {
                timeout_timer_.expires_after(*request_.timeout);
                timeout_timer_.async_wait([this, self](boost::system::error_code ec) {
                    if (!ec) {
                        on_timeout();
                    }
                });
            }
            read_from(stdout_, stdout_buffer_, true);
            read_from(stderr_, stderr_buffer_, false);
        });
    }

private:
    using Buffer = std::array<char, kReadBufferSize>;

    void send_signal(int sig) {
        std::lock_guard lock(state_mutex_);
        if (!reaped_) {
            ::kill(pid_, sig);
        }
    }

    void on_timeout() {
        logger_->warn("{} (pid {}) timed out, killing", request_.program, pid_);
        timed_out_ = true;
        send_signal(SIGKILL);
    }

    void read_from(asio::posix::stream_descriptor& stream, Buffer& buffer, bool is_stdout) {
        auto self = shared_from_this();
        stream.async_read_some(
            asio::buffer(buffer),
            [this, self, &stream, &buffer, is_stdout](boost::system::error_code ec, std::size_t n) {
                if (!ec) {
                    std::string_view chunk(buffer.data(), n);
                    capture(is_stdout ? stdout_text_ : stderr_text_, chunk);
                    const auto& callback = is_stdout ? callbacks_.on_stdout : callbacks_.on_stderr;
                    if (callback) {
                        callback(chunk);
                    }
                    read_from(stream, buffer, is_stdout);
                    return;
                }

                if (ec != asio::error::eof) {
                    logger_->debug("{} (pid {}) pipe read ended: {}", request_.program, pid_, ec.message());
                }
                boost::system::error_code ignored;
                stream.close(ignored);
                if (--open_streams_ == 0) {
                    reap();
                }
            });
    }

    static void capture(std::string& sink, std::string_view chunk) {
        if (sink.size() >= kMaxCapturedOutput) {
            return;
        }
        sink.append(chunk.substr(0, kMaxCapturedOutput - sink.size()));
    }

    void reap() {
        int status = 0;
        pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == 0) {
            auto self = shared_from_this();
            reap_timer_.expires_after(kReapPollInterval);
            reap_timer_.async_wait([this, self](boost::system::error_code ec) {
                if (!ec) {
                    reap();
                }
            });
            return;
        }
        if (rc < 0 && errno == EINTR) {
            reap();
            return;
        }

        {
            std::lock_guard lock(state_mutex_);
            reaped_ = true;
        }
        timeout_timer_.cancel();

        if (rc < 0) {
            finish(Err<ProcessResult>(ErrorCode::ProcessFailed,
                request_.program + ": waitpid failed: " + std::strerror(errno)));
            return;
        }

        int exit_code = -1;
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code = 128 + WTERMSIG(status);
        }
        logger_->debug("{} (pid {}) exited with code {}", request_.program, pid_, exit_code);

        if (timed_out_) {
            finish(Err<ProcessResult>(ErrorCode::Timeout, request_.program + ": timeout"));
        } else if (terminate_requested_) {
            finish(Err<ProcessResult>(ErrorCode::Cancelled, request_.program + " was terminated"));
        } else if (request_.allowed_exit_codes.count(exit_code) == 0) {
            finish(Err<ProcessResult>(ErrorCode::ProcessFailed,
                describe_exit(request_.program, exit_code, stdout_text_, stderr_text_)));
        } else {
            ProcessResult result;
            result.exit_code = exit_code;
            result.stdout_text = std::move(stdout_text_);
            result.stderr_text = std::move(stderr_text_);
            finish(Ok(std::move(result)));
        }
    }

    void finish(Result<ProcessResult> outcome) {
        auto handler = std::move(on_complete_);
        on_complete_ = nullptr;
        // Drop user callbacks so captured state does not keep this object alive
        callbacks_ = ProcessCallbacks{};
        if (handler) {
            handler(std::move(outcome));
        }
    }

    asio::strand<asio::io_context::executor_type> strand_;
    asio::posix::stream_descriptor stdout_;
    asio::posix::stream_descriptor stderr_;
    asio::steady_timer timeout_timer_;
    asio::steady_timer reap_timer_;
    Buffer stdout_buffer_{};
    Buffer stderr_buffer_{};
    int open_streams_ = 2;

    pid_t pid_;
    ProcessRequest request_;
    ProcessCallbacks callbacks_;
    CompletionHandler on_complete_;
    std::shared_ptr<spdlog::logger> logger_;

    std::string stdout_text_;
    std::string stderr_text_;

    std::mutex state_mutex_;
    bool reaped_ = false;
    std::atomic<bool> terminate_requested_{false};
    std::atomic<bool> timed_out_{false};
};

} // namespace

PosixProcessLauncher::PosixProcessLauncher(asio::io_context& io_context,
                                           std::shared_ptr<spdlog::logger> logger)
    : io_context_(io_context),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void PosixProcessLauncher::launch(ProcessRequest request,
                                  ProcessCallbacks callbacks,
                                  CompletionHandler on_complete) {
    auto fail = [this, &on_complete](const std::string& message) {
        logger_->error("{}", message);
        asio::post(io_context_, [handler = std::move(on_complete), message]() {
            handler(Err<ProcessResult>(ErrorCode::SpawnFailed, message));
        });
    };

    if (request.program.empty()) {
        fail("Failed to start process: empty program name");
        return;
    }

    // argv must be fully built before fork(); the child may not allocate
    std::vector<std::string> storage;
    storage.reserve(request.args.size() + 1);
    storage.push_back(request.program);
    storage.insert(storage.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
        fail("Failed to start " + request.program + ": pipe: " + std::strerror(errno));
        return;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        fail("Failed to start " + request.program + ": fork: " + std::strerror(errno));
        return;
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe.write_end, STDOUT_FILENO);
        ::dup2(err_pipe.write_end, STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe.write_end);
    close_fd(err_pipe.write_end);
    close_fd(exec_pipe.write_end);

    // Reads 0 bytes once exec succeeds and the close-on-exec pipe closes
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        fail("Failed to start " + request.program + ": " + std::strerror(exec_errno));
        return;
    }

    logger_->debug("Spawned {} (pid {})", request.program, pid);

    auto spawn_callback = callbacks.on_spawn;
    auto process = std::make_shared<PosixProcess>(
        io_context_, pid, out_pipe.release_read(), err_pipe.release_read(),
        std::move(request), std::move(callbacks), std::move(on_complete), logger_);

    if (spawn_callback) {
        spawn_callback(process);
    }
    process->start();
}

} // namespace cloudsync::process
