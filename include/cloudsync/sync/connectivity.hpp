#pragma once

/**
 * @file connectivity.hpp
 * @brief Online/offline tracking by periodic DNS resolution
 *
 * The monitor starts out online. A probe resolves a well-known host; the
 * transition handler fires only when the state flips, never on a
 * repeated result.
 */

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace cloudsync::sync {

namespace asio = boost::asio;

class ConnectivityMonitor {
public:
    using TransitionHandler = std::function<void(bool online)>;

    ConnectivityMonitor(asio::io_context& io_context,
                        std::string host,
                        std::chrono::milliseconds interval,
                        TransitionHandler on_transition,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Probe immediately, then every interval
    void start();
    void stop();

    bool online() const noexcept { return online_; }

    /**
     * @brief Apply a probe result
     *
     * @return true if the state changed
     */
    bool report(bool reachable);

private:
    void probe();
    void arm();

    asio::strand<asio::io_context::executor_type> strand_;
    asio::ip::tcp::resolver resolver_;
    asio::steady_timer timer_;
    std::string host_;
    std::chrono::milliseconds interval_;
    TransitionHandler on_transition_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<bool> online_{true};
    bool stopped_ = true;
};

} // namespace cloudsync::sync
